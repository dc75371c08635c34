#pragma once

/// @file audit_sink.hpp
/// @brief Audit event sink and its logging implementation.

#include "cas/foundation/service_result.hpp"
#include "cas/service/auth_types.hpp"

#include <map>
#include <optional>
#include <string>

namespace cas::service {

using cas::foundation::ServiceResult;

/// Security-relevant event. Carries token hashes at most, never raw tokens.
struct AuditEvent {
    std::string type;  ///< e.g. "login.success", "session.invalidated"
    PrincipalId principalId;
    std::optional<SessionId> sessionId;
    std::string ipAddress;
    std::string userAgent;
    std::string countryCode;
    std::string reason;
    TimePoint occurredAt{};
    std::map<std::string, std::string> details;
};

/// Destination of audit events. Publishing is fire-and-forget for callers.
class IAuditSink {
public:
    virtual ~IAuditSink() = default;

    virtual ServiceResult<void> publish(const AuditEvent& event) = 0;
};

/// Writes audit events to the Audit log category.
class LoggingAuditSink : public IAuditSink {
public:
    ServiceResult<void> publish(const AuditEvent& event) override;
};

}  // namespace cas::service
