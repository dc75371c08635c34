/// @file audit_sink.cpp
/// @brief LoggingAuditSink implementation.

#include "cas/service/audit_sink.hpp"

#include "cas/foundation/service_logger.hpp"

namespace cas::service {

using cas::foundation::LogCategory;
using cas::foundation::LogContext;
using cas::foundation::LogLevel;
using cas::foundation::ServiceLogger;

ServiceResult<void> LoggingAuditSink::publish(const AuditEvent& event) {
    LogContext ctx;
    if (event.principalId.isValid()) {
        ctx.principalId = event.principalId;
    }
    ctx.sessionId = event.sessionId;
    if (!event.ipAddress.empty()) {
        ctx.clientIp = event.ipAddress;
    }
    ctx.extra = event.details;
    if (!event.countryCode.empty()) {
        ctx.extra["country"] = event.countryCode;
    }
    if (!event.userAgent.empty()) {
        ctx.extra["user_agent"] = event.userAgent;
    }
    if (!event.reason.empty()) {
        ctx.extra["reason"] = event.reason;
    }

    ServiceLogger::instance().logWithContext(LogLevel::Info, LogCategory::Audit,
                                             "audit " + event.type, ctx);
    return ServiceResult<void>::ok();
}

}  // namespace cas::service
