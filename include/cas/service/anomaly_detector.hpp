#pragma once

/// @file anomaly_detector.hpp
/// @brief Heuristics flagging suspicious session patterns for a principal.

#include "cas/service/auth_types.hpp"
#include "cas/service/session.hpp"

#include <string_view>
#include <vector>

namespace cas::service {

/// Kind of suspicious pattern. Signals are independent of each other.
enum class AnomalyKind : uint8_t {
    HighSessionCount,
    MultipleLocations,
    RapidSessionCreation,
    MultipleUserAgents
};

/// One raised signal with the observed value that crossed the threshold.
struct AnomalySignal {
    AnomalyKind kind;
    std::size_t observed = 0;
    std::size_t threshold = 0;

    bool operator==(const AnomalySignal&) const = default;
};

/// Human-readable label ("high session count", ...).
[[nodiscard]] std::string_view anomalyKindName(AnomalyKind kind);

/// Evaluate a snapshot of sessions against @p thresholds.
///
/// Pure and deterministic for a given snapshot and @p now. Empty IPs, the
/// "unknown" IP and empty user agents are not counted as distinct values.
[[nodiscard]] std::vector<AnomalySignal> detectAnomalies(
    const std::vector<Session>& sessions, const AnomalyThresholds& thresholds,
    TimePoint now = Clock::now());

}  // namespace cas::service
