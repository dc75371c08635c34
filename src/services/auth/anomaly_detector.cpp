/// @file anomaly_detector.cpp
/// @brief Session anomaly heuristics.

#include "cas/service/anomaly_detector.hpp"

#include <set>
#include <string>

namespace cas::service {

std::string_view anomalyKindName(AnomalyKind kind) {
    switch (kind) {
        case AnomalyKind::HighSessionCount:     return "high session count";
        case AnomalyKind::MultipleLocations:    return "multiple geographic locations";
        case AnomalyKind::RapidSessionCreation: return "rapid session creation";
        case AnomalyKind::MultipleUserAgents:   return "multiple user agents";
    }
    return "unknown";
}

std::vector<AnomalySignal> detectAnomalies(const std::vector<Session>& sessions,
                                           const AnomalyThresholds& thresholds,
                                           TimePoint now) {
    std::vector<AnomalySignal> signals;

    if (sessions.size() > thresholds.maxSessions) {
        signals.push_back({AnomalyKind::HighSessionCount, sessions.size(),
                           thresholds.maxSessions});
    }

    // IP diversity approximates geographic spread when no country is known.
    std::set<std::string> ips;
    std::set<std::string> agents;
    std::size_t recent = 0;
    auto windowStart = now - thresholds.recentWindow;

    for (const auto& session : sessions) {
        if (!session.ipAddress.empty() && session.ipAddress != "unknown") {
            ips.insert(session.ipAddress);
        }
        if (!session.userAgent.empty()) {
            agents.insert(session.userAgent);
        }
        if (session.createdAt > windowStart) {
            ++recent;
        }
    }

    if (ips.size() > thresholds.maxDistinctIps) {
        signals.push_back({AnomalyKind::MultipleLocations, ips.size(),
                           thresholds.maxDistinctIps});
    }
    if (recent > thresholds.maxRecentSessions) {
        signals.push_back({AnomalyKind::RapidSessionCreation, recent,
                           thresholds.maxRecentSessions});
    }
    if (agents.size() > thresholds.maxDistinctUserAgents) {
        signals.push_back({AnomalyKind::MultipleUserAgents, agents.size(),
                           thresholds.maxDistinctUserAgents});
    }

    return signals;
}

}  // namespace cas::service
