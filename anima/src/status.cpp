#include <anima/status.hpp>
#include <anima/version.hpp>

namespace anima {

std::string health_verdict(const Daemon& daemon, const ContinuityEngine& continuity) {
    if (daemon.enabled() && !daemon.is_healthy()) return "stalled";

    ContinuityStatus cs = continuity.status();
    if (cs == ContinuityStatus::Broken) return "broken";

    auto last = daemon.last_heartbeat();
    bool failing = last && last->consecutive_failures > 0;
    if (cs == ContinuityStatus::Degraded || failing) return "degraded";

    return "ok";
}

json build_health_report(const Daemon& daemon, const ContinuityEngine& continuity) {
    return json{
        {"status", health_verdict(daemon, continuity)},
        {"version", ANIMA_VERSION},
        {"daemon", daemon.export_status()},
        {"continuity", continuity.export_status()}
    };
}

} // namespace anima
