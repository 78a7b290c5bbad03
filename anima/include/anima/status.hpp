#pragma once
// Status: one health verdict from the daemon and the continuity engine
//
//   ok        daemon healthy, continuity OK
//   degraded  continuity DEGRADED, or the daemon has a failure streak
//   broken    continuity BROKEN
//   stalled   daemon unhealthy (no recent heartbeat, or threshold reached)
//
// "stalled" outranks "broken", which outranks "degraded".

#include <anima/continuity.hpp>
#include <anima/daemon.hpp>
#include <string>

namespace anima {

std::string health_verdict(const Daemon& daemon, const ContinuityEngine& continuity);

// {status, version, daemon: export_status(), continuity: export_status()}
json build_health_report(const Daemon& daemon, const ContinuityEngine& continuity);

} // namespace anima
