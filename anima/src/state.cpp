#include <anima/state.hpp>

namespace anima {

void to_json(json& j, const AgentState& s) {
    j = json{
        {"cycle_count", s.cycle_count},
        {"confidence", s.confidence},
        {"doubts", s.doubts},
        {"energy_level", s.energy_level},
        {"mode", s.mode},
        {"current_focus", s.current_focus ? json(*s.current_focus) : json(nullptr)}
    };
}

void from_json(const json& j, AgentState& s) {
    j.at("cycle_count").get_to(s.cycle_count);
    j.at("confidence").get_to(s.confidence);
    j.at("doubts").get_to(s.doubts);
    j.at("energy_level").get_to(s.energy_level);
    j.at("mode").get_to(s.mode);

    auto focus = j.find("current_focus");
    if (focus != j.end() && !focus->is_null()) {
        s.current_focus = focus->get<std::string>();
    } else {
        s.current_focus.reset();
    }
}

void to_json(json& j, const RealityMetricsSummary& r) {
    j = json{
        {"stability", r.stability},
        {"evolution", r.evolution},
        {"autonomy", r.autonomy},
        {"consecutive_mismatches", r.consecutive_mismatches}
    };
}

void from_json(const json& j, RealityMetricsSummary& r) {
    r.stability = j.value("stability", 0);
    r.evolution = j.value("evolution", 0);
    r.autonomy = j.value("autonomy", 0);
    r.consecutive_mismatches = j.value("consecutive_mismatches", 0);
}

void to_json(json& j, const Fingerprint& f) {
    j = json{
        {"hash", f.hash},
        {"timestamp", f.timestamp},
        {"version", f.version},
        {"source", f.source}
    };
}

void from_json(const json& j, Fingerprint& f) {
    j.at("hash").get_to(f.hash);
    j.at("timestamp").get_to(f.timestamp);
    j.at("version").get_to(f.version);
    j.at("source").get_to(f.source);
}

void to_json(json& j, const ContinuityRecord& r) {
    j = json{
        {"identity_fingerprint", r.identity},
        {"evolution_fingerprint", r.evolution},
        {"memory_fingerprint", r.memory},
        {"last_verified", r.last_verified},
        {"status", r.status}
    };
}

void from_json(const json& j, ContinuityRecord& r) {
    j.at("identity_fingerprint").get_to(r.identity);
    j.at("evolution_fingerprint").get_to(r.evolution);
    j.at("memory_fingerprint").get_to(r.memory);
    j.at("last_verified").get_to(r.last_verified);
    j.at("status").get_to(r.status);
}

} // namespace anima
