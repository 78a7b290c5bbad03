#include <anima/soul.hpp>
#include <anima/log.hpp>
#include <fstream>
#include <sys/stat.h>

namespace anima {

namespace {

std::vector<std::string> string_list(const json& section, const char* key) {
    std::vector<std::string> out;
    auto it = section.find(key);
    if (it == section.end()) return out;
    if (!it->is_array()) {
        throw SoulFileError(std::string("\"") + key + "\" must be an array");
    }
    for (const auto& item : *it) {
        if (item.is_string()) out.push_back(item.get<std::string>());
    }
    return out;
}

json section_of(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return json::object();
    if (!it->is_object()) {
        throw SoulFileError(std::string("\"") + key + "\" must be an object");
    }
    return *it;
}

} // namespace

SoulData parse_soul(const json& j) {
    if (!j.is_object()) throw SoulFileError("soul file root must be an object");

    SoulData data;
    data.identity = section_of(j, "identity");
    data.evolution = section_of(j, "evolution");

    json memory = section_of(j, "memory");
    data.core_identity = string_list(memory, "core_identity");
    data.active_lessons = string_list(memory, "active_lessons");
    data.total_processed = memory.value("total_processed", static_cast<int64_t>(0));
    return data;
}

SoulData load_soul_file(const std::string& path) {
    struct stat st;
    if (path.empty() || stat(path.c_str(), &st) != 0) {
        log_info("soul", "No soul file at %s - empty identity, evolution and memory",
                 path.empty() ? "(unset)" : path.c_str());
        return SoulData{};
    }

    std::ifstream in(path);
    if (!in) throw SoulFileError("cannot open " + path);

    try {
        return parse_soul(json::parse(in));
    } catch (const json::exception& e) {
        throw SoulFileError(path + ": " + e.what());
    }
}

void Soul::replace(SoulData data) {
    std::lock_guard<std::mutex> lock(mutex_);
    data_ = std::move(data);
}

SoulData Soul::data() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return data_;
}

json SoulIdentity::export_summary() const {
    SoulData d = soul_.data();
    return {
        {"origin", d.identity.value("origin", "")},
        {"purpose", d.identity.value("purpose", "")},
        {"non_negotiables", d.identity.value("non_negotiables", json::array())},
        {"boundaries", d.identity.value("boundaries", json::array())},
        {"current_version", d.identity.value("current_version", "")}
    };
}

int SoulIdentity::integrity_score() const {
    return soul_.data().identity.value("integrity_score", 100);
}

json SoulEvolution::export_summary() const {
    SoulData d = soul_.data();
    return {
        {"version", d.evolution.value("version", "v0.0")},
        {"evolution_count", d.evolution.value("evolution_count", static_cast<int64_t>(0))},
        {"mode", d.evolution.value("mode", "stable")},
        {"capabilities", d.evolution.value("capabilities", json::array())}
    };
}

size_t SoulEvolution::evolution_log_size() const {
    SoulData d = soul_.data();
    auto it = d.evolution.find("log");
    return it != d.evolution.end() && it->is_array() ? it->size() : 0;
}

json SoulMemory::export_summary() const {
    SoulData d = soul_.data();
    return {
        {"core_identity_count", d.core_identity.size()},
        {"active_lessons_count", d.active_lessons.size()},
        {"total_processed", d.total_processed}
    };
}

std::vector<std::string> SoulMemory::core_identity() const {
    return soul_.data().core_identity;
}

std::vector<std::string> SoulMemory::active_lessons() const {
    return soul_.data().active_lessons;
}

} // namespace anima
