#pragma once
// Soul file: identity, evolution and memory summaries read from one JSON file
//
// {
//   "identity":  {"origin", "purpose", "non_negotiables": [], "boundaries": [],
//                 "current_version", "integrity_score"},
//   "evolution": {"version": "v0.N", "evolution_count", "mode",
//                 "capabilities": [], "log": []},
//   "memory":    {"core_identity": [], "active_lessons": [], "total_processed"}
// }
//
// Every section and key is optional. A missing file is an empty soul
// (first boot); a malformed one is an error.

#include <anima/collaborators.hpp>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

namespace anima {

class SoulFileError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct SoulData {
    json identity = json::object();
    json evolution = json::object();
    std::vector<std::string> core_identity;
    std::vector<std::string> active_lessons;
    int64_t total_processed = 0;
};

// Missing file → empty SoulData. Unreadable or malformed → SoulFileError.
SoulData load_soul_file(const std::string& path);

SoulData parse_soul(const json& j);

// Thread-safe holder the three sources read from; reload() swaps contents
class Soul {
public:
    explicit Soul(SoulData data = {}) : data_(std::move(data)) {}

    void replace(SoulData data);
    SoulData data() const;

private:
    mutable std::mutex mutex_;
    SoulData data_;
};

class SoulIdentity : public IdentitySource {
public:
    explicit SoulIdentity(const Soul& soul) : soul_(soul) {}
    json export_summary() const override;
    int integrity_score() const override;

private:
    const Soul& soul_;
};

class SoulEvolution : public EvolutionSource {
public:
    explicit SoulEvolution(const Soul& soul) : soul_(soul) {}
    json export_summary() const override;
    size_t evolution_log_size() const override;

private:
    const Soul& soul_;
};

class SoulMemory : public MemorySource {
public:
    explicit SoulMemory(const Soul& soul) : soul_(soul) {}
    json export_summary() const override;
    std::vector<std::string> core_identity() const override;
    std::vector<std::string> active_lessons() const override;

private:
    const Soul& soul_;
};

} // namespace anima
