#pragma once
// Core types: time, identifiers, hashes, bounded history
//
// Everything the daemon remembers about itself is timestamped,
// bounded, and cheap to verify.

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

// POSIX headers for atomic file persistence (must be outside namespace)
#include <unistd.h>
#include <fcntl.h>
#include <sys/stat.h>

namespace anima {

// Timestamp as Unix millis
using Timestamp = int64_t;

// Current wall-clock time as Timestamp
inline Timestamp now() {
    auto duration = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration_cast<std::chrono::milliseconds>(duration).count();
}

// 2026-10-18T02:25:31.042Z
inline std::string format_iso8601(Timestamp ts) {
    std::time_t secs = static_cast<std::time_t>(ts / 1000);
    int millis = static_cast<int>(ts % 1000);
    if (millis < 0) {
        millis += 1000;
        secs -= 1;
    }
    std::tm tm_utc{};
    gmtime_r(&secs, &tm_utc);

    char buf[40];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm_utc);
    char out[48];
    snprintf(out, sizeof(out), "%s.%03dZ", buf, millis);
    return out;
}

// Event identifier: "<prefix>_<millis>_<6 random base36 chars>"
inline std::string generate_id(const std::string& prefix, Timestamp ts) {
    static const char alphabet[] = "0123456789abcdefghijklmnopqrstuvwxyz";
    static std::random_device rd;
    static std::mt19937_64 gen(rd());
    std::uniform_int_distribution<int> dis(0, 35);

    std::string suffix(6, '0');
    for (auto& c : suffix) c = alphabet[dis(gen)];
    return prefix + "_" + std::to_string(ts) + "_" + suffix;
}

// ═══════════════════════════════════════════════════════════════════════════
// Hashes (non-cryptographic; they detect accidents, not adversaries)
// ═══════════════════════════════════════════════════════════════════════════

// CRC32 (IEEE, reflected)
inline uint32_t crc32(const uint8_t* data, size_t length) {
    uint32_t crc = 0xFFFFFFFF;
    for (size_t i = 0; i < length; ++i) {
        crc ^= data[i];
        for (int j = 0; j < 8; ++j) {
            crc = (crc >> 1) ^ (0xEDB88320 & -(crc & 1));
        }
    }
    return ~crc;
}

inline uint32_t crc32(const std::string& s) {
    return crc32(reinterpret_cast<const uint8_t*>(s.data()), s.size());
}

// FNV-1a 64-bit
constexpr uint64_t FNV1A_OFFSET_BASIS = 14695981039346656037ULL;
constexpr uint64_t FNV1A_PRIME = 1099511628211ULL;

inline uint64_t fnv1a_64(const std::string& s) {
    uint64_t hash = FNV1A_OFFSET_BASIS;
    for (char c : s) {
        hash ^= static_cast<uint64_t>(static_cast<unsigned char>(c));
        hash *= FNV1A_PRIME;
    }
    return hash;
}

// djb2 hash - deterministic across platforms (unlike std::hash)
inline uint32_t djb2_hash(const std::string& str) {
    uint32_t hash = 5381;
    for (char c : str) {
        hash = ((hash << 5) + hash) + static_cast<unsigned char>(c);
    }
    return hash;
}

inline std::string to_hex(uint64_t value, int width) {
    char buf[17];
    snprintf(buf, sizeof(buf), "%0*llx", width, static_cast<unsigned long long>(value));
    return buf;
}

// ═══════════════════════════════════════════════════════════════════════════
// RingBuffer: fixed-capacity history, oldest evicted first
// ═══════════════════════════════════════════════════════════════════════════

template <typename T>
class RingBuffer {
public:
    explicit RingBuffer(size_t capacity) : capacity_(capacity) {
        if (capacity_ == 0) {
            throw std::invalid_argument("RingBuffer capacity must be positive");
        }
        slots_.reserve(capacity_);
    }

    void push(T value) {
        if (slots_.size() < capacity_) {
            slots_.push_back(std::move(value));
            return;
        }
        slots_[head_] = std::move(value);
        head_ = (head_ + 1) % capacity_;
    }

    size_t size() const { return slots_.size(); }
    size_t capacity() const { return capacity_; }
    bool empty() const { return slots_.empty(); }

    // 0 = oldest retained entry
    const T& operator[](size_t i) const {
        return slots_[(head_ + i) % slots_.size()];
    }

    const T& back() const { return (*this)[slots_.size() - 1]; }

    // Newest `n` entries, oldest first
    std::vector<T> last(size_t n) const {
        n = std::min(n, slots_.size());
        std::vector<T> out;
        out.reserve(n);
        for (size_t i = slots_.size() - n; i < slots_.size(); ++i) {
            out.push_back((*this)[i]);
        }
        return out;
    }

    std::vector<T> to_vector() const { return last(slots_.size()); }

    void clear() {
        slots_.clear();
        head_ = 0;
    }

private:
    size_t capacity_;
    size_t head_ = 0;  // index of oldest once full
    std::vector<T> slots_;
};

// ═══════════════════════════════════════════════════════════════════════════
// Atomic file persistence: write temp → fsync → rename → fsync dir
// ═══════════════════════════════════════════════════════════════════════════

// Fsync parent directory for durability
inline bool fsync_dir(const std::string& path) {
    auto slash = path.find_last_of('/');
    std::string dir = (slash == std::string::npos) ? "." : path.substr(0, slash);
    int dfd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY);
    if (dfd < 0) return false;
    int rc = ::fsync(dfd);
    ::close(dfd);
    return rc == 0;
}

// Atomic save: write to temp file, fsync, rename to final path
// Writer function takes FILE* and returns true on success
template <typename Writer>
bool safe_save(const std::string& path, Writer&& write_fn) {
    std::string tmp = path + ".tmp." + std::to_string(::getpid());
    FILE* f = ::fopen(tmp.c_str(), "wb");
    if (!f) return false;

    bool ok = write_fn(f);
    if (ok && ::fflush(f) == 0 && ::fsync(::fileno(f)) == 0) {
        ok = true;
    } else {
        ok = false;
    }

    ::fclose(f);
    if (!ok) { ::remove(tmp.c_str()); return false; }

    if (::rename(tmp.c_str(), path.c_str()) != 0) {
        ::remove(tmp.c_str());
        return false;
    }

    fsync_dir(path);
    return true;
}

// Create every missing directory on the way to `path`'s parent
inline bool ensure_parent_dir(const std::string& path) {
    auto slash = path.find_last_of('/');
    if (slash == std::string::npos || slash == 0) return true;

    std::string dir = path.substr(0, slash);
    for (size_t pos = 1; pos <= dir.size(); ++pos) {
        if (pos != dir.size() && dir[pos] != '/') continue;
        std::string prefix = dir.substr(0, pos);
        if (::mkdir(prefix.c_str(), 0755) != 0 && errno != EEXIST) {
            return false;
        }
    }
    return true;
}

} // namespace anima
