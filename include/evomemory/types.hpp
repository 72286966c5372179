#pragma once
// Core types: the records of episodic memory
//
// A Neuron is one input/output exchange. A Rule is a heuristic mined from
// many neurons. Skills group neurons; meta-neurons are reserved for
// compressing similar neurons later.

#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

// POSIX headers for atomic file persistence (must be outside namespace)
#include <unistd.h>
#include <fcntl.h>
#include <sys/stat.h>

namespace evomemory {

// Timestamp as Unix millis
using Timestamp = int64_t;

// Neuron ids are SQLite rowids: assigned on save, never reused
using NeuronId = int64_t;

constexpr Timestamp MS_PER_DAY = 86400000;

// Current time as Timestamp
inline Timestamp now() {
    auto duration = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration_cast<std::chrono::milliseconds>(duration).count();
}

// Local time, ISO 8601 with milliseconds: 2026-10-19T14:03:22.517
inline std::string format_timestamp(Timestamp ts) {
    std::time_t secs = static_cast<std::time_t>(ts / 1000);
    std::tm tm_buf{};
    localtime_r(&secs, &tm_buf);

    char date[32];
    std::strftime(date, sizeof(date), "%Y-%m-%dT%H:%M:%S", &tm_buf);

    char out[48];
    std::snprintf(out, sizeof(out), "%s.%03d", date, static_cast<int>(ts % 1000));
    return out;
}

// ═══════════════════════════════════════════════════════════════════════════
// Errors
// ═══════════════════════════════════════════════════════════════════════════

// I/O or connection failure. Fatal to the triggering call, never retried.
class StorageError : public std::runtime_error {
public:
    explicit StorageError(const std::string& what) : std::runtime_error(what) {}
};

// Caller supplied a value outside its domain. Raised before any write.
class ValidationError : public std::invalid_argument {
public:
    explicit ValidationError(const std::string& what) : std::invalid_argument(what) {}
};

// ═══════════════════════════════════════════════════════════════════════════
// Mood
// ═══════════════════════════════════════════════════════════════════════════

enum class Mood : uint8_t {
    Positive = 0,
    Neutral = 1,
    Negative = 2,
};

inline const char* mood_name(Mood mood) {
    switch (mood) {
        case Mood::Positive: return "positive";
        case Mood::Negative: return "negative";
        case Mood::Neutral:  return "neutral";
    }
    return "neutral";
}

// Unknown strings read back as neutral
inline Mood mood_from_name(const std::string& name) {
    if (name == "positive") return Mood::Positive;
    if (name == "negative") return Mood::Negative;
    return Mood::Neutral;
}

// Mood is never set directly: it follows user feedback
inline Mood mood_from_feedback(int feedback) {
    if (feedback > 0) return Mood::Positive;
    if (feedback < 0) return Mood::Negative;
    return Mood::Neutral;
}

// ═══════════════════════════════════════════════════════════════════════════
// Records
// ═══════════════════════════════════════════════════════════════════════════

struct Neuron {
    NeuronId id = 0;                  // 0 until saved
    std::string input_text;
    std::string output_text;
    std::optional<std::string> idea;
    Mood mood = Mood::Neutral;
    float confidence = 0.5f;          // [0, 1]
    int user_feedback = 0;            // -1, 0, +1
    std::string context_hash;         // Computed by the store from input_text
    std::optional<std::string> skill_id;
    Timestamp timestamp = 0;          // 0 = stamped on save
    Timestamp last_accessed = 0;
    int64_t access_count = 0;

    Neuron() = default;

    Neuron(std::string input, std::string output, float conf = 0.5f)
        : input_text(std::move(input))
        , output_text(std::move(output))
        , confidence(conf) {}
};

struct Rule {
    int64_t id = 0;
    std::string rule_text;            // Natural key for de-duplication
    std::string trigger_pattern;
    float confidence_threshold = 0.5f;
    int priority = 1;                 // Higher = more specific/urgent
    bool enabled = true;
    Timestamp created_at = 0;
    int64_t applied_count = 0;        // Reserved

    Rule() = default;

    Rule(std::string text, std::string trigger, float threshold, int prio)
        : rule_text(std::move(text))
        , trigger_pattern(std::move(trigger))
        , confidence_threshold(threshold)
        , priority(prio) {}
};

// Aggregates are computed from neurons on read, not maintained as counters
struct Skill {
    std::string id;
    std::string name;
    std::string description;
    int64_t neuron_count = 0;
    float avg_confidence = 0.5f;
    bool enabled = true;
    Timestamp created_at = 0;
};

// Reserved for compressing similar neurons into a template.
// The table exists; nothing writes it yet.
struct MetaNeuron {
    int64_t id = 0;
    std::string pattern;
    std::string template_text;
    int64_t occurrences = 1;
    float avg_confidence = 0.5f;
    std::optional<std::string> skill_id;
    Timestamp created_at = 0;
    Timestamp updated_at = 0;
};

// Snapshot of store-wide counters
struct StoreStats {
    int64_t neurons = 0;
    int64_t meta_neurons = 0;
    int64_t rules = 0;            // Enabled only
    int64_t skills = 0;           // Enabled registered skills
    float avg_confidence = 0.0f;  // Over the last 7 days
};

// ═══════════════════════════════════════════════════════════════════════════
// Atomic file persistence
// ═══════════════════════════════════════════════════════════════════════════

// fsync parent directory to make a rename durable
inline void fsync_dir(const std::string& path) {
    std::string dir = path;
    auto slash = dir.find_last_of('/');
    dir = (slash == std::string::npos) ? "." : dir.substr(0, slash);
    if (dir.empty()) dir = "/";

    int fd = ::open(dir.c_str(), O_RDONLY);
    if (fd >= 0) {
        ::fsync(fd);
        ::close(fd);
    }
}

// Write to temp → fsync → rename. Readers never see a half-written file.
// Temp names are unique per call, so concurrent writers of one path never
// share a temp file; the last rename wins.
inline bool safe_save(const std::string& path, const std::string& contents) {
    static std::atomic<uint64_t> sequence{0};
    std::string tmp = path + ".tmp." + std::to_string(::getpid()) + "." +
                      std::to_string(sequence.fetch_add(1));
    FILE* f = ::fopen(tmp.c_str(), "wb");
    if (!f) return false;

    bool ok = std::fwrite(contents.data(), 1, contents.size(), f) == contents.size()
              && ::fflush(f) == 0 && ::fsync(::fileno(f)) == 0;

    ::fclose(f);
    if (!ok) { ::remove(tmp.c_str()); return false; }

    if (::rename(tmp.c_str(), path.c_str()) != 0) {
        ::remove(tmp.c_str());
        return false;
    }

    fsync_dir(path);
    return true;
}

} // namespace evomemory
