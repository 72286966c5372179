#pragma once
// NeuronStore: durable storage for neurons, rules, skills and meta-neurons
//
// SQLite is the single source of truth. Every public operation takes the
// store mutex and runs as one statement (or one implicit transaction), so it
// is atomic at row granularity. There are no multi-call transactions: callers
// that need compound atomicity coordinate themselves.
//
// Layout:
//   neurons       one row per interaction, indexed by time, confidence,
//                 context_hash and skill_id
//   rules         mined heuristics, de-duplicated by rule_text
//   skills        registered skill metadata (aggregates computed on read)
//   meta_neurons  reserved, no writer yet

#include "types.hpp"
#include "text.hpp"
#include "version.hpp"
#include <sqlite3.h>
#include <cmath>
#include <filesystem>
#include <iostream>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace evomemory {

namespace detail {

// Prepared statement, finalized on scope exit
class Statement {
public:
    Statement(sqlite3* db, const char* sql) : db_(db) {
        if (sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr) != SQLITE_OK) {
            std::string msg = sqlite3_errmsg(db);
            sqlite3_finalize(stmt_);
            throw StorageError("prepare failed: " + msg);
        }
    }

    ~Statement() { sqlite3_finalize(stmt_); }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    void bind_int64(int idx, int64_t value) {
        check(sqlite3_bind_int64(stmt_, idx, value));
    }

    void bind_double(int idx, double value) {
        check(sqlite3_bind_double(stmt_, idx, value));
    }

    void bind_text(int idx, const std::string& value) {
        check(sqlite3_bind_text(stmt_, idx, value.c_str(),
                                static_cast<int>(value.size()), SQLITE_TRANSIENT));
    }

    void bind_text(int idx, const std::optional<std::string>& value) {
        if (value) {
            bind_text(idx, *value);
        } else {
            check(sqlite3_bind_null(stmt_, idx));
        }
    }

    // true while rows remain; throws on anything but ROW/DONE
    bool step() {
        int rc = sqlite3_step(stmt_);
        if (rc == SQLITE_ROW) return true;
        if (rc == SQLITE_DONE) return false;
        throw StorageError(std::string("step failed: ") + sqlite3_errmsg(db_));
    }

    int64_t column_int64(int col) const { return sqlite3_column_int64(stmt_, col); }
    double column_double(int col) const { return sqlite3_column_double(stmt_, col); }
    bool column_is_null(int col) const { return sqlite3_column_type(stmt_, col) == SQLITE_NULL; }

    std::string column_text(int col) const {
        const unsigned char* text = sqlite3_column_text(stmt_, col);
        if (!text) return {};
        return std::string(reinterpret_cast<const char*>(text),
                           static_cast<size_t>(sqlite3_column_bytes(stmt_, col)));
    }

    std::optional<std::string> column_optional_text(int col) const {
        if (column_is_null(col)) return std::nullopt;
        return column_text(col);
    }

private:
    void check(int rc) {
        if (rc != SQLITE_OK) {
            throw StorageError(std::string("bind failed: ") + sqlite3_errmsg(db_));
        }
    }

    sqlite3* db_;
    sqlite3_stmt* stmt_ = nullptr;
};

constexpr const char* SCHEMA_SQL = R"(
    CREATE TABLE IF NOT EXISTS neurons (
        id INTEGER PRIMARY KEY AUTOINCREMENT,
        input_text TEXT NOT NULL,
        idea TEXT,
        output_text TEXT NOT NULL,
        mood TEXT NOT NULL DEFAULT 'neutral',
        confidence REAL NOT NULL DEFAULT 0.5,
        user_feedback INTEGER NOT NULL DEFAULT 0,
        context_hash TEXT NOT NULL,
        skill_id TEXT,
        timestamp INTEGER NOT NULL,
        last_accessed INTEGER NOT NULL,
        access_count INTEGER NOT NULL DEFAULT 0
    );

    CREATE TABLE IF NOT EXISTS meta_neurons (
        id INTEGER PRIMARY KEY AUTOINCREMENT,
        pattern TEXT NOT NULL,
        template TEXT NOT NULL,
        occurrences INTEGER NOT NULL DEFAULT 1,
        avg_confidence REAL NOT NULL DEFAULT 0.5,
        skill_id TEXT,
        created_at INTEGER NOT NULL,
        updated_at INTEGER NOT NULL
    );

    CREATE TABLE IF NOT EXISTS rules (
        id INTEGER PRIMARY KEY AUTOINCREMENT,
        rule_text TEXT NOT NULL,
        trigger_pattern TEXT,
        confidence_threshold REAL NOT NULL DEFAULT 0.5,
        priority INTEGER NOT NULL DEFAULT 1,
        enabled INTEGER NOT NULL DEFAULT 1,
        created_at INTEGER NOT NULL,
        applied_count INTEGER NOT NULL DEFAULT 0
    );

    CREATE TABLE IF NOT EXISTS skills (
        id TEXT PRIMARY KEY,
        name TEXT NOT NULL,
        description TEXT,
        neuron_count INTEGER NOT NULL DEFAULT 0,
        avg_confidence REAL NOT NULL DEFAULT 0.5,
        enabled INTEGER NOT NULL DEFAULT 1,
        created_at INTEGER NOT NULL
    );

    CREATE INDEX IF NOT EXISTS idx_neurons_timestamp ON neurons(timestamp DESC);
    CREATE INDEX IF NOT EXISTS idx_neurons_confidence ON neurons(confidence DESC);
    CREATE INDEX IF NOT EXISTS idx_neurons_context ON neurons(context_hash);
    CREATE INDEX IF NOT EXISTS idx_neurons_skill ON neurons(skill_id);
    CREATE INDEX IF NOT EXISTS idx_rules_text ON rules(rule_text);
)";

constexpr const char* NEURON_COLUMNS =
    "id, input_text, idea, output_text, mood, confidence, user_feedback, "
    "context_hash, skill_id, timestamp, last_accessed, access_count";

inline Neuron read_neuron(const Statement& stmt) {
    Neuron n;
    n.id = stmt.column_int64(0);
    n.input_text = stmt.column_text(1);
    n.idea = stmt.column_optional_text(2);
    n.output_text = stmt.column_text(3);
    n.mood = mood_from_name(stmt.column_text(4));
    n.confidence = static_cast<float>(stmt.column_double(5));
    n.user_feedback = static_cast<int>(stmt.column_int64(6));
    n.context_hash = stmt.column_text(7);
    n.skill_id = stmt.column_optional_text(8);
    n.timestamp = stmt.column_int64(9);
    n.last_accessed = stmt.column_int64(10);
    n.access_count = stmt.column_int64(11);
    return n;
}

inline Rule read_rule(const Statement& stmt) {
    Rule r;
    r.id = stmt.column_int64(0);
    r.rule_text = stmt.column_text(1);
    r.trigger_pattern = stmt.column_text(2);
    r.confidence_threshold = static_cast<float>(stmt.column_double(3));
    r.priority = static_cast<int>(stmt.column_int64(4));
    r.enabled = stmt.column_int64(5) != 0;
    r.created_at = stmt.column_int64(6);
    r.applied_count = stmt.column_int64(7);
    return r;
}

// LIKE pattern matching `text` literally anywhere (escape char is '\')
inline std::string like_contains(const std::string& text) {
    std::string pattern = "%";
    for (char c : text) {
        if (c == '\\' || c == '%' || c == '_') pattern += '\\';
        pattern += c;
    }
    pattern += '%';
    return pattern;
}

} // namespace detail

inline void validate_confidence(float confidence, const char* what) {
    if (!std::isfinite(confidence) || confidence < 0.0f || confidence > 1.0f) {
        throw ValidationError(std::string(what) + " must be in [0, 1], got " +
                              std::to_string(confidence));
    }
}

inline void validate_feedback(int feedback) {
    if (feedback < -1 || feedback > 1) {
        throw ValidationError("feedback must be -1, 0 or 1, got " + std::to_string(feedback));
    }
}

class NeuronStore {
public:
    // ":memory:" gives a private in-memory database
    explicit NeuronStore(std::string path) : path_(std::move(path)) {}
    ~NeuronStore() { close(); }

    NeuronStore(const NeuronStore&) = delete;
    NeuronStore& operator=(const NeuronStore&) = delete;

    // ═══════════════════════════════════════════════════════════════════════
    // Lifecycle
    // ═══════════════════════════════════════════════════════════════════════

    // Open (creating if needed) and bring the schema up to date
    void open() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (db_) return;

        bool in_memory = path_ == ":memory:";
        if (!in_memory) {
            std::filesystem::path parent = std::filesystem::path(path_).parent_path();
            if (!parent.empty()) {
                std::error_code ec;
                std::filesystem::create_directories(parent, ec);
                if (ec) {
                    throw StorageError("cannot create " + parent.string() + ": " + ec.message());
                }
            }
        }

        sqlite3* db = nullptr;
        int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
        if (sqlite3_open_v2(path_.c_str(), &db, flags, nullptr) != SQLITE_OK) {
            std::string msg = db ? sqlite3_errmsg(db) : "out of memory";
            sqlite3_close(db);
            throw StorageError("cannot open " + path_ + ": " + msg);
        }
        db_ = db;

        try {
            sqlite3_busy_timeout(db_, 5000);
            if (!in_memory) exec("PRAGMA journal_mode = WAL");

            int stored = user_version();
            if (!version::schema_compatible(stored)) {
                throw StorageError("schema too new: " + path_ + " is v" + std::to_string(stored) +
                                   ", library supports v" +
                                   std::to_string(EVOMEMORY_SCHEMA_VERSION));
            }
            exec(detail::SCHEMA_SQL);
            if (stored < EVOMEMORY_SCHEMA_VERSION) {
                exec("PRAGMA user_version = " + std::to_string(EVOMEMORY_SCHEMA_VERSION));
            }
        } catch (...) {
            sqlite3_close(db_);
            db_ = nullptr;
            throw;
        }

        std::cerr << "[NeuronStore] Opened " << path_ << "\n";
    }

    void close() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
    }

    bool is_open() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return db_ != nullptr;
    }

    const std::string& path() const { return path_; }

    // ═══════════════════════════════════════════════════════════════════════
    // Neurons
    // ═══════════════════════════════════════════════════════════════════════

    // Persist a new neuron and return its id. Mood and context_hash are
    // derived here; id, access bookkeeping and a zero timestamp are assigned.
    NeuronId save(const Neuron& neuron) {
        validate_confidence(neuron.confidence, "confidence");
        validate_feedback(neuron.user_feedback);

        Timestamp ts = neuron.timestamp > 0 ? neuron.timestamp : now();
        std::string hash = context_hash(neuron.input_text);

        std::lock_guard<std::mutex> lock(mutex_);
        require_open();

        detail::Statement stmt(db_,
            "INSERT INTO neurons (input_text, idea, output_text, mood, confidence, "
            "user_feedback, context_hash, skill_id, timestamp, last_accessed, access_count) "
            "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, 0)");
        stmt.bind_text(1, neuron.input_text);
        stmt.bind_text(2, neuron.idea);
        stmt.bind_text(3, neuron.output_text);
        stmt.bind_text(4, std::string(mood_name(mood_from_feedback(neuron.user_feedback))));
        stmt.bind_double(5, neuron.confidence);
        stmt.bind_int64(6, neuron.user_feedback);
        stmt.bind_text(7, hash);
        stmt.bind_text(8, neuron.skill_id);
        stmt.bind_int64(9, ts);
        stmt.bind_int64(10, ts);
        stmt.step();

        return sqlite3_last_insert_rowid(db_);
    }

    std::optional<Neuron> get(NeuronId id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        require_open();

        std::string sql = std::string("SELECT ") + detail::NEURON_COLUMNS +
                          " FROM neurons WHERE id = ?";
        detail::Statement stmt(db_, sql.c_str());
        stmt.bind_int64(1, id);
        if (!stmt.step()) return std::nullopt;
        return detail::read_neuron(stmt);
    }

    // Newest first; ties on timestamp fall back to insertion order
    std::vector<Neuron> recent(size_t limit,
                               const std::optional<std::string>& skill = std::nullopt) const {
        std::lock_guard<std::mutex> lock(mutex_);
        require_open();

        std::string sql = std::string("SELECT ") + detail::NEURON_COLUMNS + " FROM neurons ";
        if (skill) sql += "WHERE skill_id = ? ";
        sql += "ORDER BY timestamp DESC, id DESC LIMIT ?";

        detail::Statement stmt(db_, sql.c_str());
        int idx = 1;
        if (skill) stmt.bind_text(idx++, *skill);
        stmt.bind_int64(idx, static_cast<int64_t>(limit));
        return collect(stmt);
    }

    // Same context bucket, most confident first, then newest
    std::vector<Neuron> similar(const std::string& hash, size_t limit = 5) const {
        std::lock_guard<std::mutex> lock(mutex_);
        require_open();

        std::string sql = std::string("SELECT ") + detail::NEURON_COLUMNS +
                          " FROM neurons WHERE context_hash = ? "
                          "ORDER BY confidence DESC, timestamp DESC, id DESC LIMIT ?";
        detail::Statement stmt(db_, sql.c_str());
        stmt.bind_text(1, hash);
        stmt.bind_int64(2, static_cast<int64_t>(limit));
        return collect(stmt);
    }

    // Case-insensitive substring filter over input or output text.
    // Not ranked: ordering is confidence, then recency.
    std::vector<Neuron> search(const std::string& text, size_t limit = 10) const {
        std::lock_guard<std::mutex> lock(mutex_);
        require_open();

        std::string sql = std::string("SELECT ") + detail::NEURON_COLUMNS +
                          " FROM neurons "
                          "WHERE input_text LIKE ?1 ESCAPE '\\' OR output_text LIKE ?1 ESCAPE '\\' "
                          "ORDER BY confidence DESC, timestamp DESC, id DESC LIMIT ?2";
        detail::Statement stmt(db_, sql.c_str());
        stmt.bind_text(1, detail::like_contains(text));
        stmt.bind_int64(2, static_cast<int64_t>(limit));
        return collect(stmt);
    }

    // Returns false if the id does not exist
    bool update_feedback(NeuronId id, int feedback) {
        validate_feedback(feedback);

        std::lock_guard<std::mutex> lock(mutex_);
        require_open();

        detail::Statement stmt(db_,
            "UPDATE neurons SET user_feedback = ?, mood = ?, last_accessed = ? WHERE id = ?");
        stmt.bind_int64(1, feedback);
        stmt.bind_text(2, std::string(mood_name(mood_from_feedback(feedback))));
        stmt.bind_int64(3, now());
        stmt.bind_int64(4, id);
        stmt.step();
        return sqlite3_changes(db_) > 0;
    }

    // Access bookkeeping for neurons that were surfaced to a caller.
    // Returns how many ids existed.
    size_t record_access(const std::vector<NeuronId>& ids) {
        if (ids.empty()) return 0;

        std::lock_guard<std::mutex> lock(mutex_);
        require_open();

        Timestamp ts = now();
        size_t touched = 0;
        for (NeuronId id : ids) {
            detail::Statement stmt(db_,
                "UPDATE neurons SET access_count = access_count + 1, last_accessed = ? "
                "WHERE id = ?");
            stmt.bind_int64(1, ts);
            stmt.bind_int64(2, id);
            stmt.step();
            touched += static_cast<size_t>(sqlite3_changes(db_));
        }
        return touched;
    }

    // Delete neurons older than keep_days AND below min_confidence AND
    // without positive feedback. Returns the number deleted.
    int64_t prune(int keep_days = 30, float min_confidence = 0.3f) {
        if (keep_days < 0) {
            throw ValidationError("keep_days must be >= 0, got " + std::to_string(keep_days));
        }
        validate_confidence(min_confidence, "min_confidence");

        std::lock_guard<std::mutex> lock(mutex_);
        require_open();

        Timestamp cutoff = now() - static_cast<Timestamp>(keep_days) * MS_PER_DAY;
        detail::Statement stmt(db_,
            "DELETE FROM neurons WHERE timestamp < ? AND confidence < ? AND user_feedback <= 0");
        stmt.bind_int64(1, cutoff);
        stmt.bind_double(2, min_confidence);
        stmt.step();

        int64_t deleted = sqlite3_changes(db_);
        if (deleted > 0) {
            std::cerr << "[NeuronStore] Pruned " << deleted << " neurons\n";
        }
        return deleted;
    }

    int64_t count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        require_open();
        return scalar_int("SELECT COUNT(*) FROM neurons");
    }

    StoreStats stats() const {
        std::lock_guard<std::mutex> lock(mutex_);
        require_open();

        StoreStats s;
        s.neurons = scalar_int("SELECT COUNT(*) FROM neurons");
        s.meta_neurons = scalar_int("SELECT COUNT(*) FROM meta_neurons");
        s.rules = scalar_int("SELECT COUNT(*) FROM rules WHERE enabled = 1");
        s.skills = scalar_int("SELECT COUNT(*) FROM skills WHERE enabled = 1");

        detail::Statement stmt(db_, "SELECT AVG(confidence) FROM neurons WHERE timestamp > ?");
        stmt.bind_int64(1, now() - 7 * MS_PER_DAY);
        if (stmt.step() && !stmt.column_is_null(0)) {
            s.avg_confidence = static_cast<float>(stmt.column_double(0));
        }
        return s;
    }

    // ═══════════════════════════════════════════════════════════════════════
    // Rules
    // ═══════════════════════════════════════════════════════════════════════

    // Check-and-insert in one statement: true if inserted, false if a rule
    // with identical rule_text already exists. No fuzzy matching.
    bool insert_rule_if_absent(const Rule& rule) {
        validate_confidence(rule.confidence_threshold, "confidence_threshold");
        if (rule.priority < 1) {
            throw ValidationError("priority must be >= 1, got " + std::to_string(rule.priority));
        }

        std::lock_guard<std::mutex> lock(mutex_);
        require_open();

        detail::Statement stmt(db_,
            "INSERT INTO rules (rule_text, trigger_pattern, confidence_threshold, priority, "
            "enabled, created_at, applied_count) "
            "SELECT ?1, ?2, ?3, ?4, ?5, ?6, 0 "
            "WHERE NOT EXISTS (SELECT 1 FROM rules WHERE rule_text = ?1)");
        stmt.bind_text(1, rule.rule_text);
        stmt.bind_text(2, rule.trigger_pattern);
        stmt.bind_double(3, rule.confidence_threshold);
        stmt.bind_int64(4, rule.priority);
        stmt.bind_int64(5, rule.enabled ? 1 : 0);
        stmt.bind_int64(6, rule.created_at > 0 ? rule.created_at : now());
        stmt.step();
        return sqlite3_changes(db_) > 0;
    }

    bool rule_exists(const std::string& rule_text) const {
        std::lock_guard<std::mutex> lock(mutex_);
        require_open();

        detail::Statement stmt(db_, "SELECT 1 FROM rules WHERE rule_text = ? LIMIT 1");
        stmt.bind_text(1, rule_text);
        return stmt.step();
    }

    // Highest priority first, then oldest
    std::vector<Rule> rules(bool enabled_only = false) const {
        std::lock_guard<std::mutex> lock(mutex_);
        require_open();

        std::string sql =
            "SELECT id, rule_text, trigger_pattern, confidence_threshold, priority, enabled, "
            "created_at, applied_count FROM rules ";
        if (enabled_only) sql += "WHERE enabled = 1 ";
        sql += "ORDER BY priority DESC, id ASC";

        detail::Statement stmt(db_, sql.c_str());
        std::vector<Rule> out;
        while (stmt.step()) {
            out.push_back(detail::read_rule(stmt));
        }
        return out;
    }

    // ═══════════════════════════════════════════════════════════════════════
    // Skills
    // ═══════════════════════════════════════════════════════════════════════

    // Register or rename a skill. Aggregates are not written.
    void upsert_skill(const Skill& skill) {
        if (skill.id.empty()) throw ValidationError("skill id must not be empty");

        std::lock_guard<std::mutex> lock(mutex_);
        require_open();

        detail::Statement stmt(db_,
            "INSERT INTO skills (id, name, description, enabled, created_at) "
            "VALUES (?, ?, ?, ?, ?) "
            "ON CONFLICT(id) DO UPDATE SET name = excluded.name, "
            "description = excluded.description, enabled = excluded.enabled");
        stmt.bind_text(1, skill.id);
        stmt.bind_text(2, skill.name.empty() ? skill.id : skill.name);
        stmt.bind_text(3, skill.description);
        stmt.bind_int64(4, skill.enabled ? 1 : 0);
        stmt.bind_int64(5, skill.created_at > 0 ? skill.created_at : now());
        stmt.step();
    }

    // Every registered skill plus every skill_id referenced by a neuron,
    // with neuron_count / avg_confidence computed from the neurons table.
    std::vector<Skill> skills() const {
        std::lock_guard<std::mutex> lock(mutex_);
        require_open();

        std::map<std::string, Skill> by_id;

        detail::Statement reg(db_,
            "SELECT id, name, description, enabled, created_at FROM skills");
        while (reg.step()) {
            Skill s;
            s.id = reg.column_text(0);
            s.name = reg.column_text(1);
            s.description = reg.column_text(2);
            s.enabled = reg.column_int64(3) != 0;
            s.created_at = reg.column_int64(4);
            by_id[s.id] = std::move(s);
        }

        detail::Statement agg(db_,
            "SELECT skill_id, COUNT(*), AVG(confidence), MIN(timestamp) FROM neurons "
            "WHERE skill_id IS NOT NULL GROUP BY skill_id");
        while (agg.step()) {
            std::string id = agg.column_text(0);
            auto it = by_id.find(id);
            if (it == by_id.end()) {
                Skill s;
                s.id = id;
                s.name = id;
                s.created_at = agg.column_int64(3);
                it = by_id.emplace(id, std::move(s)).first;
            }
            it->second.neuron_count = agg.column_int64(1);
            it->second.avg_confidence = static_cast<float>(agg.column_double(2));
        }

        std::vector<Skill> out;
        out.reserve(by_id.size());
        for (auto& [id, skill] : by_id) {
            out.push_back(std::move(skill));
        }
        return out;
    }

    int64_t count_meta_neurons() const {
        std::lock_guard<std::mutex> lock(mutex_);
        require_open();
        return scalar_int("SELECT COUNT(*) FROM meta_neurons");
    }

private:
    void require_open() const {
        if (!db_) throw StorageError("store is not open: " + path_);
    }

    void exec(const std::string& sql) {
        char* err = nullptr;
        if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
            std::string msg = err ? err : sqlite3_errmsg(db_);
            sqlite3_free(err);
            throw StorageError("exec failed: " + msg);
        }
    }

    int user_version() const {
        detail::Statement stmt(db_, "PRAGMA user_version");
        return stmt.step() ? static_cast<int>(stmt.column_int64(0)) : 0;
    }

    int64_t scalar_int(const char* sql) const {
        detail::Statement stmt(db_, sql);
        return stmt.step() ? stmt.column_int64(0) : 0;
    }

    static std::vector<Neuron> collect(detail::Statement& stmt) {
        std::vector<Neuron> out;
        while (stmt.step()) {
            out.push_back(detail::read_neuron(stmt));
        }
        return out;
    }

    std::string path_;
    sqlite3* db_ = nullptr;
    mutable std::mutex mutex_;
};

} // namespace evomemory
