// evomemory: Command-line interface for episodic memory
//
// Usage: evomemory <command> [args] [options]
//
// Commands:
//   stats      Show memory statistics
//   remember   Score and store an exchange
//   retrieve   BM25 search over recent neurons
//   context    Prompt context for a query
//   evolve     Mine rules from recent neurons
//   help       Show this help

#include <evomemory/evomemory.hpp>
#include <nlohmann/json.hpp>
#include <iostream>
#include <string>
#include <cstring>
#include <cstdlib>
#include <cstdarg>
#include <chrono>
#include <atomic>
#include <iomanip>
#include <vector>

using namespace evomemory;

// Get program name from path
static const char* prog_name(const char* path) {
    const char* last = path;
    for (const char* p = path; *p; ++p) {
        if (*p == '/') last = p + 1;
    }
    return last;
}

// Global verbose flag for debug logging
static std::atomic<bool> verbose_mode{false};

void log_debug(const char* component, const char* fmt, ...) {
    if (!verbose_mode) return;

    // Get timestamp with milliseconds
    auto now = std::chrono::system_clock::now();
    auto now_time_t = std::chrono::system_clock::to_time_t(now);
    auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    char time_buf[32];
    std::tm tm_buf{};
    localtime_r(&now_time_t, &tm_buf);
    std::strftime(time_buf, sizeof(time_buf), "%H:%M:%S", &tm_buf);

    std::cerr << "[" << time_buf << "." << std::setfill('0') << std::setw(3) << now_ms.count()
              << std::setfill(' ') << "][" << component << "] ";

    va_list args;
    va_start(args, fmt);
    vfprintf(stderr, fmt, args);
    va_end(args);
    std::cerr << "\n";
}

void print_usage(const char* prog) {
    const char* name = prog_name(prog);
    std::cerr << "evomemory " << EVOMEMORY_VERSION << " - Episodic memory\n\n"
              << "Usage: " << name << " <command> [args] [options]\n\n"
              << "Memory Commands:\n"
              << "  stats                    Show memory statistics\n"
              << "  remember <in> <out>      Score and store an exchange\n"
              << "  get <id>                 Show one neuron\n"
              << "  recent                   Newest neurons (--skill filters)\n"
              << "  search <text>            Substring search over input/output\n"
              << "  similar <text>           Neurons with the same context hash\n"
              << "  feedback <id> <value>    Record user feedback (-1, 0, 1)\n"
              << "  prune                    Delete old, unconfident, unloved neurons\n\n"
              << "Scoring & Retrieval:\n"
              << "  score <text>             Score text without storing it\n"
              << "  retrieve <query>         BM25 ranking over recent neurons\n"
              << "  context <query>          Prompt context block for a query\n"
              << "  hybrid <query>           BM25 merged with context-hash matches\n"
              << "  reindex                  Rebuild the retrieval index\n\n"
              << "Evolution:\n"
              << "  evolve                   Mine rules and export the snapshot\n"
              << "  rules                    List stored rules\n"
              << "  skills                   List skills with aggregates\n"
              << "  help                     Show this help\n\n"
              << "Options:\n"
              << "  --db PATH                Database path (default: ~/.evomemory/neurons.db)\n"
              << "  --config PATH            JSON configuration file\n"
              << "  --snapshot PATH          Rule snapshot path (default: instinct.json beside db)\n"
              << "  --limit N                Result count\n"
              << "  --skill ID               Skill for remember/recent\n"
              << "  --idea TEXT              Intermediate reasoning for remember\n"
              << "  --keep-days N            prune: minimum age in days (default: 30)\n"
              << "  --min-confidence F       prune: confidence floor (default: 0.3)\n"
              << "  --min-neurons N          evolve: minimum corpus size (default: 50)\n"
              << "  --max-tokens N           context: token budget (default: 300)\n"
              << "  --prompt-tokens N        Generation stats for remember/score\n"
              << "  --tps F                  Generation speed for remember/score\n"
              << "  --json                   Output as JSON\n"
              << "  --verbose                Enable verbose debug logging\n"
              << "  -v, --version            Show version\n";
}

// ═══════════════════════════════════════════════════════════════════════════
// Formatting
// ═══════════════════════════════════════════════════════════════════════════

static json optional_json(const std::optional<std::string>& value) {
    return value ? json(*value) : json(nullptr);
}

static json neuron_json(const Neuron& n) {
    return {
        {"id", n.id},
        {"input_text", n.input_text},
        {"idea", optional_json(n.idea)},
        {"output_text", n.output_text},
        {"mood", mood_name(n.mood)},
        {"confidence", n.confidence},
        {"user_feedback", n.user_feedback},
        {"context_hash", n.context_hash},
        {"skill_id", optional_json(n.skill_id)},
        {"timestamp", format_timestamp(n.timestamp)},
        {"last_accessed", format_timestamp(n.last_accessed)},
        {"access_count", n.access_count},
    };
}

static std::string one_line(const std::string& text, size_t max_chars) {
    std::string flat = text;
    for (char& c : flat) {
        if (c == '\n' || c == '\r' || c == '\t') c = ' ';
    }
    if (utf8_length(flat) <= max_chars) return flat;
    return utf8_truncate(flat, max_chars) + "...";
}

static void print_neuron_line(const Neuron& n) {
    std::cout << "  #" << n.id << " [" << std::fixed << std::setprecision(2) << n.confidence << "] "
              << one_line(n.input_text, 50) << " -> " << one_line(n.output_text, 60) << "\n";
}

static void print_neurons(const std::vector<Neuron>& neurons, bool json_output) {
    if (json_output) {
        json arr = json::array();
        for (const auto& n : neurons) arr.push_back(neuron_json(n));
        std::cout << arr.dump(2) << "\n";
        return;
    }
    if (neurons.empty()) {
        std::cout << "No neurons found.\n";
        return;
    }
    for (const auto& n : neurons) print_neuron_line(n);
}

static std::optional<GenerationStats> generation_stats(int prompt_tokens, double tps) {
    if (prompt_tokens < 0 && tps < 0.0) return std::nullopt;
    GenerationStats stats;
    if (prompt_tokens >= 0) stats.prompt_tokens = prompt_tokens;
    if (tps >= 0.0) stats.tokens_per_second = tps;
    return stats;
}

// ═══════════════════════════════════════════════════════════════════════════
// Commands
// ═══════════════════════════════════════════════════════════════════════════

int cmd_stats(EvoMemory& memory, bool json_output) {
    StoreStats s = memory.stats();

    if (json_output) {
        json out = {
            {"version", EVOMEMORY_VERSION},
            {"database", memory.config().db_path},
            {"neurons", s.neurons},
            {"meta_neurons", s.meta_neurons},
            {"rules", s.rules},
            {"skills", s.skills},
            {"avg_confidence", s.avg_confidence},
        };
        std::cout << out.dump(2) << "\n";
        return 0;
    }

    std::cout << "EvoMemory Statistics\n";
    std::cout << "═══════════════════════════════\n";
    std::cout << "Neurons:        " << s.neurons << "\n";
    std::cout << "Meta-neurons:   " << s.meta_neurons << "\n";
    std::cout << "Rules:          " << s.rules << "\n";
    std::cout << "Skills:         " << s.skills << "\n";
    std::cout << "Avg confidence: " << std::fixed << std::setprecision(2) << s.avg_confidence
              << " (last 7 days)\n";
    std::cout << "Database:       " << memory.config().db_path << "\n";
    return 0;
}

int cmd_remember(EvoMemory& memory, const std::string& input, const std::string& output,
                 const RememberOptions& options, bool json_output) {
    Interaction result = memory.remember(input, output, options);
    log_debug("remember", "stored #%lld (confidence=%.2f)",
              static_cast<long long>(result.id), result.confidence);

    if (json_output) {
        json out = {
            {"id", result.id},
            {"confidence", result.confidence},
            {"label", result.label},
            {"reasoning", result.reasoning},
            {"ask_clarification", result.ask_clarification},
        };
        std::cout << out.dump(2) << "\n";
        return 0;
    }

    std::cout << "Stored neuron #" << result.id << "\n";
    std::cout << "  Confidence: " << std::fixed << std::setprecision(2) << result.confidence
              << " (" << result.label << ")\n";
    std::cout << "  Reasoning:  " << result.reasoning << "\n";
    if (result.ask_clarification) {
        std::cout << "  Low confidence: consider asking for clarification\n";
    }
    return 0;
}

int cmd_get(EvoMemory& memory, NeuronId id, bool json_output) {
    auto n = memory.get(id);
    if (!n) {
        std::cerr << "No neuron #" << id << "\n";
        return 1;
    }
    if (json_output) {
        std::cout << neuron_json(*n).dump(2) << "\n";
        return 0;
    }

    std::cout << "Neuron #" << n->id << "\n";
    std::cout << "═══════════════════════════════\n";
    std::cout << "Input:      " << n->input_text << "\n";
    if (n->idea) std::cout << "Idea:       " << *n->idea << "\n";
    std::cout << "Output:     " << n->output_text << "\n";
    std::cout << "Confidence: " << std::fixed << std::setprecision(2) << n->confidence
              << " (" << ConfidenceScorer::label(n->confidence) << ")\n";
    std::cout << "Mood:       " << mood_name(n->mood) << " (feedback " << n->user_feedback << ")\n";
    std::cout << "Context:    " << n->context_hash << "\n";
    if (n->skill_id) std::cout << "Skill:      " << *n->skill_id << "\n";
    std::cout << "Created:    " << format_timestamp(n->timestamp) << "\n";
    std::cout << "Accessed:   " << n->access_count << " times, last "
              << format_timestamp(n->last_accessed) << "\n";
    return 0;
}

int cmd_feedback(EvoMemory& memory, NeuronId id, int value, bool json_output) {
    bool updated = memory.feedback(id, value);
    if (json_output) {
        std::cout << json({{"id", id}, {"feedback", value}, {"updated", updated}}).dump(2) << "\n";
    } else if (updated) {
        std::cout << "Feedback " << value << " recorded for #" << id << "\n";
    } else {
        std::cerr << "No neuron #" << id << "\n";
    }
    return updated ? 0 : 1;
}

int cmd_prune(EvoMemory& memory, int keep_days, float min_confidence, bool json_output) {
    int64_t deleted = memory.prune(keep_days, min_confidence);
    if (json_output) {
        std::cout << json({{"deleted", deleted}}).dump(2) << "\n";
    } else {
        std::cout << "Pruned " << deleted << " neurons (older than " << keep_days
                  << " days, confidence < " << min_confidence << ")\n";
    }
    return 0;
}

int cmd_score(const ConfidenceScorer& scorer, const std::string& text,
              const std::optional<GenerationStats>& stats, bool json_output) {
    ScoreResult result = scorer.score(text, stats);
    bool clarify = scorer.should_ask_clarification(result.confidence);

    if (json_output) {
        json out = {
            {"confidence", result.confidence},
            {"label", ConfidenceScorer::label(result.confidence)},
            {"reasoning", result.reasoning},
            {"ask_clarification", clarify},
        };
        std::cout << out.dump(2) << "\n";
        return 0;
    }

    std::cout << "Confidence: " << std::fixed << std::setprecision(2) << result.confidence
              << " (" << ConfidenceScorer::label(result.confidence) << ")\n";
    std::cout << "Reasoning:  " << result.reasoning << "\n";
    std::cout << "Clarify:    " << (clarify ? "yes" : "no") << "\n";
    return 0;
}

int cmd_retrieve(EvoMemory& memory, const std::string& query, size_t limit, bool json_output) {
    auto results = memory.retrieve(query, limit);

    if (json_output) {
        json arr = json::array();
        for (const auto& r : results) {
            json item = neuron_json(r.neuron);
            item["score"] = r.score;
            arr.push_back(std::move(item));
        }
        std::cout << arr.dump(2) << "\n";
        return 0;
    }

    if (results.empty()) {
        std::cout << "Nothing indexed.\n";
        return 0;
    }
    for (size_t i = 0; i < results.size(); ++i) {
        const auto& r = results[i];
        std::cout << "  " << (i + 1) << ". [" << std::fixed << std::setprecision(3) << r.score
                  << "] #" << r.neuron.id << " " << one_line(r.neuron.input_text, 60) << "\n";
    }
    return 0;
}

int cmd_context(EvoMemory& memory, const std::string& query, size_t max_tokens, bool json_output) {
    std::string text = memory.context_for(query, max_tokens);
    if (json_output) {
        std::cout << json({{"query", query}, {"context", text}}).dump(2) << "\n";
        return 0;
    }
    if (text.empty()) {
        std::cerr << "No relevant context.\n";
        return 0;
    }
    std::cout << text;
    return 0;
}

int cmd_hybrid(EvoMemory& memory, const std::string& query, bool json_output) {
    HybridResult result = memory.hybrid_search(query);

    if (json_output) {
        json combined = json::array();
        for (const auto& hit : result.combined) {
            json item = neuron_json(hit.neuron);
            item["score"] = hit.score;
            item["source"] = hit_source_name(hit.source);
            combined.push_back(std::move(item));
        }
        json out = {
            {"bm25_results", result.bm25_results.size()},
            {"context_matches", result.context_matches.size()},
            {"combined", combined},
        };
        std::cout << out.dump(2) << "\n";
        return 0;
    }

    std::cout << "BM25: " << result.bm25_results.size()
              << ", context matches: " << result.context_matches.size() << "\n";
    for (const auto& hit : result.combined) {
        std::cout << "  [" << std::fixed << std::setprecision(3) << hit.score << " "
                  << hit_source_name(hit.source) << "] #" << hit.neuron.id << " "
                  << one_line(hit.neuron.input_text, 60) << "\n";
    }
    return 0;
}

int cmd_evolve(EvoMemory& memory, int64_t min_neurons, bool json_output) {
    EvolutionResult result = memory.evolve(min_neurons);

    if (json_output) {
        json rules = json::array();
        for (const auto& r : result.rules) rules.push_back(rule_to_json(r));
        json out = {
            {"neurons_analyzed", result.neurons_analyzed},
            {"rules_generated", result.rules_generated},
            {"rules_saved", result.rules_saved},
            {"message", result.message},
            {"snapshot", result.snapshot_path},
            {"rules", rules},
        };
        std::cout << out.dump(2) << "\n";
        return 0;
    }

    std::cout << result.message << "\n";
    for (const auto& r : result.rules) {
        std::cout << "  [p" << r.priority << "] " << r.rule_text << "\n";
    }
    if (!result.snapshot_path.empty()) {
        std::cout << "Snapshot: " << result.snapshot_path << "\n";
    }
    return 0;
}

int cmd_rules(EvoMemory& memory, bool json_output) {
    auto rules = memory.store().rules();

    if (json_output) {
        json arr = json::array();
        for (const auto& r : rules) {
            json item = rule_to_json(r);
            item["id"] = r.id;
            item["created_at"] = format_timestamp(r.created_at);
            arr.push_back(std::move(item));
        }
        std::cout << arr.dump(2) << "\n";
        return 0;
    }

    if (rules.empty()) {
        std::cout << "No rules yet. Run: evomemory evolve\n";
        return 0;
    }
    for (const auto& r : rules) {
        std::cout << "  #" << r.id << " [p" << r.priority << "] " << r.rule_text
                  << (r.enabled ? "" : " (disabled)") << "\n"
                  << "      trigger " << r.trigger_pattern << ", threshold "
                  << std::fixed << std::setprecision(2) << r.confidence_threshold << "\n";
    }
    return 0;
}

int cmd_skills(EvoMemory& memory, bool json_output) {
    auto skills = memory.store().skills();

    if (json_output) {
        json arr = json::array();
        for (const auto& s : skills) {
            arr.push_back({
                {"id", s.id},
                {"name", s.name},
                {"description", s.description},
                {"neuron_count", s.neuron_count},
                {"avg_confidence", s.avg_confidence},
                {"enabled", s.enabled},
            });
        }
        std::cout << arr.dump(2) << "\n";
        return 0;
    }

    if (skills.empty()) {
        std::cout << "No skills.\n";
        return 0;
    }
    for (const auto& s : skills) {
        std::cout << "  " << s.id << ": " << s.neuron_count << " neurons, avg "
                  << std::fixed << std::setprecision(2) << s.avg_confidence
                  << (s.enabled ? "" : " (disabled)") << "\n";
    }
    return 0;
}

// ═══════════════════════════════════════════════════════════════════════════
// Entry point
// ═══════════════════════════════════════════════════════════════════════════

static bool needs_args(const std::string& command, const std::vector<std::string>& args,
                       size_t count, const char* usage) {
    if (args.size() >= count) return true;
    std::cerr << "Usage: evomemory " << command << " " << usage << "\n";
    return false;
}

int run(int argc, char* argv[]) {
    std::string db_path;
    std::string config_path;
    std::string snapshot_path;
    std::string command;
    std::vector<std::string> args;

    std::optional<std::string> skill;
    std::optional<std::string> idea;
    int limit = 0;                  // 0 = per-command default
    int keep_days = 30;
    float min_confidence = 0.3f;
    int64_t min_neurons = 50;
    int max_tokens = -1;            // -1 = config default
    int prompt_tokens = -1;
    double tps = -1.0;
    bool json_output = false;

    // Parse arguments
    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "--db") == 0 && i + 1 < argc) {
            db_path = argv[++i];
        } else if (strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_path = argv[++i];
        } else if (strcmp(argv[i], "--snapshot") == 0 && i + 1 < argc) {
            snapshot_path = argv[++i];
        } else if (strcmp(argv[i], "--limit") == 0 && i + 1 < argc) {
            limit = std::stoi(argv[++i]);
        } else if (strcmp(argv[i], "--skill") == 0 && i + 1 < argc) {
            skill = argv[++i];
        } else if (strcmp(argv[i], "--idea") == 0 && i + 1 < argc) {
            idea = argv[++i];
        } else if (strcmp(argv[i], "--keep-days") == 0 && i + 1 < argc) {
            keep_days = std::stoi(argv[++i]);
        } else if (strcmp(argv[i], "--min-confidence") == 0 && i + 1 < argc) {
            min_confidence = std::stof(argv[++i]);
        } else if (strcmp(argv[i], "--min-neurons") == 0 && i + 1 < argc) {
            min_neurons = std::stoll(argv[++i]);
        } else if (strcmp(argv[i], "--max-tokens") == 0 && i + 1 < argc) {
            max_tokens = std::stoi(argv[++i]);
        } else if (strcmp(argv[i], "--prompt-tokens") == 0 && i + 1 < argc) {
            prompt_tokens = std::stoi(argv[++i]);
        } else if (strcmp(argv[i], "--tps") == 0 && i + 1 < argc) {
            tps = std::stod(argv[++i]);
        } else if (strcmp(argv[i], "--json") == 0) {
            json_output = true;
        } else if (strcmp(argv[i], "--verbose") == 0) {
            verbose_mode = true;
        } else if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        } else if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "--version") == 0) {
            std::cout << "evomemory " << EVOMEMORY_VERSION << "\n";
            return 0;
        } else if (argv[i][0] != '-' || (argv[i][1] >= '0' && argv[i][1] <= '9')) {
            // Negative numbers are positional ("feedback 3 -1")
            if (command.empty()) {
                command = argv[i];
            } else {
                args.push_back(argv[i]);
            }
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    if (command.empty() || command == "help") {
        print_usage(argv[0]);
        return 0;
    }

    MemoryConfig config;
    if (!config_path.empty()) {
        log_debug("cli", "loading config %s", config_path.c_str());
        config = load_config(config_path);
    }
    if (!db_path.empty()) config.db_path = db_path;
    if (!snapshot_path.empty()) {
        config.snapshot_path = snapshot_path;
        config.evolution.snapshot_path = snapshot_path;
    }

    auto stats = generation_stats(prompt_tokens, tps);

    // score needs no database
    if (command == "score") {
        if (!needs_args(command, args, 1, "<text>")) return 1;
        ConfidenceScorer scorer(config.scorer);
        return cmd_score(scorer, args[0], stats, json_output);
    }

    EvoMemory memory(config);
    log_debug("cli", "opening %s", memory.config().db_path.c_str());
    memory.open();

    auto limit_or = [&](size_t fallback) {
        return limit > 0 ? static_cast<size_t>(limit) : fallback;
    };

    // Execute command
    int result = 0;
    if (command == "stats") {
        result = cmd_stats(memory, json_output);
    } else if (command == "remember") {
        if (!needs_args(command, args, 2, "<input> <output> [--skill ID] [--idea TEXT]")) return 1;
        RememberOptions options;
        options.idea = idea;
        options.skill_id = skill;
        options.stats = stats;
        result = cmd_remember(memory, args[0], args[1], options, json_output);
    } else if (command == "get") {
        if (!needs_args(command, args, 1, "<id>")) return 1;
        result = cmd_get(memory, std::stoll(args[0]), json_output);
    } else if (command == "recent") {
        print_neurons(memory.store().recent(limit_or(10), skill), json_output);
    } else if (command == "search") {
        if (!needs_args(command, args, 1, "<text>")) return 1;
        print_neurons(memory.store().search(args[0], limit_or(10)), json_output);
    } else if (command == "similar") {
        if (!needs_args(command, args, 1, "<text>")) return 1;
        print_neurons(memory.store().similar(context_hash(args[0]), limit_or(5)), json_output);
    } else if (command == "feedback") {
        if (!needs_args(command, args, 2, "<id> <-1|0|1>")) return 1;
        result = cmd_feedback(memory, std::stoll(args[0]), std::stoi(args[1]), json_output);
    } else if (command == "prune") {
        result = cmd_prune(memory, keep_days, min_confidence, json_output);
    } else if (command == "retrieve") {
        if (!needs_args(command, args, 1, "<query>")) return 1;
        result = cmd_retrieve(memory, args[0], limit_or(5), json_output);
    } else if (command == "context") {
        if (!needs_args(command, args, 1, "<query> [--max-tokens N]")) return 1;
        size_t budget = max_tokens >= 0 ? static_cast<size_t>(max_tokens)
                                        : memory.config().retrieval.max_context_tokens;
        result = cmd_context(memory, args[0], budget, json_output);
    } else if (command == "hybrid") {
        if (!needs_args(command, args, 1, "<query>")) return 1;
        result = cmd_hybrid(memory, args[0], json_output);
    } else if (command == "reindex") {
        size_t n = memory.reindex();
        if (json_output) {
            std::cout << json{{"indexed", n}}.dump(2) << "\n";
        } else {
            std::cout << "Indexed " << n << " neurons\n";
        }
    } else if (command == "evolve") {
        result = cmd_evolve(memory, min_neurons, json_output);
    } else if (command == "rules") {
        result = cmd_rules(memory, json_output);
    } else if (command == "skills") {
        result = cmd_skills(memory, json_output);
    } else {
        std::cerr << "Unknown command: " << command << "\n\n";
        print_usage(argv[0]);
        result = 1;
    }

    memory.close();
    return result;
}

int main(int argc, char* argv[]) {
    try {
        return run(argc, argv);
    } catch (const ValidationError& e) {
        std::cerr << "Invalid argument: " << e.what() << "\n";
        return 2;
    } catch (const StorageError& e) {
        std::cerr << "Storage error: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
