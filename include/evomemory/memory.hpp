#pragma once
// EvoMemory: the unified API for episodic memory
//
// Owns the four components and wires them together:
// - NeuronStore       persistence
// - ConfidenceScorer  self-assessment of each answer before it is stored
// - RetrievalIndex    BM25 context for the next prompt
// - RuleMiner         periodic distillation of patterns into rules
//
// The facade keeps the index reasonably fresh (rebuild on every Nth insert
// and after pruning) and records which neurons were injected into prompts.

#include "types.hpp"
#include "config.hpp"
#include "storage.hpp"
#include "scoring.hpp"
#include "retrieval.hpp"
#include "evolution.hpp"
#include <optional>
#include <string>
#include <vector>

namespace evomemory {

struct RememberOptions {
    std::optional<std::string> idea;
    std::optional<std::string> skill_id;
    std::optional<GenerationStats> stats;
    int feedback = 0;
};

// What came of storing one exchange
struct Interaction {
    NeuronId id = 0;
    float confidence = 0.5f;
    std::string reasoning;
    std::string label;                   // "very-high" .. "very-low"
    bool ask_clarification = false;
};

class EvoMemory {
public:
    explicit EvoMemory(MemoryConfig config = {})
        : config_(resolve_paths(std::move(config)))
        , store_(config_.db_path)
        , scorer_(config_.scorer)
        , index_(store_, config_.retrieval)
        , miner_(store_, config_.evolution) {}

    EvoMemory(const EvoMemory&) = delete;
    EvoMemory& operator=(const EvoMemory&) = delete;

    // Throws StorageError if the database cannot be opened
    void open() { store_.open(); }
    void close() { store_.close(); }

    const MemoryConfig& config() const { return config_; }
    NeuronStore& store() { return store_; }
    const ConfidenceScorer& scorer() const { return scorer_; }
    RetrievalIndex& index() { return index_; }
    RuleMiner& miner() { return miner_; }

    // Score an answer, store the exchange, and report the assessment
    Interaction remember(const std::string& input, const std::string& output,
                         const RememberOptions& options = {}) {
        ScoreResult scored = scorer_.score(output, options.stats);

        Neuron n(input, output, scored.confidence);
        n.idea = options.idea;
        n.skill_id = options.skill_id;
        n.user_feedback = options.feedback;

        Interaction result;
        result.id = store_.save(n);
        result.confidence = scored.confidence;
        result.reasoning = std::move(scored.reasoning);
        result.label = ConfidenceScorer::label(scored.confidence);
        result.ask_clarification = scorer_.should_ask_clarification(scored.confidence);

        if (config_.reindex_every > 0 &&
            store_.count() % static_cast<int64_t>(config_.reindex_every) == 0) {
            index_.reindex();
        }
        return result;
    }

    bool feedback(NeuronId id, int value) {
        return store_.update_feedback(id, value);
    }

    std::optional<Neuron> get(NeuronId id) const { return store_.get(id); }

    // Prompt context; neurons that made it into the text count as accessed
    std::string context_for(const std::string& query, size_t max_tokens) {
        PromptContext ctx = index_.build_prompt_context(query, max_tokens);
        store_.record_access(ctx.neuron_ids);
        return ctx.text;
    }

    std::string context_for(const std::string& query) {
        return context_for(query, config_.retrieval.max_context_tokens);
    }

    std::vector<ScoredNeuron> retrieve(const std::string& query, size_t top_k = 5) {
        return index_.retrieve(query, top_k);
    }

    HybridResult hybrid_search(const std::string& query) {
        return index_.hybrid_search(query);
    }

    size_t reindex() { return index_.reindex(); }

    EvolutionResult evolve(int64_t min_neurons = 50) {
        return miner_.auto_evolve(min_neurons);
    }

    // Prune, then rebuild so retrieval stops returning deleted neurons
    int64_t prune(int keep_days = 30, float min_confidence = 0.3f) {
        int64_t deleted = store_.prune(keep_days, min_confidence);
        if (deleted > 0 && index_.indexed()) index_.reindex();
        return deleted;
    }

    StoreStats stats() const { return store_.stats(); }

private:
    MemoryConfig config_;
    NeuronStore store_;
    ConfidenceScorer scorer_;
    RetrievalIndex index_;
    RuleMiner miner_;
};

} // namespace evomemory
