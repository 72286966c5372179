#pragma once
// Retrieval: BM25 ranking over a window of recent neurons
//
// The index is a snapshot, not a live view. reindex() builds a new immutable
// Bm25Snapshot off to the side and swaps the pointer, so readers keep
// scoring against the previous snapshot until the swap and never see a
// half-built one. Between rebuilds the snapshot may lag the store; the
// caller decides the rebuild cadence.

#include "types.hpp"
#include "text.hpp"
#include "storage.hpp"
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace evomemory {

// BM25 parameters
struct BM25Config {
    float k1 = 1.5f;   // Term frequency saturation
    float b = 0.75f;   // Length normalization
};

struct RetrievalConfig {
    BM25Config bm25;
    size_t max_neurons = 1000;           // Snapshot window

    float boost_confidence_above = 0.7f;
    float confidence_boost = 1.2f;
    float feedback_boost = 1.3f;         // user_feedback > 0

    float min_context_score = 0.5f;      // Best hit below this: no context
    size_t context_results = 3;
    size_t max_context_tokens = 300;
    size_t chars_per_token = 4;
    size_t input_preview_chars = 100;
    size_t output_preview_chars = 150;
    std::string context_header = "### Relevant past experiences:";

    size_t hybrid_results = 5;
    float hybrid_fallback_score = 0.5f;  // Score given to context-hash matches
};

struct ScoredNeuron {
    Neuron neuron;
    float score = 0.0f;
};

enum class HitSource : uint8_t {
    Bm25 = 0,
    ContextHash = 1,
};

inline const char* hit_source_name(HitSource source) {
    return source == HitSource::Bm25 ? "bm25" : "context_hash";
}

struct HybridHit {
    Neuron neuron;
    float score = 0.0f;
    HitSource source = HitSource::Bm25;
};

struct HybridResult {
    std::vector<ScoredNeuron> bm25_results;
    std::vector<Neuron> context_matches;
    std::vector<HybridHit> combined;     // BM25 first, deduplicated by id
};

// Formatted context plus the neurons that went into it
struct PromptContext {
    std::string text;                    // Empty when nothing relevant
    std::vector<NeuronId> neuron_ids;
    float best_score = 0.0f;
};

// ═══════════════════════════════════════════════════════════════════════════
// Immutable BM25 snapshot
// ═══════════════════════════════════════════════════════════════════════════

class Bm25Snapshot {
public:
    // Each document is "<input_text> <output_text>"
    Bm25Snapshot(std::vector<Neuron> neurons, BM25Config config = {})
        : config_(config), neurons_(std::move(neurons)), built_at_(now())
    {
        docs_.reserve(neurons_.size());
        std::unordered_map<std::string, size_t> doc_freqs;
        size_t total_length = 0;

        for (const auto& n : neurons_) {
            auto tokens = tokenize(n.input_text + " " + n.output_text);

            Document doc;
            doc.length = tokens.size();
            for (const auto& t : tokens) {
                doc.term_freq[t]++;
            }
            for (const auto& [term, _] : doc.term_freq) {
                doc_freqs[term]++;
            }

            total_length += doc.length;
            docs_.push_back(std::move(doc));
        }

        avg_doc_length_ = docs_.empty()
            ? 0.0f
            : static_cast<float>(total_length) / static_cast<float>(docs_.size());

        // IDF with BM25 smoothing
        float n_docs = static_cast<float>(docs_.size());
        for (const auto& [term, df] : doc_freqs) {
            float df_f = static_cast<float>(df);
            idf_[term] = std::log((n_docs - df_f + 0.5f) / (df_f + 0.5f) + 1.0f);
        }
    }

    // Base BM25 score of document `index`. Repeated query terms count again;
    // terms outside the vocabulary contribute zero.
    float score(const std::vector<std::string>& query_terms, size_t index) const {
        const Document& doc = docs_[index];
        float length_ratio = avg_doc_length_ > 0.0f
            ? static_cast<float>(doc.length) / avg_doc_length_
            : 0.0f;

        float total = 0.0f;
        for (const auto& term : query_terms) {
            auto idf_it = idf_.find(term);
            if (idf_it == idf_.end()) continue;

            auto tf_it = doc.term_freq.find(term);
            if (tf_it == doc.term_freq.end()) continue;
            float tf = static_cast<float>(tf_it->second);

            float numerator = tf * (config_.k1 + 1.0f);
            float denominator = tf + config_.k1 * (1.0f - config_.b + config_.b * length_ratio);
            total += idf_it->second * numerator / denominator;
        }
        return total;
    }

    // 0 for terms outside the vocabulary
    float idf(const std::string& term) const {
        auto it = idf_.find(term);
        return it == idf_.end() ? 0.0f : it->second;
    }

    const std::vector<Neuron>& neurons() const { return neurons_; }
    size_t size() const { return docs_.size(); }
    size_t vocab_size() const { return idf_.size(); }
    float avg_doc_length() const { return avg_doc_length_; }
    Timestamp built_at() const { return built_at_; }

private:
    struct Document {
        std::unordered_map<std::string, uint32_t> term_freq;
        size_t length = 0;
    };

    BM25Config config_;
    std::vector<Neuron> neurons_;   // Parallel to docs_
    std::vector<Document> docs_;
    std::unordered_map<std::string, float> idf_;
    float avg_doc_length_ = 0.0f;
    Timestamp built_at_;
};

// ═══════════════════════════════════════════════════════════════════════════
// Retrieval index (RAG-Lite)
// ═══════════════════════════════════════════════════════════════════════════

class RetrievalIndex {
public:
    // The store must outlive the index
    explicit RetrievalIndex(NeuronStore& store, RetrievalConfig config = {})
        : store_(store), config_(std::move(config)) {}

    const RetrievalConfig& config() const { return config_; }

    // Rebuild from the newest max_neurons neurons and swap it in.
    // Returns the number of indexed neurons.
    size_t reindex(size_t max_neurons) {
        auto fresh = std::make_shared<const Bm25Snapshot>(
            store_.recent(max_neurons), config_.bm25);
        size_t n = fresh->size();
        size_t vocab = fresh->vocab_size();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            snapshot_ = std::move(fresh);
        }
        std::cerr << "[RetrievalIndex] Indexed " << n << " neurons (vocab=" << vocab << ")\n";
        return n;
    }

    size_t reindex() { return reindex(config_.max_neurons); }

    // Current snapshot, or null before the first build
    std::shared_ptr<const Bm25Snapshot> snapshot() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return snapshot_;
    }

    bool indexed() const { return snapshot() != nullptr; }

    // All indexed neurons ranked by boosted score, best first, cut to top_k.
    // Builds the snapshot on first use.
    std::vector<ScoredNeuron> retrieve(const std::string& query, size_t top_k = 5) {
        auto snap = ensure_snapshot();
        auto terms = tokenize(query);

        std::vector<ScoredNeuron> results;
        results.reserve(snap->size());
        for (size_t i = 0; i < snap->size(); ++i) {
            const Neuron& n = snap->neurons()[i];
            float s = snap->score(terms, i);

            if (n.confidence > config_.boost_confidence_above) s *= config_.confidence_boost;
            if (n.user_feedback > 0) s *= config_.feedback_boost;

            results.push_back({n, s});
        }

        // Stable: equal scores keep snapshot (newest first) order
        std::stable_sort(results.begin(), results.end(),
            [](const ScoredNeuron& a, const ScoredNeuron& b) { return a.score > b.score; });

        if (results.size() > top_k) results.resize(top_k);
        return results;
    }

    // Past exchanges worth injecting ahead of a prompt. Empty text when the
    // best hit scores below min_context_score or no block fits the budget.
    PromptContext build_prompt_context(const std::string& query, size_t max_context_tokens) {
        PromptContext ctx;
        auto relevant = retrieve(query, config_.context_results);
        if (relevant.empty()) return ctx;

        ctx.best_score = relevant.front().score;
        if (ctx.best_score < config_.min_context_score) return ctx;

        std::string blocks;
        float used_tokens = 0.0f;

        for (const auto& hit : relevant) {
            // ~4 chars per token
            float estimated = static_cast<float>(utf8_length(hit.neuron.output_text)) /
                              static_cast<float>(config_.chars_per_token);
            if (used_tokens + estimated > static_cast<float>(max_context_tokens)) break;

            char conf[16];
            std::snprintf(conf, sizeof(conf), "%.2f", hit.neuron.confidence);

            blocks += "\n- Input: " + utf8_truncate(hit.neuron.input_text, config_.input_preview_chars) +
                      "\n  Output: " + utf8_truncate(hit.neuron.output_text, config_.output_preview_chars) +
                      "\n  (confidence: " + conf + ")";

            ctx.neuron_ids.push_back(hit.neuron.id);
            used_tokens += estimated;
        }

        if (ctx.neuron_ids.empty()) return ctx;

        ctx.text = config_.context_header + blocks + "\n\n";
        return ctx;
    }

    std::string get_context_for_prompt(const std::string& query, size_t max_context_tokens) {
        return build_prompt_context(query, max_context_tokens).text;
    }

    std::string get_context_for_prompt(const std::string& query) {
        return get_context_for_prompt(query, config_.max_context_tokens);
    }

    // BM25 ranking merged with exact context-hash matches from the store
    HybridResult hybrid_search(const std::string& query) {
        HybridResult result;
        result.bm25_results = retrieve(query, config_.hybrid_results);
        result.context_matches = store_.similar(context_hash(query), config_.hybrid_results);

        std::unordered_set<NeuronId> seen;
        for (const auto& hit : result.bm25_results) {
            if (seen.insert(hit.neuron.id).second) {
                result.combined.push_back({hit.neuron, hit.score, HitSource::Bm25});
            }
        }
        for (const auto& n : result.context_matches) {
            if (seen.insert(n.id).second) {
                result.combined.push_back({n, config_.hybrid_fallback_score, HitSource::ContextHash});
            }
        }

        if (result.combined.size() > config_.hybrid_results) {
            result.combined.resize(config_.hybrid_results);
        }
        return result;
    }

private:
    std::shared_ptr<const Bm25Snapshot> ensure_snapshot() {
        auto snap = snapshot();
        if (snap) return snap;
        reindex(config_.max_neurons);
        return snapshot();
    }

    NeuronStore& store_;
    RetrievalConfig config_;

    // Guards only the pointer; snapshots themselves are immutable
    mutable std::mutex mutex_;
    std::shared_ptr<const Bm25Snapshot> snapshot_;
};

} // namespace evomemory
