#pragma once
// Configuration: one struct with defaults, optionally overridden from JSON
//
// Every key is optional. A file only has to name what it changes:
//
//   {
//     "db_path": "/var/lib/evomemory/neurons.db",
//     "reindex_every": 20,
//     "scorer":    { "clarification_threshold": 0.35 },
//     "retrieval": { "bm25": { "k1": 1.2 }, "max_context_tokens": 500 },
//     "evolution": { "analysis_window": 300 }
//   }

#include "types.hpp"
#include "scoring.hpp"
#include "retrieval.hpp"
#include "evolution.hpp"
#include <nlohmann/json.hpp>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

namespace evomemory {

struct MemoryConfig {
    std::string db_path;                 // Empty = default_db_path()
    std::string snapshot_path;           // Empty = instinct.json beside the db (cwd for :memory:)
    size_t reindex_every = 10;           // Rebuild the index every Nth insert (0 = never)

    ScorerConfig scorer;
    RetrievalConfig retrieval;
    EvolutionConfig evolution;
};

inline std::string default_db_path() {
    const char* home = std::getenv("HOME");
    if (!home) home = ".";
    return std::string(home) + "/.evomemory/neurons.db";
}

inline std::string default_snapshot_path(const std::string& db_path) {
    if (db_path == ":memory:") return EvolutionConfig{}.snapshot_path;
    return (std::filesystem::path(db_path).parent_path() / "instinct.json").string();
}

// Fill in the paths left empty
inline MemoryConfig resolve_paths(MemoryConfig config) {
    if (config.db_path.empty()) config.db_path = default_db_path();
    if (config.snapshot_path.empty()) config.snapshot_path = default_snapshot_path(config.db_path);
    if (config.evolution.snapshot_path.empty() ||
        config.evolution.snapshot_path == EvolutionConfig{}.snapshot_path) {
        config.evolution.snapshot_path = config.snapshot_path;
    }
    return config;
}

namespace detail {

inline void apply_json(ScorerConfig& c, const json& j) {
    c.baseline = j.value("baseline", c.baseline);
    c.short_output_chars = j.value("short_output_chars", c.short_output_chars);
    c.short_output_delta = j.value("short_output_delta", c.short_output_delta);
    c.detailed_output_chars = j.value("detailed_output_chars", c.detailed_output_chars);
    c.detailed_output_delta = j.value("detailed_output_delta", c.detailed_output_delta);
    c.uncertainty_delta = j.value("uncertainty_delta", c.uncertainty_delta);
    c.certainty_delta = j.value("certainty_delta", c.certainty_delta);
    c.max_question_marks = j.value("max_question_marks", c.max_question_marks);
    c.question_delta = j.value("question_delta", c.question_delta);
    c.repetition_min_words = j.value("repetition_min_words", c.repetition_min_words);
    c.repetition_min_unique_ratio = j.value("repetition_min_unique_ratio", c.repetition_min_unique_ratio);
    c.repetition_delta = j.value("repetition_delta", c.repetition_delta);
    c.long_prompt_tokens = j.value("long_prompt_tokens", c.long_prompt_tokens);
    c.long_prompt_short_output_chars = j.value("long_prompt_short_output_chars", c.long_prompt_short_output_chars);
    c.long_prompt_delta = j.value("long_prompt_delta", c.long_prompt_delta);
    c.fluent_tokens_per_second = j.value("fluent_tokens_per_second", c.fluent_tokens_per_second);
    c.fluent_delta = j.value("fluent_delta", c.fluent_delta);
    c.clarification_threshold = j.value("clarification_threshold", c.clarification_threshold);
    c.uncertainty_phrases = j.value("uncertainty_phrases", c.uncertainty_phrases);
    c.certainty_phrases = j.value("certainty_phrases", c.certainty_phrases);
}

inline void apply_json(RetrievalConfig& c, const json& j) {
    if (j.contains("bm25")) {
        const json& bm25 = j.at("bm25");
        c.bm25.k1 = bm25.value("k1", c.bm25.k1);
        c.bm25.b = bm25.value("b", c.bm25.b);
    }
    c.max_neurons = j.value("max_neurons", c.max_neurons);
    c.boost_confidence_above = j.value("boost_confidence_above", c.boost_confidence_above);
    c.confidence_boost = j.value("confidence_boost", c.confidence_boost);
    c.feedback_boost = j.value("feedback_boost", c.feedback_boost);
    c.min_context_score = j.value("min_context_score", c.min_context_score);
    c.context_results = j.value("context_results", c.context_results);
    c.max_context_tokens = j.value("max_context_tokens", c.max_context_tokens);
    c.chars_per_token = j.value("chars_per_token", c.chars_per_token);
    c.input_preview_chars = j.value("input_preview_chars", c.input_preview_chars);
    c.output_preview_chars = j.value("output_preview_chars", c.output_preview_chars);
    c.context_header = j.value("context_header", c.context_header);
    c.hybrid_results = j.value("hybrid_results", c.hybrid_results);
    c.hybrid_fallback_score = j.value("hybrid_fallback_score", c.hybrid_fallback_score);
}

inline void apply_json(EvolutionConfig& c, const json& j) {
    c.analysis_window = j.value("analysis_window", c.analysis_window);
    c.min_occurrences = j.value("min_occurrences", c.min_occurrences);
    c.analysis_keywords = j.value("analysis_keywords", c.analysis_keywords);
    c.keyword_min_chars = j.value("keyword_min_chars", c.keyword_min_chars);
    c.min_pattern_count = j.value("min_pattern_count", c.min_pattern_count);
    c.skill_confidence_above = j.value("skill_confidence_above", c.skill_confidence_above);
    c.skill_priority = j.value("skill_priority", c.skill_priority);
    c.negative_window = j.value("negative_window", c.negative_window);
    c.negative_min_neurons = j.value("negative_min_neurons", c.negative_min_neurons);
    c.negative_word_min_chars = j.value("negative_word_min_chars", c.negative_word_min_chars);
    c.negative_top_words = j.value("negative_top_words", c.negative_top_words);
    c.negative_threshold = j.value("negative_threshold", c.negative_threshold);
    c.negative_priority = j.value("negative_priority", c.negative_priority);
    c.high_window = j.value("high_window", c.high_window);
    c.high_confidence_above = j.value("high_confidence_above", c.high_confidence_above);
    c.high_min_neurons = j.value("high_min_neurons", c.high_min_neurons);
    c.high_top_keywords = j.value("high_top_keywords", c.high_top_keywords);
    c.high_threshold = j.value("high_threshold", c.high_threshold);
    c.high_priority = j.value("high_priority", c.high_priority);
    c.low_window = j.value("low_window", c.low_window);
    c.low_confidence_below = j.value("low_confidence_below", c.low_confidence_below);
    c.low_min_neurons = j.value("low_min_neurons", c.low_min_neurons);
    c.low_scan_words = j.value("low_scan_words", c.low_scan_words);
    c.low_top_topics = j.value("low_top_topics", c.low_top_topics);
    c.low_threshold = j.value("low_threshold", c.low_threshold);
    c.low_priority = j.value("low_priority", c.low_priority);
    c.snapshot_path = j.value("snapshot_path", c.snapshot_path);
}

} // namespace detail

// Overlay a parsed JSON document on `config`. Unknown keys are ignored;
// a key with the wrong type is a ValidationError.
inline void apply_config_json(MemoryConfig& config, const json& doc) {
    if (!doc.is_object()) throw ValidationError("config must be a JSON object");
    try {
        config.db_path = doc.value("db_path", config.db_path);
        config.snapshot_path = doc.value("snapshot_path", config.snapshot_path);
        config.reindex_every = doc.value("reindex_every", config.reindex_every);
        if (doc.contains("scorer")) detail::apply_json(config.scorer, doc.at("scorer"));
        if (doc.contains("retrieval")) detail::apply_json(config.retrieval, doc.at("retrieval"));
        if (doc.contains("evolution")) detail::apply_json(config.evolution, doc.at("evolution"));
    } catch (const json::exception& e) {
        throw ValidationError(std::string("bad config value: ") + e.what());
    }
}

// Defaults overridden by the JSON file at `path`
inline MemoryConfig load_config(const std::string& path) {
    std::ifstream in(path);
    if (!in) throw std::runtime_error("cannot read config: " + path);

    std::stringstream buffer;
    buffer << in.rdbuf();

    json doc;
    try {
        doc = json::parse(buffer.str());
    } catch (const json::parse_error& e) {
        throw ValidationError("cannot parse config " + path + ": " + e.what());
    }

    MemoryConfig config;
    apply_config_json(config, doc);
    return config;
}

} // namespace evomemory
