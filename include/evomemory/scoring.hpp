#pragma once
// Scoring: self-assessed confidence of generated text
//
// Deterministic additive model from a 0.5 baseline. Each adjustment that
// fires contributes a label to the reasoning, in evaluation order.
// Missing generation statistics just skip the adjustments that need them.

#include "text.hpp"
#include "types.hpp"
#include <algorithm>
#include <iterator>
#include <optional>
#include <regex>
#include <string>
#include <unordered_set>
#include <vector>

namespace evomemory {

// Numbers reported by the text-generation engine, all optional
struct GenerationStats {
    std::optional<int> prompt_tokens;
    std::optional<double> tokens_per_second;
};

struct ScorerConfig {
    float baseline = 0.5f;

    size_t short_output_chars = 10;      // Below this: too short
    float short_output_delta = -0.2f;
    size_t detailed_output_chars = 50;   // Above this: detailed
    float detailed_output_delta = 0.1f;

    float uncertainty_delta = -0.15f;    // Per uncertainty phrase
    float certainty_delta = 0.1f;        // Per certainty phrase

    size_t max_question_marks = 1;       // More than this: confused
    float question_delta = -0.1f;

    size_t repetition_min_words = 11;    // Only judged past 10 words
    float repetition_min_unique_ratio = 0.6f;
    float repetition_delta = -0.15f;

    int long_prompt_tokens = 500;        // Long prompt + short answer
    size_t long_prompt_short_output_chars = 50;
    float long_prompt_delta = -0.1f;

    double fluent_tokens_per_second = 5.0;
    float fluent_delta = 0.05f;

    float clarification_threshold = 0.4f;

    // Regex fragments, matched case-insensitively on word boundaries.
    // Both working languages (Italian, English).
    std::vector<std::string> uncertainty_phrases = {
        "non sono sicuro", "non sono sicura", "non so", "forse", "probabilmente",
        "potrebbe essere", "possibilmente",
        "i'm not sure", "i am not sure", "not sure", "i don't know", "maybe",
        "probably", "might be", "could be",
    };
    std::vector<std::string> certainty_phrases = {
        "sicuramente", "certamente", "conferma", "essenzialmente", "definitivamente",
        "certainly", "definitely", "clearly", "obviously",
    };
};

struct ScoreResult {
    float confidence = 0.5f;   // Always in [0, 1]
    std::string reasoning;     // "; "-joined labels, or "standard evaluation"
};

class ConfidenceScorer {
public:
    explicit ConfidenceScorer(ScorerConfig config = {})
        : config_(std::move(config))
        , uncertainty_(compile(config_.uncertainty_phrases))
        , certainty_(compile(config_.certainty_phrases)) {}

    const ScorerConfig& config() const { return config_; }

    ScoreResult score(const std::string& output_text,
                      const std::optional<GenerationStats>& stats = std::nullopt) const {
        float confidence = config_.baseline;
        std::vector<std::string> reasons;

        // 1. Length
        size_t length = utf8_length(trim(output_text));
        if (length < config_.short_output_chars) {
            confidence += config_.short_output_delta;
            reasons.emplace_back("output too short");
        } else if (length > config_.detailed_output_chars) {
            confidence += config_.detailed_output_delta;
            reasons.emplace_back("detailed response");
        }

        // 2. Hedging
        size_t doubts = count_matches(uncertainty_, output_text);
        if (doubts > 0) {
            confidence += config_.uncertainty_delta * static_cast<float>(doubts);
            reasons.push_back("found " + std::to_string(doubts) + " uncertainty expressions");
        }

        // 3. Assertiveness
        size_t certain = count_matches(certainty_, output_text);
        if (certain > 0) {
            confidence += config_.certainty_delta * static_cast<float>(certain);
            reasons.push_back("found " + std::to_string(certain) + " certainty expressions");
        }

        // 4. Answering with questions
        auto questions = static_cast<size_t>(
            std::count(output_text.begin(), output_text.end(), '?'));
        if (questions > config_.max_question_marks) {
            confidence += config_.question_delta;
            reasons.emplace_back("response contains questions");
        }

        // 5. Repetition (looping generation)
        auto words = split_words(to_lower(output_text));
        if (words.size() >= config_.repetition_min_words) {
            std::unordered_set<std::string> unique(words.begin(), words.end());
            float ratio = static_cast<float>(unique.size()) / static_cast<float>(words.size());
            if (ratio < config_.repetition_min_unique_ratio) {
                confidence += config_.repetition_delta;
                reasons.emplace_back("too many repetitions");
            }
        }

        // 6. Generation statistics
        if (stats) {
            if (stats->prompt_tokens && *stats->prompt_tokens > config_.long_prompt_tokens &&
                length < config_.long_prompt_short_output_chars) {
                confidence += config_.long_prompt_delta;
                reasons.emplace_back("response too short for the prompt");
            }
            if (stats->tokens_per_second &&
                *stats->tokens_per_second > config_.fluent_tokens_per_second) {
                confidence += config_.fluent_delta;
                reasons.emplace_back("fluent generation");
            }
        }

        ScoreResult result;
        result.confidence = std::clamp(confidence, 0.0f, 1.0f);
        result.reasoning = reasons.empty() ? "standard evaluation" : join(reasons, "; ");
        return result;
    }

    bool should_ask_clarification(float confidence) const {
        return confidence < config_.clarification_threshold;
    }

    static bool should_ask_clarification(float confidence, float threshold) {
        return confidence < threshold;
    }

    static const char* label(float confidence) {
        if (confidence >= 0.8f) return "very-high";
        if (confidence >= 0.6f) return "high";
        if (confidence >= 0.4f) return "medium";
        if (confidence >= 0.2f) return "low";
        return "very-low";
    }

private:
    // One alternation so overlapping phrases count once, leftmost first
    static std::optional<std::regex> compile(const std::vector<std::string>& phrases) {
        if (phrases.empty()) return std::nullopt;
        std::string pattern;
        for (const auto& p : phrases) {
            if (!pattern.empty()) pattern += '|';
            pattern += "\\b" + p + "\\b";
        }
        try {
            return std::regex(pattern, std::regex::ECMAScript | std::regex::icase);
        } catch (const std::regex_error& e) {
            throw ValidationError("invalid scorer phrase pattern: " + std::string(e.what()));
        }
    }

    static size_t count_matches(const std::optional<std::regex>& re, const std::string& text) {
        if (!re) return 0;
        return static_cast<size_t>(std::distance(
            std::sregex_iterator(text.begin(), text.end(), *re), std::sregex_iterator()));
    }

    static std::string join(const std::vector<std::string>& parts, const char* sep) {
        std::string out;
        for (size_t i = 0; i < parts.size(); ++i) {
            if (i > 0) out += sep;
            out += parts[i];
        }
        return out;
    }

    ScorerConfig config_;
    std::optional<std::regex> uncertainty_;
    std::optional<std::regex> certainty_;
};

} // namespace evomemory
