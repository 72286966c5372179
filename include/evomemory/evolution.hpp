#pragma once
// Evolution: mine recurring patterns in recent neurons into standing rules
//
// One batch pass, run on demand: read a window of neurons with a single
// query (a consistent point-in-time view), apply four independent
// heuristics, then insert each rule atomically unless its exact rule_text
// already exists. Scheduling is the caller's business.
//
// Heuristics:
//   skill confidence   skill groups that are reliably confident
//   negative feedback  words that keep appearing in disliked answers
//   high confidence    input keywords that lead to confident answers
//   low confidence     topics that should trigger a clarifying question

#include "types.hpp"
#include "keywords.hpp"
#include "storage.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <filesystem>
#include <iostream>
#include <map>
#include <memory>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace evomemory {

using json = nlohmann::json;

struct EvolutionConfig {
    size_t analysis_window = 200;        // Neurons read per pass
    size_t min_occurrences = 3;          // Skill group size for a rule
    size_t analysis_keywords = 3;        // Keyword buckets per neuron
    size_t keyword_min_chars = 4;        // "longer than 3 characters"
    size_t min_pattern_count = 3;        // Word/keyword/topic frequency for a rule

    float skill_confidence_above = 0.7f;
    int skill_priority = 2;

    size_t negative_window = 100;
    size_t negative_min_neurons = 3;
    size_t negative_word_min_chars = 5;  // "longer than 4 characters"
    size_t negative_top_words = 5;
    float negative_threshold = 0.3f;
    int negative_priority = 3;

    size_t high_window = 100;
    float high_confidence_above = 0.8f;
    size_t high_min_neurons = 5;
    size_t high_top_keywords = 3;
    float high_threshold = 0.8f;
    int high_priority = 1;

    size_t low_window = 50;
    float low_confidence_below = 0.4f;
    size_t low_min_neurons = 5;
    size_t low_scan_words = 5;
    size_t low_top_topics = 2;
    float low_threshold = 0.4f;
    int low_priority = 2;

    std::string snapshot_path = "instinct.json";  // Rule snapshot, written by auto_evolve
};

// Neurons grouped three ways. Keys are sorted for stable output.
struct PatternGroups {
    size_t neurons = 0;
    std::map<std::string, std::vector<Neuron>> by_skill;
    std::map<std::string, std::vector<Neuron>> by_mood;
    std::map<std::string, std::vector<Neuron>> by_keyword;
};

struct EvolutionResult {
    int64_t neurons_analyzed = 0;
    size_t rules_generated = 0;
    size_t rules_saved = 0;
    std::string message;
    std::vector<Rule> rules;             // Everything generated this pass
    std::string snapshot_path;           // Empty if auto_evolve short-circuited
};

inline json rule_to_json(const Rule& rule) {
    return {
        {"rule_text", rule.rule_text},
        {"trigger_pattern", rule.trigger_pattern},
        {"confidence_threshold", rule.confidence_threshold},
        {"priority", rule.priority},
        {"enabled", rule.enabled},
    };
}

class RuleMiner {
public:
    // The store must outlive the miner
    explicit RuleMiner(NeuronStore& store,
                       EvolutionConfig config = {},
                       std::shared_ptr<const KeywordExtractor> extractor =
                           std::make_shared<WhitespaceKeywordExtractor>())
        : store_(store), config_(std::move(config)), extractor_(std::move(extractor)) {}

    const EvolutionConfig& config() const { return config_; }

    void set_extractor(std::shared_ptr<const KeywordExtractor> extractor) {
        extractor_ = std::move(extractor);
    }

    PatternGroups analyze(size_t limit = 200) const {
        return group(store_.recent(limit));
    }

    std::vector<Rule> generate_rules(size_t min_occurrences = 3) const {
        // One read; the narrower windows are prefixes of it
        auto neurons = store_.recent(config_.analysis_window);
        auto groups = group(neurons);
        std::vector<Rule> rules;

        // 1. Skills that are reliably confident
        for (const auto& [skill, members] : groups.by_skill) {
            if (members.size() < min_occurrences) continue;

            float sum = 0.0f;
            for (const auto& n : members) sum += n.confidence;
            float avg = sum / static_cast<float>(members.size());

            if (avg > config_.skill_confidence_above) {
                rules.emplace_back("Use high confidence for " + skill + " tasks",
                                   "skill_id:" + skill, avg, config_.skill_priority);
            }
        }

        // 2. Words that keep showing up in disliked answers
        std::vector<std::string> negative_words;
        size_t negatives = 0;
        for (const auto& n : window(neurons, config_.negative_window)) {
            if (n.user_feedback >= 0) continue;
            ++negatives;
            append(negative_words, extractor_->extract_keywords(
                n.output_text, {config_.negative_word_min_chars, 0, 0}));
        }
        if (negatives >= config_.negative_min_neurons) {
            for (const auto& [word, count] : most_common(negative_words, config_.negative_top_words)) {
                if (count < config_.min_pattern_count) continue;
                rules.emplace_back("Avoid using '" + word + "' in responses (negative feedback pattern)",
                                   "avoid_word:" + word, config_.negative_threshold,
                                   config_.negative_priority);
            }
        }

        // 3. Input keywords behind confident answers
        std::vector<std::string> confident_keywords;
        size_t confident = 0;
        for (const auto& n : window(neurons, config_.high_window)) {
            if (n.confidence <= config_.high_confidence_above) continue;
            ++confident;
            append(confident_keywords, extractor_->extract_keywords(
                n.input_text, {config_.keyword_min_chars, 0, 0}));
        }
        if (confident >= config_.high_min_neurons) {
            for (const auto& [keyword, count] : most_common(confident_keywords, config_.high_top_keywords)) {
                if (count < config_.min_pattern_count) continue;
                rules.emplace_back("High confidence pattern detected for '" + keyword + "' queries",
                                   "keyword:" + keyword, config_.high_threshold,
                                   config_.high_priority);
            }
        }

        // 4. Topics where the answer was a guess
        std::vector<std::string> unsure_topics;
        size_t unsure = 0;
        for (const auto& n : window(neurons, config_.low_window)) {
            if (n.confidence >= config_.low_confidence_below) continue;
            ++unsure;
            append(unsure_topics, extractor_->extract_keywords(
                n.input_text, {config_.keyword_min_chars, config_.low_scan_words, 0}));
        }
        if (unsure >= config_.low_min_neurons) {
            for (const auto& [topic, count] : most_common(unsure_topics, config_.low_top_topics)) {
                if (count < config_.min_pattern_count) continue;
                rules.emplace_back("Ask clarification for '" + topic + "' topics (low confidence pattern)",
                                   "clarify:" + topic, config_.low_threshold,
                                   config_.low_priority);
            }
        }

        return rules;
    }

    // Insert each rule unless its rule_text is already stored.
    // Returns how many were actually inserted.
    size_t save_rules(const std::vector<Rule>& rules) {
        size_t saved = 0;
        for (const auto& rule : rules) {
            if (store_.insert_rule_if_absent(rule)) ++saved;
        }
        return saved;
    }

    // Human-readable snapshot of a rule set (written atomically)
    void export_snapshot(const std::vector<Rule>& rules, const std::string& path) const {
        json doc;
        doc["generated_at"] = format_timestamp(now());
        doc["rules_count"] = rules.size();
        doc["rules"] = json::array();
        for (const auto& r : rules) {
            doc["rules"].push_back(rule_to_json(r));
        }

        std::filesystem::path parent = std::filesystem::path(path).parent_path();
        if (!parent.empty()) {
            std::error_code ec;
            std::filesystem::create_directories(parent, ec);
            if (ec) throw StorageError("cannot create " + parent.string() + ": " + ec.message());
        }

        if (!safe_save(path, doc.dump(2) + "\n")) {
            throw StorageError("cannot write rule snapshot: " + path);
        }
        std::cerr << "[RuleMiner] Exported " << rules.size() << " rules to " << path << "\n";
    }

    // Full cycle: skip below min_neurons, otherwise generate → save → export
    EvolutionResult auto_evolve(int64_t min_neurons = 50) {
        EvolutionResult result;
        result.neurons_analyzed = store_.count();

        if (result.neurons_analyzed < min_neurons) {
            result.message = "Not enough neurons (" + std::to_string(result.neurons_analyzed) +
                             " < " + std::to_string(min_neurons) + ")";
            return result;
        }

        result.rules = generate_rules(config_.min_occurrences);
        result.rules_generated = result.rules.size();
        result.rules_saved = save_rules(result.rules);

        result.snapshot_path = config_.snapshot_path.empty() ? std::string("instinct.json")
                                                             : config_.snapshot_path;
        export_snapshot(result.rules, result.snapshot_path);

        result.message = "Generated " + std::to_string(result.rules_generated) +
                         " rules, saved " + std::to_string(result.rules_saved) + " new ones";
        std::cerr << "[RuleMiner] " << result.message << "\n";
        return result;
    }

private:
    PatternGroups group(const std::vector<Neuron>& neurons) const {
        PatternGroups groups;
        groups.neurons = neurons.size();

        for (const auto& n : neurons) {
            if (n.skill_id && !n.skill_id->empty()) {
                groups.by_skill[*n.skill_id].push_back(n);
            }
            groups.by_mood[mood_name(n.mood)].push_back(n);

            // Fan out into buckets for the first few keywords, once per bucket
            auto keywords = extractor_->extract_keywords(
                n.input_text, {config_.keyword_min_chars, 0, config_.analysis_keywords});
            std::unordered_set<std::string> placed;
            for (const auto& kw : keywords) {
                if (placed.insert(kw).second) {
                    groups.by_keyword[kw].push_back(n);
                }
            }
        }
        return groups;
    }

    // Newest `size` neurons of an already newest-first list
    static std::vector<Neuron> window(const std::vector<Neuron>& neurons, size_t size) {
        if (neurons.size() <= size) return neurons;
        return std::vector<Neuron>(neurons.begin(), neurons.begin() + static_cast<std::ptrdiff_t>(size));
    }

    static void append(std::vector<std::string>& into, std::vector<std::string> more) {
        for (auto& s : more) into.push_back(std::move(s));
    }

    // Top n by count; ties keep first-seen order
    static std::vector<std::pair<std::string, size_t>> most_common(
        const std::vector<std::string>& tokens, size_t n)
    {
        std::unordered_map<std::string, size_t> counts;
        std::vector<std::string> order;
        for (const auto& t : tokens) {
            if (counts[t]++ == 0) order.push_back(t);
        }

        std::vector<std::pair<std::string, size_t>> ranked;
        ranked.reserve(order.size());
        for (const auto& t : order) {
            ranked.emplace_back(t, counts[t]);
        }
        std::stable_sort(ranked.begin(), ranked.end(),
            [](const auto& a, const auto& b) { return a.second > b.second; });

        if (ranked.size() > n) ranked.resize(n);
        return ranked;
    }

    NeuronStore& store_;
    EvolutionConfig config_;
    std::shared_ptr<const KeywordExtractor> extractor_;
};

} // namespace evomemory
