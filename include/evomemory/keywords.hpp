#pragma once
// Keyword extraction for rule mining
//
// Ad hoc tokenization, not NLP. RuleMiner only sees the interface.

#include "text.hpp"
#include <string>
#include <vector>

namespace evomemory {

struct KeywordOptions {
    size_t min_chars = 4;     // Keep tokens with at least this many code points
    size_t scan_words = 0;    // Only look at the first N words (0 = all)
    size_t max_keywords = 0;  // Stop after N keywords (0 = no limit)
};

class KeywordExtractor {
public:
    virtual ~KeywordExtractor() = default;

    // Significant tokens of `text` in order of appearance, duplicates kept
    virtual std::vector<std::string> extract_keywords(
        const std::string& text, const KeywordOptions& options) const = 0;

    std::vector<std::string> extract_keywords(const std::string& text) const {
        return extract_keywords(text, KeywordOptions{});
    }
};

// Lower-cased whitespace words, filtered by length.
// Punctuation stays attached ("led?" and "led" are different keywords).
class WhitespaceKeywordExtractor : public KeywordExtractor {
public:
    using KeywordExtractor::extract_keywords;

    std::vector<std::string> extract_keywords(
        const std::string& text, const KeywordOptions& options) const override {
        auto words = split_words(to_lower(text));
        if (options.scan_words > 0 && words.size() > options.scan_words) {
            words.resize(options.scan_words);
        }

        std::vector<std::string> keywords;
        for (auto& w : words) {
            if (utf8_length(w) < options.min_chars) continue;
            keywords.push_back(std::move(w));
            if (options.max_keywords > 0 && keywords.size() >= options.max_keywords) break;
        }
        return keywords;
    }
};

} // namespace evomemory
