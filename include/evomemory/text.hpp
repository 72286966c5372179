#pragma once
// Text helpers shared by the store, scorer, index and miner
//
// Byte-oriented: retrieval case folding is ASCII only, context hashing also
// folds Latin-1 capitals, and lengths that users see (thresholds,
// truncation) are counted in UTF-8 code points.

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <stdexcept>
#include <string>
#include <vector>

#include <openssl/evp.h>

namespace evomemory {

inline bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

inline std::string to_lower(const std::string& text) {
    std::string out = text;
    for (auto& c : out) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

// ASCII plus the Latin-1 Supplement capitals U+00C0..U+00DE (not U+00D7),
// which cover the accented letters of Italian
inline std::string to_lower_latin1(const std::string& text) {
    std::string out = to_lower(text);
    for (size_t i = 0; i + 1 < out.size(); ++i) {
        auto lead = static_cast<unsigned char>(out[i]);
        auto next = static_cast<unsigned char>(out[i + 1]);
        if (lead == 0xC3 && next >= 0x80 && next <= 0x9E && next != 0x97) {
            out[i + 1] = static_cast<char>(next + 0x20);
            ++i;
        }
    }
    return out;
}

inline std::string trim(const std::string& text) {
    size_t begin = 0;
    size_t end = text.size();
    while (begin < end && is_space(text[begin])) ++begin;
    while (end > begin && is_space(text[end - 1])) --end;
    return text.substr(begin, end - begin);
}

// Split on runs of whitespace, dropping empty pieces
inline std::vector<std::string> split_words(const std::string& text) {
    std::vector<std::string> words;
    std::string current;
    for (char c : text) {
        if (is_space(c)) {
            if (!current.empty()) {
                words.push_back(std::move(current));
                current.clear();
            }
        } else {
            current += c;
        }
    }
    if (!current.empty()) words.push_back(std::move(current));
    return words;
}

// Number of code points (continuation bytes are not counted)
inline size_t utf8_length(const std::string& text) {
    size_t n = 0;
    for (char c : text) {
        if ((static_cast<unsigned char>(c) & 0xC0) != 0x80) ++n;
    }
    return n;
}

// First max_chars code points, never splitting a multi-byte sequence
inline std::string utf8_truncate(const std::string& text, size_t max_chars) {
    size_t chars = 0;
    for (size_t i = 0; i < text.size(); ++i) {
        if ((static_cast<unsigned char>(text[i]) & 0xC0) != 0x80) {
            if (chars == max_chars) return text.substr(0, i);
            ++chars;
        }
    }
    return text;
}

// Retrieval terms: whitespace split, lower-cased, with ASCII punctuation
// stripped from both ends so "LED?" and "led" are the same term
inline std::vector<std::string> tokenize(const std::string& text) {
    std::vector<std::string> tokens;
    for (auto& word : split_words(to_lower(text))) {
        auto is_edge = [](char c) {
            auto u = static_cast<unsigned char>(c);
            return u < 0x80 && std::ispunct(u);
        };
        size_t begin = 0;
        size_t end = word.size();
        while (begin < end && is_edge(word[begin])) ++begin;
        while (end > begin && is_edge(word[end - 1])) --end;
        if (end > begin) tokens.push_back(word.substr(begin, end - begin));
    }
    return tokens;
}

inline std::string md5_hex(const std::string& data) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (EVP_Digest(data.data(), data.size(), digest, &len, EVP_md5(), nullptr) != 1) {
        throw std::runtime_error("MD5 digest unavailable in libcrypto");
    }

    std::string hex;
    hex.reserve(len * 2);
    char buf[3];
    for (unsigned int i = 0; i < len; ++i) {
        std::snprintf(buf, sizeof(buf), "%02x", digest[i]);
        hex += buf;
    }
    return hex;
}

// Approximate-match bucket: first 8 hex chars of md5(lower(trim(text))).
// Not a security primitive.
inline std::string context_hash(const std::string& text) {
    return md5_hex(to_lower_latin1(trim(text))).substr(0, 8);
}

} // namespace evomemory
