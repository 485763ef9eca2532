/**
 * @file TextNormalizer.hpp
 * @brief Small string helpers used by the lexical scoring rules.
 */

#pragma once
#include <string>
#include <vector>
#include <set>
#include <cctype>
#include <sstream>

namespace docweave::domain {

inline std::string toLower(std::string text) {
    for (auto& c : text) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return text;
}

inline std::string trim(const std::string& text) {
    size_t start = 0;
    while (start < text.size() && std::isspace(static_cast<unsigned char>(text[start]))) ++start;
    size_t end = text.size();
    while (end > start && std::isspace(static_cast<unsigned char>(text[end - 1]))) --end;
    return text.substr(start, end - start);
}

/**
 * @brief Collapses runs of spaces and tabs into one space and trims each line.
 *
 * Line breaks are kept: a single trailing newline survives so that paragraph
 * breaks remain visible to the boundary detector.
 */
inline std::string normalizeWhitespace(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    bool pendingSpace = false;
    for (char c : text) {
        if (c == '\r') continue;
        if (c == '\n') {
            while (!out.empty() && out.back() == ' ') out.pop_back();
            if (out.empty() || (out.size() >= 2 && out[out.size() - 1] == '\n' && out[out.size() - 2] == '\n')) {
                pendingSpace = false;
                continue;
            }
            out += '\n';
            pendingSpace = false;
            continue;
        }
        if (c == ' ' || c == '\t') {
            pendingSpace = !out.empty() && out.back() != '\n';
            continue;
        }
        if (pendingSpace) out += ' ';
        pendingSpace = false;
        out += c;
    }
    return out;
}

/** @brief Whitespace-separated tokens. */
inline std::vector<std::string> splitWords(const std::string& text) {
    std::vector<std::string> words;
    std::istringstream ss(text);
    std::string w;
    while (ss >> w) words.push_back(w);
    return words;
}

/**
 * @brief Lower-cased alphanumeric tokens longer than two characters.
 */
inline std::set<std::string> wordSet(const std::string& text) {
    std::set<std::string> words;
    std::string current;
    auto flush = [&]() {
        if (current.size() > 2) words.insert(current);
        current.clear();
    };
    for (char c : text) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc)) {
            current += static_cast<char>(std::tolower(uc));
        } else {
            flush();
        }
    }
    flush();
    return words;
}

/** @brief Jaccard index of two sets; 0 when both are empty. */
inline double jaccard(const std::set<std::string>& a, const std::set<std::string>& b) {
    if (a.empty() && b.empty()) return 0.0;
    size_t inter = 0;
    for (const auto& w : a) {
        if (b.count(w)) ++inter;
    }
    size_t uni = a.size() + b.size() - inter;
    return uni == 0 ? 0.0 : static_cast<double>(inter) / static_cast<double>(uni);
}

inline bool containsIgnoreCase(const std::string& haystack, const std::string& needle) {
    if (needle.empty()) return false;
    return toLower(haystack).find(toLower(needle)) != std::string::npos;
}

} // namespace docweave::domain
