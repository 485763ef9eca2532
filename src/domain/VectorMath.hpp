/**
 * @file VectorMath.hpp
 * @brief Similarity and dispersion helpers shared by the scoring stages.
 */

#pragma once
#include <vector>
#include <cmath>

namespace docweave::domain {

/**
 * @brief Cosine similarity of two embeddings.
 * @return Value in [-1,1]; 0 when the vectors differ in length, are empty, or have zero norm.
 */
inline float cosineSimilarity(const std::vector<float>& v1, const std::vector<float>& v2) {
    if (v1.size() != v2.size() || v1.empty()) return 0.0f;
    float dot = 0, n1 = 0, n2 = 0;
    for (size_t i = 0; i < v1.size(); ++i) {
        dot += v1[i] * v2[i];
        n1 += v1[i] * v1[i];
        n2 += v2[i] * v2[i];
    }
    float norm = std::sqrt(n1) * std::sqrt(n2);
    return (norm > 0) ? (dot / norm) : 0.0f;
}

inline double mean(const std::vector<double>& values) {
    if (values.empty()) return 0.0;
    double sum = 0.0;
    for (double v : values) sum += v;
    return sum / static_cast<double>(values.size());
}

/** @brief Population variance, 0 for an empty input. */
inline double variance(const std::vector<double>& values) {
    if (values.empty()) return 0.0;
    double m = mean(values);
    double acc = 0.0;
    for (double v : values) acc += (v - m) * (v - m);
    return acc / static_cast<double>(values.size());
}

/** @brief Component-wise mean of equally sized vectors; empty if the input is. */
inline std::vector<float> centroid(const std::vector<std::vector<float>>& members) {
    if (members.empty()) return {};
    std::vector<float> out(members.front().size(), 0.0f);
    size_t counted = 0;
    for (const auto& m : members) {
        if (m.size() != out.size()) continue;
        for (size_t i = 0; i < m.size(); ++i) out[i] += m[i];
        ++counted;
    }
    if (counted == 0) return out;
    for (auto& v : out) v /= static_cast<float>(counted);
    return out;
}

/**
 * @brief Mean cosine similarity of the members to a centroid.
 * @return 0 for an empty member set.
 */
inline double clusterCoherence(const std::vector<std::vector<float>>& members, const std::vector<float>& center) {
    if (members.empty()) return 0.0;
    double sum = 0.0;
    for (const auto& m : members) sum += cosineSimilarity(m, center);
    return sum / static_cast<double>(members.size());
}

} // namespace docweave::domain
