/**
 * @file SourceArtifact.hpp
 * @brief Domain entity representing a parsed-tree file waiting in the inbox.
 */

#pragma once
#include <string>
#include <chrono>

namespace docweave::domain {

/**
 * @enum SourceFormat
 * @brief Serialization of the parsed element tree.
 */
enum class SourceFormat {
    ParsedTreeJson,
    Unknown
};

/**
 * @class SourceArtifact
 * @brief Entity representing a physical file detected in the inbox.
 */
class SourceArtifact {
public:
    std::string path;              ///< Full path of the file.
    std::string filename;          ///< Basename of the file.
    std::string documentId;        ///< Basename without extension.
    SourceFormat format;
    std::string contentHash;       ///< To detect changes.
    std::chrono::system_clock::time_point lastModified;
    long long sizeBytes;

    SourceArtifact() : format(SourceFormat::Unknown), sizeBytes(0) {}
};

} // namespace docweave::domain
