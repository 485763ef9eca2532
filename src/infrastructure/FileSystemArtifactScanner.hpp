/**
 * @file FileSystemArtifactScanner.hpp
 * @brief Scanner for detecting parsed-tree documents in the inbox.
 */

#pragma once
#include <vector>
#include <string>
#include "domain/SourceArtifact.hpp"

namespace docweave::infrastructure {

/**
 * @class FileSystemArtifactScanner
 * @brief Infrastructure adapter to scan an inbox directory for *.json trees.
 *
 * Result files (*.result.json), hidden files and settings.json are ignored so
 * the inbox may double as the output directory.
 */
class FileSystemArtifactScanner {
public:
    explicit FileSystemArtifactScanner(const std::string& inboxPath);

    /**
     * @brief Scans for artifacts.
     * @return SourceArtifacts sorted by filename.
     */
    std::vector<domain::SourceArtifact> scan();

private:
    std::string m_inboxPath;

    domain::SourceFormat classifyByExtension(const std::string& extension) const;
};

} // namespace docweave::infrastructure
