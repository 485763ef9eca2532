/**
 * @file FileSystemArtifactScanner.cpp
 * @brief Implementation of the FileSystemArtifactScanner.
 */

#include "infrastructure/FileSystemArtifactScanner.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <sstream>
#include <iostream>

namespace fs = std::filesystem;

namespace docweave::infrastructure {

namespace {

bool endsWith(const std::string& value, const std::string& suffix) {
    return value.size() >= suffix.size() && value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

FileSystemArtifactScanner::FileSystemArtifactScanner(const std::string& inboxPath)
    : m_inboxPath(inboxPath) {}

std::vector<domain::SourceArtifact> FileSystemArtifactScanner::scan() {
    std::vector<domain::SourceArtifact> artifacts;

    std::error_code ec;
    if (!fs::exists(m_inboxPath, ec)) {
        return artifacts;
    }

    for (const auto& entry : fs::directory_iterator(m_inboxPath, ec)) {
        if (!entry.is_regular_file()) continue;

        std::string filename = entry.path().filename().string();
        std::string ext = entry.path().extension().string();
        std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c){ return std::tolower(c); });

        if (classifyByExtension(ext) == domain::SourceFormat::Unknown) continue;
        if (filename.empty() || filename[0] == '.' || filename == "settings.json" || endsWith(filename, ".result.json")) {
            continue;
        }

        domain::SourceArtifact artifact;
        artifact.path = entry.path().string();
        artifact.filename = filename;
        artifact.documentId = entry.path().stem().string();
        artifact.format = classifyByExtension(ext);

        auto ftime = fs::last_write_time(entry);
        artifact.lastModified = std::chrono::time_point_cast<std::chrono::system_clock::duration>(
            ftime - fs::file_time_type::clock::now() + std::chrono::system_clock::now()
        );

        artifact.sizeBytes = static_cast<long long>(fs::file_size(entry));

        std::stringstream ss;
        ss << artifact.sizeBytes << "_" << artifact.lastModified.time_since_epoch().count();
        artifact.contentHash = ss.str();

        artifacts.push_back(artifact);
    }
    if (ec) {
        std::cerr << "[FileSystemArtifactScanner] Error scanning " << m_inboxPath << ": " << ec.message() << std::endl;
    }

    std::sort(artifacts.begin(), artifacts.end(), [](const auto& a, const auto& b) {
        return a.filename < b.filename;
    });
    return artifacts;
}

domain::SourceFormat FileSystemArtifactScanner::classifyByExtension(const std::string& extension) const {
    if (extension == ".json") return domain::SourceFormat::ParsedTreeJson;
    return domain::SourceFormat::Unknown;
}

} // namespace docweave::infrastructure
