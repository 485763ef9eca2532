/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading/saving pipeline configuration (settings.json).
 *
 * Provides a unified way to read the tunables of every stage without
 * scattering JSON parsing logic throughout the codebase.
 */

#pragma once

#include <string>
#include "application/PipelineConfig.hpp"

namespace docweave::infrastructure {

class ConfigLoader {
public:
    /**
     * @brief Reads a settings file into a PipelineConfig.
     * @param path Path to settings.json.
     * @return The parsed config. Missing keys keep their defaults; a missing or
     *         malformed file yields the defaults.
     */
    static application::PipelineConfig Load(const std::string& path);

    /**
     * @brief Writes the config to a settings file, preserving keys it does not know.
     * @return False if the file could not be written.
     */
    static bool Save(const std::string& path, const application::PipelineConfig& config);
};

} // namespace docweave::infrastructure
