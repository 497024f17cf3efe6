/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading application configuration (settings.json).
 *
 * Provides a unified way to access pipeline tunables and file locations
 * without scattering JSON parsing logic throughout the codebase.
 */

#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "application/PipelineConfig.hpp"
#include "infrastructure/OllamaEventExtractor.hpp"

namespace schedsync::infrastructure {

/**
 * @struct AppSettings
 * @brief Everything read from settings.json. Paths are absolute after loading.
 */
struct AppSettings {
    application::PipelineConfig pipeline;
    OllamaSettings ollama;
    std::string mailboxRoot;
    std::string storeFile;
    std::string studentsFile;
    std::string reportFile;
};

class ConfigLoader {
public:
    /**
     * @brief Reads <projectRoot>/settings.json. A missing file yields defaults.
     * @throws domain::ConfigError on malformed JSON or out-of-range values.
     */
    static AppSettings Load(const std::string& projectRoot);

    /** @brief Applies the keys present in @p j over defaults rooted at @p projectRoot. */
    static AppSettings FromJson(const nlohmann::json& j, const std::string& projectRoot);
};

} // namespace schedsync::infrastructure
