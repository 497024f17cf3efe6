/**
 * @file OllamaEventExtractor.hpp
 * @brief EventExtractor backed by a local Ollama server.
 */

#pragma once

#include <memory>
#include <mutex>
#include <string>
#include "domain/EventExtractor.hpp"
#include "infrastructure/OllamaClient.hpp"

namespace schedsync::infrastructure {

struct OllamaSettings {
    std::string host = "localhost";
    int port = 11434;
    std::string model = "qwen2.5:7b";
    int readTimeoutSeconds = 120;
};

/**
 * @class OllamaEventExtractor
 * @brief Sends a whole batch in one prompt and parses one event per message.
 */
class OllamaEventExtractor : public domain::EventExtractor {
public:
    explicit OllamaEventExtractor(OllamaSettings settings);

    /** @brief Checks the server and falls back to an installed model if the configured one is absent. */
    void initialize() override;

    std::vector<domain::ScheduleEvent> extract(const std::vector<std::string>& bodies) override;

    /**
     * @brief The prompt sent for @p bodies (exposed for tests and diagnostics).
     *
     * Always valid UTF-8: long bodies are cut on a character boundary and
     * undecodable bytes are replaced.
     */
    static std::string BuildPrompt(const std::vector<std::string>& bodies);
    static std::string SystemPrompt();

private:
    std::string currentModel() const;

    OllamaSettings m_settings;
    mutable std::mutex m_modelMutex;
    std::string m_model;
};

} // namespace schedsync::infrastructure
