/**
 * @file OllamaClient.hpp
 * @brief Low-level HTTP client for the Ollama REST API.
 */

#pragma once

#include <string>
#include <vector>

namespace schedsync::infrastructure {

/**
 * @struct GenerateRequest
 * @brief One non-streaming /api/generate call.
 */
struct GenerateRequest {
    std::string model;
    std::string system;
    std::string prompt;
    bool jsonFormat = true; ///< Sets "format": "json".
};

/**
 * @struct GenerateResult
 * @brief Model text on success, otherwise a one-line reason.
 */
struct GenerateResult {
    bool ok = false;
    std::string text;
    std::string error;
};

class OllamaClient {
public:
    OllamaClient(std::string host, int port, int readTimeoutSeconds);

    /**
     * @brief Runs a completion with temperature 0 and a fixed seed.
     *
     * Transport, HTTP and body errors are reported in the result, never thrown.
     */
    GenerateResult generate(const GenerateRequest& request) const;

    /** @brief Installed model names from /api/tags; empty if the server is unreachable. */
    std::vector<std::string> listModels() const;

    std::string endpoint() const { return m_host + ":" + std::to_string(m_port); }

private:
    std::string m_host;
    int m_port;
    int m_readTimeoutSeconds;
};

} // namespace schedsync::infrastructure
