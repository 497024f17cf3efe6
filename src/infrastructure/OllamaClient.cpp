#include "infrastructure/OllamaClient.hpp"
#include <httplib.h>
#include <iostream>
#include <nlohmann/json.hpp>

namespace schedsync::infrastructure {

using json = nlohmann::json;

namespace {
constexpr int kConnectTimeoutSeconds = 5;
constexpr int kListTimeoutSeconds = 5;
constexpr int kSeed = 42;
constexpr size_t kMaxLoggedBody = 200;

std::string Clip(const std::string& text) {
    return text.size() > kMaxLoggedBody ? text.substr(0, kMaxLoggedBody) + "..." : text;
}
} // namespace

OllamaClient::OllamaClient(std::string host, int port, int readTimeoutSeconds)
    : m_host(std::move(host)), m_port(port), m_readTimeoutSeconds(readTimeoutSeconds) {}

GenerateResult OllamaClient::generate(const GenerateRequest& request) const {
    GenerateResult result;

    httplib::Client cli(m_host, m_port);
    cli.set_connection_timeout(kConnectTimeoutSeconds);
    cli.set_read_timeout(m_readTimeoutSeconds);

    json payload = {
        {"model", request.model},
        {"system", request.system},
        {"prompt", request.prompt},
        {"stream", false},
        {"options", {{"temperature", 0.0}, {"top_p", 1.0}, {"seed", kSeed}}}
    };
    if (request.jsonFormat) payload["format"] = "json";

    const std::string requestBody = payload.dump(-1, ' ', false, json::error_handler_t::replace);
    auto res = cli.Post("/api/generate", requestBody, "application/json");
    if (!res) {
        result.error = "cannot reach " + endpoint() + " (httplib error " + std::to_string(static_cast<int>(res.error())) + ")";
    } else if (res->status != 200) {
        result.error = "HTTP " + std::to_string(res->status) + " from " + endpoint() + ": " + Clip(res->body);
    } else {
        try {
            auto body = json::parse(res->body);
            auto it = body.find("response");
            if (it != body.end() && it->is_string()) {
                result.ok = true;
                result.text = it->get<std::string>();
            } else {
                result.error = "reply carries no 'response' text";
            }
        } catch (const json::exception& e) {
            result.error = std::string("unparseable reply: ") + e.what();
        }
    }

    if (!result.ok) {
        std::cerr << "[OllamaClient] generate(" << request.model << ") failed: " << result.error << std::endl;
    }
    return result;
}

std::vector<std::string> OllamaClient::listModels() const {
    httplib::Client cli(m_host, m_port);
    cli.set_connection_timeout(kConnectTimeoutSeconds);
    cli.set_read_timeout(kListTimeoutSeconds);

    std::vector<std::string> names;
    auto res = cli.Get("/api/tags");
    if (!res || res->status != 200) return names;

    try {
        for (const auto& model : json::parse(res->body).value("models", json::array())) {
            if (model.contains("name") && model["name"].is_string()) {
                names.push_back(model["name"].get<std::string>());
            }
        }
    } catch (const json::exception& e) {
        std::cerr << "[OllamaClient] Bad model list from " << endpoint() << ": " << e.what() << std::endl;
    }
    return names;
}

} // namespace schedsync::infrastructure
