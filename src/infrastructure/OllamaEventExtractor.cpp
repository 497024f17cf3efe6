/**
 * @file OllamaEventExtractor.cpp
 * @brief Implementation of OllamaEventExtractor.
 */

#include "infrastructure/OllamaEventExtractor.hpp"

#include <algorithm>
#include <iostream>
#include <sstream>
#include <nlohmann/json.hpp>
#include "domain/Errors.hpp"
#include "infrastructure/ExtractionResponseParser.hpp"

namespace schedsync::infrastructure {

using json = nlohmann::json;

namespace {
// Bodies are cut to keep a batch inside the model's context window.
constexpr size_t kMaxBodyBytes = 4000;

bool IsContinuationByte(char c) {
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

// Invalid sequences become U+FFFD so one badly encoded mail cannot poison the batch request.
std::string ToValidUtf8(const std::string& text) {
    return json::parse(json(text).dump(-1, ' ', false, json::error_handler_t::replace)).get<std::string>();
}
} // namespace

OllamaEventExtractor::OllamaEventExtractor(OllamaSettings settings)
    : m_settings(std::move(settings)), m_model(m_settings.model) {}

void OllamaEventExtractor::initialize() {
    OllamaClient client(m_settings.host, m_settings.port, m_settings.readTimeoutSeconds);
    auto models = client.listModels();
    if (models.empty()) {
        std::cerr << "[OllamaEventExtractor] Failed to list models at " << client.endpoint()
                  << ". Is Ollama running? Keeping: " << currentModel() << std::endl;
        return;
    }

    std::lock_guard<std::mutex> lock(m_modelMutex);
    auto match = std::find_if(models.begin(), models.end(),
                              [this](const std::string& name) { return name.find(m_model) != std::string::npos; });
    if (match != models.end()) {
        m_model = *match;
        std::cout << "[OllamaEventExtractor] Using model: " << m_model << std::endl;
    } else {
        std::cerr << "[OllamaEventExtractor] Model " << m_model << " not installed, falling back to " << models.front()
                  << std::endl;
        m_model = models.front();
    }
}

std::string OllamaEventExtractor::currentModel() const {
    std::lock_guard<std::mutex> lock(m_modelMutex);
    return m_model;
}

std::string OllamaEventExtractor::SystemPrompt() {
    return
        "You read emails sent to university students and extract scheduling facts.\n"
        "For every numbered email return exactly one item:\n"
        "- type \"interview\": a company hiring round. Fields: company, datetime (YYYY-MM-DDTHH:MM), "
        "stage (\"OA\" for an online assessment or test, otherwise \"Interview\").\n"
        "- type \"reschedule\": a class that must move. Fields: subject, date (YYYY-MM-DD), "
        "start (HH:MM), end (HH:MM) of the requested window.\n"
        "- type \"none\": anything else.\n"
        "Do not invent companies, subjects or dates that are not written in the email.\n"
        "Respond ONLY with JSON of the form:\n"
        "{\"events\": [{\"index\": 0, \"type\": \"none\"}]}";
}

std::string OllamaEventExtractor::BuildPrompt(const std::vector<std::string>& bodies) {
    std::ostringstream ss;
    ss << "Emails (" << bodies.size() << "):\n";
    for (size_t i = 0; i < bodies.size(); ++i) {
        ss << "\n### Email " << i << "\n";
        const std::string& body = bodies[i];
        if (body.size() > kMaxBodyBytes) {
            size_t cut = kMaxBodyBytes;
            while (cut > 0 && IsContinuationByte(body[cut])) --cut;
            ss << ToValidUtf8(body.substr(0, cut)) << "\n[truncated]";
        } else {
            ss << ToValidUtf8(body);
        }
        ss << "\n";
    }
    return ss.str();
}

std::vector<domain::ScheduleEvent> OllamaEventExtractor::extract(const std::vector<std::string>& bodies) {
    if (bodies.empty()) return {};

    OllamaClient client(m_settings.host, m_settings.port, m_settings.readTimeoutSeconds);
    GenerateRequest request;
    request.model = currentModel();
    request.system = SystemPrompt();
    request.prompt = BuildPrompt(bodies);
    request.jsonFormat = true;

    auto result = client.generate(request);
    if (!result.ok) {
        throw domain::ExtractionFailure("batch of " + std::to_string(bodies.size()) + ": " + result.error);
    }
    return ExtractionResponseParser::Parse(result.text, bodies.size());
}

} // namespace schedsync::infrastructure
