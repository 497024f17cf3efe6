/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include "domain/Errors.hpp"

namespace schedsync::infrastructure {

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

long long ReadInteger(const json& j, const char* key, long long fallback, long long minimum) {
    if (!j.contains(key)) return fallback;
    const json& value = j.at(key);
    if (!value.is_number_integer()) {
        throw domain::ConfigError(std::string("settings.json: '") + key + "' must be an integer");
    }
    const long long parsed = value.get<long long>();
    if (parsed < minimum) {
        throw domain::ConfigError(std::string("settings.json: '") + key + "' must be >= " + std::to_string(minimum));
    }
    return parsed;
}

std::string ReadString(const json& j, const char* key, const std::string& fallback) {
    if (!j.contains(key)) return fallback;
    if (!j.at(key).is_string()) {
        throw domain::ConfigError(std::string("settings.json: '") + key + "' must be a string");
    }
    return j.at(key).get<std::string>();
}

std::string ResolvePath(const std::string& projectRoot, const std::string& path) {
    if (path.empty()) return path;
    fs::path p(path);
    if (p.is_absolute()) return p.string();
    return (fs::path(projectRoot) / p).string();
}

} // namespace

AppSettings ConfigLoader::FromJson(const json& j, const std::string& projectRoot) {
    if (!j.is_object()) {
        throw domain::ConfigError("settings.json must hold a JSON object");
    }

    AppSettings settings;
    auto& p = settings.pipeline;

    p.mailboxConcurrency = static_cast<size_t>(ReadInteger(j, "mailbox_concurrency", p.mailboxConcurrency, 1));
    p.extractionConcurrency = static_cast<size_t>(ReadInteger(j, "extraction_concurrency", p.extractionConcurrency, 1));
    p.batchSize = static_cast<size_t>(ReadInteger(j, "batch_size", p.batchSize, 1));
    p.fetchTimeout = std::chrono::milliseconds(ReadInteger(j, "fetch_timeout_ms", p.fetchTimeout.count(), 0));
    p.extractionTimeout =
        std::chrono::milliseconds(ReadInteger(j, "extraction_timeout_ms", p.extractionTimeout.count(), 0));
    p.maxFetchAttempts = static_cast<size_t>(ReadInteger(j, "max_fetch_attempts", p.maxFetchAttempts, 1));
    p.fetchBackoff = std::chrono::milliseconds(ReadInteger(j, "fetch_backoff_ms", p.fetchBackoff.count(), 0));
    p.maxExtractionAttempts =
        static_cast<size_t>(ReadInteger(j, "max_extraction_attempts", p.maxExtractionAttempts, 1));
    p.slotCapacity = static_cast<size_t>(ReadInteger(j, "slot_capacity", p.slotCapacity, 1));

    if (j.contains("dedup")) {
        const json& dedup = j.at("dedup");
        if (!dedup.is_object()) {
            throw domain::ConfigError("settings.json: 'dedup' must be an object");
        }
        p.dedupRetention.maxEntriesPerIdentity = static_cast<size_t>(
            ReadInteger(dedup, "max_entries_per_identity", p.dedupRetention.maxEntriesPerIdentity, 0));
        p.dedupRetention.maxAge =
            std::chrono::hours(24 * ReadInteger(dedup, "max_age_days", p.dedupRetention.maxAge.count() / 24, 0));
        p.dedupWarmStartFile = ResolvePath(projectRoot, ReadString(dedup, "warm_start_file", ""));
    }

    if (j.contains("ollama")) {
        const json& ollama = j.at("ollama");
        if (!ollama.is_object()) {
            throw domain::ConfigError("settings.json: 'ollama' must be an object");
        }
        settings.ollama.host = ReadString(ollama, "host", settings.ollama.host);
        settings.ollama.port = static_cast<int>(ReadInteger(ollama, "port", settings.ollama.port, 1));
        settings.ollama.model = ReadString(ollama, "model", settings.ollama.model);
    }
    // The HTTP read timeout follows the extraction deadline, rounded up to whole seconds.
    const auto timeoutMs = p.extractionTimeout.count();
    settings.ollama.readTimeoutSeconds = timeoutMs <= 0 ? 600 : static_cast<int>((timeoutMs + 999) / 1000);

    settings.mailboxRoot = ResolvePath(projectRoot, ReadString(j, "mailbox_root", "mailboxes"));
    settings.storeFile = ResolvePath(projectRoot, ReadString(j, "store_file", "schedule_store.json"));
    settings.studentsFile = ResolvePath(projectRoot, ReadString(j, "students_file", "students.json"));
    settings.reportFile = ResolvePath(projectRoot, ReadString(j, "report_file", "run_report.json"));
    return settings;
}

AppSettings ConfigLoader::Load(const std::string& projectRoot) {
    fs::path configPath = fs::path(projectRoot) / "settings.json";
    if (!fs::exists(configPath)) {
        std::cout << "[ConfigLoader] No settings.json in " << projectRoot << ", using defaults" << std::endl;
        return FromJson(json::object(), projectRoot);
    }

    json j;
    try {
        std::ifstream f(configPath);
        f >> j;
    } catch (const std::exception& e) {
        throw domain::ConfigError(std::string("Error reading settings.json: ") + e.what());
    }
    return FromJson(j, projectRoot);
}

} // namespace schedsync::infrastructure
