#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

#include <nlohmann/json.hpp>
#include "domain/Errors.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/StudentDirectory.hpp"

using namespace schedsync;
using namespace schedsync::infrastructure;
namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

fs::path FreshRoot() {
    auto root = fs::temp_directory_path() / "schedsync_config_test";
    fs::remove_all(root);
    fs::create_directories(root);
    return root;
}

bool RejectsSettings(const json& j) {
    try {
        ConfigLoader::FromJson(j, "/srv/schedsync");
    } catch (const domain::ConfigError&) {
        return true;
    }
    return false;
}

void TestDefaults() {
    auto root = FreshRoot();
    auto settings = ConfigLoader::Load(root.string());
    assert(settings.pipeline.mailboxConcurrency == 10);
    assert(settings.pipeline.batchSize == 5);
    assert(settings.pipeline.slotCapacity == 30);
    assert(settings.pipeline.dedupWarmStartFile.empty());
    assert(settings.ollama.readTimeoutSeconds == 120);
    assert(settings.storeFile == (root / "schedule_store.json").string());
    assert(settings.mailboxRoot == (root / "mailboxes").string());
    fs::remove_all(root);
    std::cout << "[PASS] Defaults without settings.json." << std::endl;
}

void TestOverrides() {
    json j = {
        {"mailbox_concurrency", 3},
        {"extraction_concurrency", 2},
        {"batch_size", 8},
        {"extraction_timeout_ms", 4500},
        {"max_fetch_attempts", 5},
        {"fetch_backoff_ms", 0},
        {"slot_capacity", 12},
        {"dedup", {{"max_entries_per_identity", 100}, {"max_age_days", 7}, {"warm_start_file", "dedup.json"}}},
        {"ollama", {{"host", "inference.local"}, {"port", 8080}, {"model", "llama3"}}},
        {"store_file", "/var/lib/schedsync/store.json"},
        {"students_file", "cohort.json"},
    };
    auto settings = ConfigLoader::FromJson(j, "/srv/schedsync");
    const auto& p = settings.pipeline;
    assert(p.mailboxConcurrency == 3);
    assert(p.extractionConcurrency == 2);
    assert(p.batchSize == 8);
    assert(p.maxFetchAttempts == 5);
    assert(p.fetchBackoff.count() == 0);
    assert(p.slotCapacity == 12);
    assert(p.dedupRetention.maxEntriesPerIdentity == 100);
    assert(p.dedupRetention.maxAge == std::chrono::hours(24 * 7));
    assert(p.dedupWarmStartFile == (fs::path("/srv/schedsync") / "dedup.json").string());
    assert(settings.ollama.host == "inference.local");
    assert(settings.ollama.port == 8080);
    assert(settings.ollama.model == "llama3");
    assert(settings.ollama.readTimeoutSeconds == 5 && "Read timeout rounds the extraction deadline up.");
    assert(settings.storeFile == "/var/lib/schedsync/store.json" && "Absolute paths are kept.");
    assert(settings.studentsFile == (fs::path("/srv/schedsync") / "cohort.json").string());
    std::cout << "[PASS] Overrides." << std::endl;
}

void TestRejectsBadValues() {
    assert(RejectsSettings(json::array()));
    assert(RejectsSettings({{"mailbox_concurrency", 0}}));
    assert(RejectsSettings({{"batch_size", "five"}}));
    assert(RejectsSettings({{"fetch_backoff_ms", -1}}));
    assert(RejectsSettings({{"dedup", 3}}));
    assert(RejectsSettings({{"ollama", {{"port", 0}}}}));
    assert(RejectsSettings({{"store_file", 42}}));

    auto root = FreshRoot();
    std::ofstream(root / "settings.json") << "{ \"batch_size\": ";
    bool threw = false;
    try {
        ConfigLoader::Load(root.string());
    } catch (const domain::ConfigError&) {
        threw = true;
    }
    assert(threw && "Truncated settings.json is a ConfigError.");
    fs::remove_all(root);
    std::cout << "[PASS] Bad values rejected." << std::endl;
}

void TestStudentDirectory() {
    auto root = FreshRoot();
    const auto path = root / "students.json";
    std::ofstream(path) << R"({"students": [
        {"student_id": "s-1", "mailbox": "s1@example.edu", "credentials": "S1_PASSWORD", "subjects": ["Physics", "Maths"]},
        {"student_id": "s-2"},
        {"mailbox": "orphan@example.edu"},
        {"student_id": ""},
        {"student_id": "s-1", "mailbox": "duplicate@example.edu"}
    ]})";

    auto entries = StudentDirectory::Load(path.string());
    assert(entries.size() == 2);
    assert(entries[0].identity.studentId == "s-1");
    assert(entries[0].identity.mailbox == "s1@example.edu" && "First entry for a repeated id wins.");
    assert(entries[0].identity.credentialsHandle == "S1_PASSWORD");
    assert(entries[0].subjects.size() == 2);
    assert(entries[1].identity.mailbox == "s-2" && "Mailbox defaults to the student id.");
    assert(entries[1].subjects.empty());

    std::ofstream(root / "bare.json") << R"([{"student_id": "s-9"}])";
    assert(StudentDirectory::Load((root / "bare.json").string()).size() == 1);

    bool threw = false;
    try {
        StudentDirectory::Load((root / "missing.json").string());
    } catch (const domain::ConfigError&) {
        threw = true;
    }
    assert(threw);

    fs::remove_all(root);
    std::cout << "[PASS] Student directory." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting ConfigLoader Test..." << std::endl;
    TestDefaults();
    TestOverrides();
    TestRejectsBadValues();
    TestStudentDirectory();
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
