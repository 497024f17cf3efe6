#include "infrastructure/StudentDirectory.hpp"

#include <fstream>
#include <iostream>
#include <set>
#include <nlohmann/json.hpp>
#include "domain/Errors.hpp"

namespace schedsync::infrastructure {

using json = nlohmann::json;

std::vector<StudentEntry> StudentDirectory::Load(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        throw domain::ConfigError("cannot open student directory " + path);
    }

    json j;
    try {
        f >> j;
    } catch (const std::exception& e) {
        throw domain::ConfigError("invalid student directory " + path + ": " + e.what());
    }

    const json* rows = &j;
    if (j.is_object() && j.contains("students")) rows = &j["students"];
    if (!rows->is_array()) {
        throw domain::ConfigError("student directory " + path + " has no 'students' array");
    }

    std::vector<StudentEntry> entries;
    std::set<std::string> seen;
    for (const auto& row : *rows) {
        if (!row.is_object() || !row.contains("student_id") || !row["student_id"].is_string()) {
            std::cerr << "[StudentDirectory] Skipping entry without student_id: " << row.dump() << std::endl;
            continue;
        }
        StudentEntry entry;
        entry.identity.studentId = row["student_id"].get<std::string>();
        if (entry.identity.studentId.empty() || !seen.insert(entry.identity.studentId).second) {
            std::cerr << "[StudentDirectory] Skipping empty or repeated student_id '" << entry.identity.studentId
                      << "'" << std::endl;
            continue;
        }
        try {
            entry.identity.mailbox = row.value("mailbox", entry.identity.studentId);
            entry.identity.credentialsHandle = row.value("credentials", "");
        } catch (const json::exception& e) {
            throw domain::ConfigError("student " + entry.identity.studentId + " in " + path + ": " + e.what());
        }
        if (row.contains("subjects") && row["subjects"].is_array()) {
            for (const auto& subject : row["subjects"]) {
                if (subject.is_string()) entry.subjects.push_back(subject.get<std::string>());
            }
        }
        entries.push_back(std::move(entry));
    }

    std::cout << "[StudentDirectory] Loaded " << entries.size() << " students from " << path << std::endl;
    return entries;
}

} // namespace schedsync::infrastructure
