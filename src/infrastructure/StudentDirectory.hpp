/**
 * @file StudentDirectory.hpp
 * @brief Loads the list of student mailboxes to process.
 */

#pragma once

#include <string>
#include <vector>
#include "domain/Identity.hpp"

namespace schedsync::infrastructure {

/**
 * @struct StudentEntry
 * @brief One row of students.json.
 */
struct StudentEntry {
    domain::Identity identity;
    std::vector<std::string> subjects; ///< Enrolled subjects, used for double-booking checks.
};

class StudentDirectory {
public:
    /**
     * @brief Reads {"students": [{"student_id", "mailbox", "credentials", "subjects"}]}.
     *
     * Entries without a student id are skipped with a warning; a repeated id
     * keeps the first entry.
     * @throws domain::ConfigError if the file is missing or not valid JSON.
     */
    static std::vector<StudentEntry> Load(const std::string& path);
};

} // namespace schedsync::infrastructure
