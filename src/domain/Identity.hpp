/**
 * @file Identity.hpp
 * @brief Mailbox processing context for a single student.
 */

#pragma once

#include <string>

namespace schedsync::domain {

/**
 * @struct Identity
 * @brief One student mailbox. Credentials are only a handle into an external store.
 */
struct Identity {
    std::string studentId;
    std::string mailbox;           ///< Address or spool name.
    std::string credentialsHandle; ///< e.g. environment variable holding the app password.

    bool operator==(const Identity& other) const { return studentId == other.studentId; }
    bool operator!=(const Identity& other) const { return !(*this == other); }
};

} // namespace schedsync::domain
