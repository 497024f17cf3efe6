/**
 * @file SpoolMessageSource.hpp
 * @brief MessageSource reading per-student maildir-style spool directories.
 */

#pragma once

#include <string>
#include "domain/MessageSource.hpp"

namespace schedsync::infrastructure {

/**
 * @class SpoolMessageSource
 * @brief Mailboxes laid out as <root>/<studentId>/{new,cur}/<message>.json.
 *
 * Each message file holds {"message_id", "received_at", "subject", "body"}.
 * Unread messages live in new/; markRead moves them to cur/. A missing mailbox
 * directory is an empty mailbox. When an identity carries a credentials
 * handle, the named environment variable must be set for connect() to succeed.
 */
class SpoolMessageSource : public domain::MessageSource {
public:
    explicit SpoolMessageSource(std::string root);

    std::unique_ptr<domain::MailboxSession> connect(const domain::Identity& identity) override;

    const std::string& root() const { return m_root; }

private:
    std::string m_root;
};

} // namespace schedsync::infrastructure
