/**
 * @file MessageSource.hpp
 * @brief Capability interface for reading a student's mailbox.
 */

#pragma once

#include <memory>
#include <string>
#include <vector>
#include "domain/Identity.hpp"
#include "domain/RawMessage.hpp"

namespace schedsync::domain {

/**
 * @class MailboxSession
 * @brief An open connection to one mailbox. Destruction releases the connection.
 *
 * Implementations throw TransientFetchError for recoverable transport or auth failures.
 */
class MailboxSession {
public:
    virtual ~MailboxSession() = default;

    /** @brief Number of unread messages, used to seed priorities. */
    virtual size_t countUnread() = 0;

    /** @brief All unread messages, fingerprints filled in. Order is unspecified. */
    virtual std::vector<RawMessage> listUnread() = 0;

    /** @brief Flags the message as read at the provider. Unknown fingerprints are ignored. */
    virtual void markRead(const std::string& fingerprint) = 0;
};

/**
 * @class MessageSource
 * @brief Factory for mailbox sessions.
 */
class MessageSource {
public:
    virtual ~MessageSource() = default;

    /** @brief Connects and authenticates. Throws TransientFetchError on failure. */
    virtual std::unique_ptr<MailboxSession> connect(const Identity& identity) = 0;
};

} // namespace schedsync::domain
