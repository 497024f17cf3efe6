/**
 * @file SpoolMessageSource.cpp
 * @brief Implementation of SpoolMessageSource.
 */

#include "infrastructure/SpoolMessageSource.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <optional>
#include <nlohmann/json.hpp>
#include "domain/Errors.hpp"

namespace fs = std::filesystem;

namespace schedsync::infrastructure {

using json = nlohmann::json;

namespace {

class SpoolSession : public domain::MailboxSession {
public:
    SpoolSession(std::string studentId, fs::path mailbox)
        : m_studentId(std::move(studentId)), m_mailbox(std::move(mailbox)) {}

    size_t countUnread() override {
        size_t count = 0;
        forEachUnreadFile([&count](const fs::path&) { ++count; });
        return count;
    }

    std::vector<domain::RawMessage> listUnread() override {
        std::vector<domain::RawMessage> messages;
        m_index.clear();
        forEachUnreadFile([&](const fs::path& file) {
            auto message = readMessage(file);
            if (!message) return;
            m_index[message->fingerprint] = file;
            messages.push_back(std::move(*message));
        });
        return messages;
    }

    void markRead(const std::string& fingerprint) override {
        if (m_index.find(fingerprint) == m_index.end()) {
            listUnread();
        }
        auto it = m_index.find(fingerprint);
        if (it == m_index.end()) return;

        const fs::path cur = m_mailbox / "cur";
        std::error_code ec;
        fs::create_directories(cur, ec);
        if (!ec) fs::rename(it->second, cur / it->second.filename(), ec);
        if (ec) {
            throw domain::TransientFetchError("cannot mark " + it->second.string() + " read: " + ec.message());
        }
        m_index.erase(it);
    }

private:
    template <typename Fn>
    void forEachUnreadFile(Fn&& fn) {
        const fs::path inbox = m_mailbox / "new";
        std::error_code ec;
        if (!fs::exists(inbox, ec)) {
            if (ec) throw domain::TransientFetchError("cannot stat " + inbox.string() + ": " + ec.message());
            return;
        }
        fs::directory_iterator it(inbox, ec);
        if (ec) throw domain::TransientFetchError("cannot open " + inbox.string() + ": " + ec.message());
        for (; it != fs::directory_iterator(); it.increment(ec)) {
            std::error_code typeEc;
            if (it->is_regular_file(typeEc) && it->path().extension() == ".json") {
                fn(it->path());
            }
        }
        if (ec) throw domain::TransientFetchError("cannot read " + inbox.string() + ": " + ec.message());
    }

    std::optional<domain::RawMessage> readMessage(const fs::path& file) {
        std::ifstream f(file);
        if (!f.is_open()) {
            throw domain::TransientFetchError("cannot open " + file.string());
        }
        try {
            json j = json::parse(f);
            domain::RawMessage message;
            message.studentId = m_studentId;
            message.messageId = j.value("message_id", file.stem().string());
            message.receivedAt = j.value("received_at", std::int64_t{0});
            message.subject = j.value("subject", "");
            message.body = j.value("body", "");
            message.fingerprint = domain::ComputeFingerprint(message.messageId, message.receivedAt);
            return message;
        } catch (const std::exception& e) {
            // A corrupt file stays in new/ for an operator; it does not block the mailbox.
            std::cerr << "[SpoolMessageSource] Skipping malformed message " << file << ": " << e.what() << std::endl;
            return std::nullopt;
        }
    }

    std::string m_studentId;
    fs::path m_mailbox;
    std::map<std::string, fs::path> m_index;
};

} // namespace

SpoolMessageSource::SpoolMessageSource(std::string root) : m_root(std::move(root)) {}

std::unique_ptr<domain::MailboxSession> SpoolMessageSource::connect(const domain::Identity& identity) {
    if (!identity.credentialsHandle.empty()) {
        const char* secret = std::getenv(identity.credentialsHandle.c_str());
        if (secret == nullptr || *secret == '\0') {
            throw domain::TransientFetchError("credentials " + identity.credentialsHandle + " unavailable for " +
                                              identity.studentId);
        }
    }
    return std::make_unique<SpoolSession>(identity.studentId, fs::path(m_root) / identity.studentId);
}

} // namespace schedsync::infrastructure
