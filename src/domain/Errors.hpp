/**
 * @file Errors.hpp
 * @brief Failure taxonomy shared by the pipeline and its collaborators.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace schedsync::domain {

class SchedSyncError : public std::runtime_error {
public:
    explicit SchedSyncError(const std::string& what) : std::runtime_error(what) {}
};

/** @brief Network/auth hiccup talking to a mailbox. Retried with backoff. */
class TransientFetchError : public SchedSyncError {
public:
    explicit TransientFetchError(const std::string& what) : SchedSyncError(what) {}
};

/** @brief The inference call failed or returned unusable content. Degrades to NoEvent. */
class ExtractionFailure : public SchedSyncError {
public:
    explicit ExtractionFailure(const std::string& what) : SchedSyncError(what) {}
};

/** @brief Idempotence key collided at write time. Means prior success; callers treat it as a no-op. */
class PersistenceConflict : public SchedSyncError {
public:
    explicit PersistenceConflict(const std::string& what) : SchedSyncError(what) {}
};

/** @brief The store cannot durably accept writes. Fatal for the run. */
class PersistenceUnavailable : public SchedSyncError {
public:
    explicit PersistenceUnavailable(const std::string& what) : SchedSyncError(what) {}
};

class ConfigError : public SchedSyncError {
public:
    explicit ConfigError(const std::string& what) : SchedSyncError(what) {}
};

} // namespace schedsync::domain
