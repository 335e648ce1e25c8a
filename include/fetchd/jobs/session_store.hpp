#pragma once

/**
 * @file session_store.hpp
 * @brief Thread-safe in-memory owner of every session's job state
 *
 * THREAD SAFETY PATTERN:
 * - Readers (get, is_cancel_requested) take a shared lock and copy out a snapshot
 * - Writers (reset, update, remove, ...) take the exclusive lock
 * - A mutation is applied in full before the lock is released, so a poller
 *   never sees half of an update
 *
 * GENERATIONS:
 * reset() bumps the session's generation and returns it. A worker is handed
 * that number and passes it back on every update(). Once the session has been
 * reset again, the old worker's updates are refused with ErrorKind::Superseded
 * and the new worker's state stays intact.
 */

#include "fetchd/core/result.hpp"
#include "fetchd/jobs/types.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <random>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace fetchd::jobs {

class SessionStore {
public:
    static constexpr std::size_t kDefaultHistoryLimit = 20;

    using Mutator = std::function<void(Session&)>;

    explicit SessionStore(std::size_t history_limit = kDefaultHistoryLimit);

    SessionStore(const SessionStore&) = delete;
    SessionStore& operator=(const SessionStore&) = delete;

    /**
     * @brief Fetch a session, creating it if needed
     *
     * An empty id, or the id of a removed session, allocates a fresh opaque id.
     */
    Session get_or_create(const std::string& id = {});

    [[nodiscard]] std::optional<Session> get(const std::string& id) const;

    /**
     * @brief Clear the transient job fields and start a new generation
     *
     * history and known_items survive; job, cancel flag and cached preview do not.
     * Creates the session when it does not exist yet, unless the id was removed.
     *
     * @return The new generation, or NotFound for a removed id
     */
    Result<std::uint64_t> reset(const std::string& id);

    /**
     * @brief Apply a mutation on behalf of the worker owning `generation`
     *
     * @return NotFound if the session was removed, Superseded if it has been
     *         reset since the worker started
     */
    Result<void> update(const std::string& id, std::uint64_t generation, const Mutator& mutator);

    /**
     * @brief Drop all state of a session, cancel flag included
     *
     * @return false if there was nothing to remove
     */
    bool remove(const std::string& id);

    bool set_cancel_requested(const std::string& id, bool requested);

    /**
     * @brief Raise the cancel flag, creating the session if it never existed
     *
     * @return false for a removed id; nothing is created then
     */
    bool arm_cancel(const std::string& id);
    [[nodiscard]] bool is_cancel_requested(const std::string& id) const;

    /**
     * @return Number of sessions whose flag was raised
     */
    std::size_t cancel_all();

    /**
     * @return false when the session does not exist
     */
    bool store_preview(const std::string& id, PreviewResult preview);
    std::optional<PreviewResult> take_preview(const std::string& id);

    /**
     * @brief Append a history entry, evicting the oldest beyond the limit
     */
    Result<void> append_history(const std::string& id, std::uint64_t generation, JobRecord record);

    /**
     * @brief Same bounded append, for use inside an update() mutator
     */
    void push_history(Session& session, JobRecord record) const;

    [[nodiscard]] std::vector<JobRecord> history(const std::string& id) const;

    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] std::size_t history_limit() const noexcept { return history_limit_; }

private:
    Session& find_or_insert(const std::string& id);
    std::string generate_id();

    const std::size_t history_limit_;

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, Session> sessions_;
    // Ids of removed sessions. Never pruned: an evicted entry would let a client
    // revive a closed id. Growth is one short string per explicit remove().
    std::unordered_set<std::string> retired_;
    std::mt19937_64 id_engine_;
};

} // namespace fetchd::jobs
