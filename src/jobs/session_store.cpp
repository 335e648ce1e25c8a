#include "fetchd/jobs/session_store.hpp"

#include <iomanip>
#include <mutex>
#include <sstream>

#include <spdlog/spdlog.h>

namespace fetchd::jobs {

SessionStore::SessionStore(std::size_t history_limit)
    : history_limit_(history_limit == 0 ? 1 : history_limit),
      id_engine_(std::random_device{}()) {
}

Session SessionStore::get_or_create(const std::string& id) {
    std::unique_lock lock(mutex_);
    std::string key = id;
    if (key.empty() || retired_.count(key) > 0) {
        do {
            key = generate_id();
        } while (sessions_.count(key) > 0 || retired_.count(key) > 0);
    }
    return find_or_insert(key);
}

std::optional<Session> SessionStore::get(const std::string& id) const {
    std::shared_lock lock(mutex_);
    auto it = sessions_.find(id);
    if (it == sessions_.end()) {
        return std::nullopt;
    }
    return it->second;
}

Result<std::uint64_t> SessionStore::reset(const std::string& id) {
    std::unique_lock lock(mutex_);
    if (retired_.count(id) > 0) {
        return Err<std::uint64_t>(Error::not_found("Session " + id + " was closed"));
    }
    auto& session = find_or_insert(id);
    ++session.generation;
    session.job.reset();
    session.cancel_requested = false;
    session.preview.reset();
    spdlog::debug("Session {} reset to generation {}", id, session.generation);
    return Ok(session.generation);
}

Result<void> SessionStore::update(const std::string& id, std::uint64_t generation, const Mutator& mutator) {
    std::unique_lock lock(mutex_);
    auto it = sessions_.find(id);
    if (it == sessions_.end()) {
        return Err<void>(Error::not_found("Unknown session: " + id));
    }
    if (it->second.generation != generation) {
        return Err<void>(Error::superseded("Session " + id + " moved to generation " +
                                           std::to_string(it->second.generation)));
    }
    mutator(it->second);
    return Ok();
}

bool SessionStore::remove(const std::string& id) {
    std::unique_lock lock(mutex_);
    if (sessions_.erase(id) == 0) {
        return false;
    }
    retired_.insert(id);
    return true;
}

bool SessionStore::set_cancel_requested(const std::string& id, bool requested) {
    std::unique_lock lock(mutex_);
    auto it = sessions_.find(id);
    if (it == sessions_.end()) {
        return false;
    }
    it->second.cancel_requested = requested;
    return true;
}

bool SessionStore::arm_cancel(const std::string& id) {
    std::unique_lock lock(mutex_);
    if (retired_.count(id) > 0) {
        return false;
    }
    find_or_insert(id).cancel_requested = true;
    return true;
}

bool SessionStore::is_cancel_requested(const std::string& id) const {
    std::shared_lock lock(mutex_);
    auto it = sessions_.find(id);
    return it != sessions_.end() && it->second.cancel_requested;
}

std::size_t SessionStore::cancel_all() {
    std::unique_lock lock(mutex_);
    std::size_t raised = 0;
    for (auto& [id, session] : sessions_) {
        if (session.job && !is_terminal(session.job->phase)) {
            session.cancel_requested = true;
            ++raised;
        }
    }
    return raised;
}

bool SessionStore::store_preview(const std::string& id, PreviewResult preview) {
    std::unique_lock lock(mutex_);
    auto it = sessions_.find(id);
    if (it == sessions_.end()) {
        return false;
    }
    it->second.preview = std::move(preview);
    return true;
}

std::optional<PreviewResult> SessionStore::take_preview(const std::string& id) {
    std::unique_lock lock(mutex_);
    auto it = sessions_.find(id);
    if (it == sessions_.end() || !it->second.preview) {
        return std::nullopt;
    }
    auto preview = std::move(it->second.preview);
    it->second.preview.reset();
    return preview;
}

Result<void> SessionStore::append_history(const std::string& id, std::uint64_t generation, JobRecord record) {
    return update(id, generation, [this, &record](Session& session) {
        push_history(session, std::move(record));
    });
}

void SessionStore::push_history(Session& session, JobRecord record) const {
    session.history.push_back(std::move(record));
    while (session.history.size() > history_limit_) {
        session.history.pop_front();
    }
}

std::vector<JobRecord> SessionStore::history(const std::string& id) const {
    std::shared_lock lock(mutex_);
    auto it = sessions_.find(id);
    if (it == sessions_.end()) {
        return {};
    }
    return {it->second.history.begin(), it->second.history.end()};
}

std::size_t SessionStore::size() const {
    std::shared_lock lock(mutex_);
    return sessions_.size();
}

Session& SessionStore::find_or_insert(const std::string& id) {
    auto [it, inserted] = sessions_.try_emplace(id);
    if (inserted) {
        it->second.id = id;
        spdlog::debug("Created session {}", id);
    }
    return it->second;
}

std::string SessionStore::generate_id() {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0')
        << std::setw(16) << id_engine_()
        << std::setw(16) << id_engine_();
    return oss.str();
}

} // namespace fetchd::jobs
