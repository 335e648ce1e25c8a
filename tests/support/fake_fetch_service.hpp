#pragma once

#include "fetchd/fetch/fetch_service.hpp"

#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace fetchd::test_support {

inline fetch::ProgressEvent progress(const std::string& raw, const std::string& label = {},
                                     std::size_t collection_size = 0) {
    fetch::ProgressEvent event;
    event.kind = fetch::ProgressKind::Downloading;
    event.raw_percent = raw;
    event.percent = std::stod(raw.substr(0, raw.find('%')));
    event.label = label;
    event.collection_size = collection_size;
    return event;
}

inline fetch::ProgressEvent finished(const std::string& label = {}) {
    fetch::ProgressEvent event;
    event.kind = fetch::ProgressKind::ItemFinished;
    event.raw_percent = "100%";
    event.percent = 100.0;
    event.label = label;
    return event;
}

inline fetch::ResolvedMetadata single(const std::string& title, double duration = 60.0) {
    return fetch::ResolvedMetadata{title, false, {fetch::ResolvedEntry{title, duration, true}}};
}

inline fetch::ResolvedMetadata collection(const std::string& title, const std::vector<std::string>& labels) {
    fetch::ResolvedMetadata metadata{title, true, {}};
    for (const auto& label : labels) {
        metadata.entries.push_back(fetch::ResolvedEntry{label, std::nullopt, !label.empty()});
    }
    return metadata;
}

/**
 * @brief Scripted FetchService
 *
 * Each source reference gets canned metadata and a list of progress events.
 * hold_before(n) parks the next fetch just before delivering event n until
 * release() is called, which lets a test act while a worker is mid-transfer.
 */
class FakeFetchService : public fetch::FetchService {
public:
    void set_metadata(const std::string& source_ref, std::optional<fetch::ResolvedMetadata> metadata) {
        std::lock_guard lock(mutex_);
        metadata_[source_ref] = std::move(metadata);
    }

    void fail_resolve(const std::string& source_ref, Error error) {
        std::lock_guard lock(mutex_);
        resolve_errors_[source_ref] = std::move(error);
    }

    void set_script(const std::string& source_ref,
                    std::vector<fetch::ProgressEvent> events,
                    std::optional<Error> fail_with = std::nullopt) {
        std::lock_guard lock(mutex_);
        scripts_[source_ref] = Script{std::move(events), std::move(fail_with)};
    }

    void on_resolve(std::function<void(const std::string&, fetch::ResolveMode)> hook) {
        std::lock_guard lock(mutex_);
        resolve_hook_ = std::move(hook);
    }

    void hold_before(std::size_t event_index) {
        std::lock_guard lock(mutex_);
        hold_at_ = event_index;
        held_ = false;
        released_ = false;
    }

    bool wait_until_held(std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
        std::unique_lock lock(mutex_);
        return cv_.wait_for(lock, timeout, [this] { return held_; });
    }

    void release() {
        std::lock_guard lock(mutex_);
        released_ = true;
        cv_.notify_all();
    }

    std::size_t resolve_calls(fetch::ResolveMode mode) const {
        std::lock_guard lock(mutex_);
        return mode == fetch::ResolveMode::Full ? full_resolves_ : flat_resolves_;
    }

    std::size_t fetch_calls() const {
        std::lock_guard lock(mutex_);
        return fetch_calls_;
    }

    std::vector<fetch::FetchRequest> fetch_requests() const {
        std::lock_guard lock(mutex_);
        return requests_;
    }

    Result<std::optional<fetch::ResolvedMetadata>> resolve_metadata(const std::string& source_ref,
                                                                    fetch::ResolveMode mode) override {
        std::function<void(const std::string&, fetch::ResolveMode)> hook;
        {
            std::lock_guard lock(mutex_);
            (mode == fetch::ResolveMode::Full ? full_resolves_ : flat_resolves_)++;
            hook = resolve_hook_;
        }
        if (hook) {
            hook(source_ref, mode);
        }

        std::lock_guard lock(mutex_);
        if (auto it = resolve_errors_.find(source_ref); it != resolve_errors_.end()) {
            return Err<std::optional<fetch::ResolvedMetadata>>(it->second);
        }
        if (auto it = metadata_.find(source_ref); it != metadata_.end()) {
            return Ok(it->second);
        }
        return Ok(std::optional<fetch::ResolvedMetadata>{});
    }

    Result<void> fetch(const fetch::FetchRequest& request, const fetch::ProgressCallback& on_progress) override {
        Script script;
        std::optional<std::size_t> hold_at;
        {
            std::lock_guard lock(mutex_);
            ++fetch_calls_;
            requests_.push_back(request);
            if (auto it = scripts_.find(request.source_ref); it != scripts_.end()) {
                script = it->second;
            }
            hold_at = hold_at_;
            hold_at_.reset();
        }

        for (std::size_t i = 0; i < script.events.size(); ++i) {
            if (hold_at && *hold_at == i) {
                std::unique_lock lock(mutex_);
                held_ = true;
                cv_.notify_all();
                cv_.wait(lock, [this] { return released_; });
            }
            auto delivered = on_progress(script.events[i]);
            if (delivered.is_error()) {
                return delivered;
            }
        }

        if (script.fail_with) {
            return Err<void>(*script.fail_with);
        }
        return Ok();
    }

private:
    struct Script {
        std::vector<fetch::ProgressEvent> events;
        std::optional<Error> fail_with;
    };

    mutable std::mutex mutex_;
    std::condition_variable cv_;

    std::map<std::string, std::optional<fetch::ResolvedMetadata>> metadata_;
    std::map<std::string, Error> resolve_errors_;
    std::map<std::string, Script> scripts_;
    std::function<void(const std::string&, fetch::ResolveMode)> resolve_hook_;

    std::optional<std::size_t> hold_at_;
    bool held_ = false;
    bool released_ = false;

    std::size_t full_resolves_ = 0;
    std::size_t flat_resolves_ = 0;
    std::size_t fetch_calls_ = 0;
    std::vector<fetch::FetchRequest> requests_;
};

} // namespace fetchd::test_support
