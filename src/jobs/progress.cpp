#include "fetchd/jobs/progress.hpp"
#include "fetchd/jobs/state_machine.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <regex>

namespace fetchd::jobs {
namespace {

std::string trim(const std::string& text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

bool enter_downloading(JobState& job) {
    if (job.phase == JobPhase::Downloading) {
        return true;
    }
    if (job.phase != JobPhase::Starting) {
        return false;
    }
    return JobStateMachine::transition_to(job, JobPhase::Downloading).is_ok();
}

} // namespace

ProgressAggregator::Outcome ProgressAggregator::apply(JobState& job,
                                                      std::unordered_set<std::string>& known_items,
                                                      const fetch::ProgressEvent& event) {
    if (!enter_downloading(job)) {
        return Outcome::Ignored;
    }

    switch (event.kind) {
        case fetch::ProgressKind::Downloading:
            return apply_downloading(job, event);
        case fetch::ProgressKind::ItemFinished:
            return apply_item_finished(job, known_items, event);
    }
    return Outcome::Ignored;
}

bool ProgressAggregator::revise_total(JobState& job, std::size_t total) {
    if (total == 0) {
        return false;
    }
    if (job.items_total == 0) {
        job.items_total = total;
        return true;
    }
    if (total > job.items_total && !job.items_total_revised) {
        job.items_total = total;
        job.items_total_revised = true;
        return true;
    }
    return false;
}

double ProgressAggregator::overall_percent(std::size_t items_completed,
                                           std::size_t items_total,
                                           double item_percent) {
    const double p = std::clamp(item_percent, 0.0, 100.0);
    if (items_total <= 1) {
        return round2(p);
    }
    const double overall = (static_cast<double>(items_completed) * 100.0 + p) /
                           static_cast<double>(items_total);
    return round2(std::min(overall, 100.0));
}

double ProgressAggregator::round2(double value) {
    // std::round rounds halfway cases away from zero
    return std::round(value * 100.0) / 100.0;
}

std::optional<double> ProgressAggregator::parse_percent(const std::string& raw) {
    std::string text = trim(strip_ansi(raw));
    if (!text.empty() && text.back() == '%') {
        text.pop_back();
        text = trim(text);
    }
    if (text.empty()) {
        return std::nullopt;
    }

    char* end = nullptr;
    const double value = std::strtod(text.c_str(), &end);
    if (end == text.c_str() || *end != '\0' || !std::isfinite(value)) {
        return std::nullopt;
    }
    return value;
}

std::string ProgressAggregator::strip_ansi(const std::string& text) {
    static const std::regex ansi_sequence("\x1b\\[[0-9;]*m");
    return std::regex_replace(text, ansi_sequence, "");
}

ProgressAggregator::Outcome ProgressAggregator::apply_downloading(JobState& job,
                                                                  const fetch::ProgressEvent& event) {
    if (event.collection_size > job.items_total) {
        revise_total(job, event.collection_size);
    }

    const std::size_t total = job.items_total == 0 ? 1 : job.items_total;
    const double computed = overall_percent(job.items_completed, total, event.percent);
    job.overall_percent = std::max(job.overall_percent, computed);

    job.current_item_raw_progress = trim(strip_ansi(event.raw_percent));
    if (!event.label.empty()) {
        job.current_item_label = event.label;
    }
    return Outcome::Applied;
}

ProgressAggregator::Outcome ProgressAggregator::apply_item_finished(JobState& job,
                                                                    std::unordered_set<std::string>& known_items,
                                                                    const fetch::ProgressEvent& event) {
    const std::size_t total = job.items_total == 0 ? 1 : job.items_total;
    if (job.items_completed < total) {
        ++job.items_completed;
    }

    const std::string& label = event.label.empty() ? job.current_item_label : event.label;
    if (!label.empty() && known_items.insert(label).second) {
        job.completed_items.push_back(label);
    }
    if (!label.empty()) {
        mark_manifest_entry(job, label);
    }

    job.current_item_label.clear();
    job.current_item_raw_progress = "100%";

    if (job.items_completed >= total) {
        job.overall_percent = 100.0;
        if (JobStateMachine::transition_to(job, JobPhase::Finished).is_error()) {
            return Outcome::Ignored;
        }
        return Outcome::JobCompleted;
    }

    const double computed = round2(static_cast<double>(job.items_completed) /
                                   static_cast<double>(total) * 100.0);
    job.overall_percent = std::max(job.overall_percent, computed);
    return Outcome::ItemCompleted;
}

void ProgressAggregator::mark_manifest_entry(JobState& job, const std::string& label) {
    auto it = std::find_if(job.manifest.begin(), job.manifest.end(), [&](const ManifestEntry& entry) {
        return !entry.completed && entry.label == label;
    });
    if (it != job.manifest.end()) {
        it->completed = true;
        return;
    }

    // Label unknown to the manifest: record it in discovery order
    if (std::none_of(job.manifest.begin(), job.manifest.end(),
                     [&](const ManifestEntry& entry) { return entry.label == label; })) {
        job.manifest.push_back(ManifestEntry{label, std::nullopt, true});
    }
}

} // namespace fetchd::jobs
