#pragma once

#include "fetchd/fetch/fetch_service.hpp"
#include "fetchd/jobs/types.hpp"

#include <optional>
#include <string>
#include <unordered_set>

namespace fetchd::jobs {

/**
 * @brief Folds raw per-item progress events into a session-level percentage
 *
 * FORMULA:
 * - one item:  overall = p
 * - N items:   overall = (completed * 100 + p) / N
 * - finished:  overall = completed / N * 100, or exactly 100 once all items are done
 *
 * Values are rounded to two decimals, half away from zero. An unknown total
 * counts as one item. The stored percentage never moves backwards, which also
 * absorbs collaborators that restart the per-item percentage for a second
 * stream of the same item.
 *
 * THREAD SAFETY:
 * Stateless. Callers apply it inside SessionStore::update so the whole event
 * lands as one merge.
 */
class ProgressAggregator {
public:
    enum class Outcome {
        Applied,
        ItemCompleted,
        JobCompleted,
        Ignored       ///< Job already in a terminal phase
    };

    static Outcome apply(JobState& job,
                         std::unordered_set<std::string>& known_items,
                         const fetch::ProgressEvent& event);

    /**
     * @brief Set the expected item count
     *
     * The first positive value is taken as is. Later values are accepted once,
     * and only when larger. Smaller values are ignored.
     */
    static bool revise_total(JobState& job, std::size_t total);

    [[nodiscard]] static double overall_percent(std::size_t items_completed,
                                                std::size_t items_total,
                                                double item_percent);

    [[nodiscard]] static double round2(double value);

    /**
     * @brief Parse strings such as " 47.5%" or "\x1b[0;94m 12.0%\x1b[0m"
     */
    [[nodiscard]] static std::optional<double> parse_percent(const std::string& raw);

    [[nodiscard]] static std::string strip_ansi(const std::string& text);

private:
    static Outcome apply_downloading(JobState& job, const fetch::ProgressEvent& event);
    static Outcome apply_item_finished(JobState& job,
                                       std::unordered_set<std::string>& known_items,
                                       const fetch::ProgressEvent& event);
    static void mark_manifest_entry(JobState& job, const std::string& label);
};

} // namespace fetchd::jobs
