#include "schedule_enumerator.hpp"

#include <stdexcept>
#include <string>

ScheduleEnumerator::ScheduleEnumerator(EnumerationOptions options) : options_(options) {
    if (options_.cap <= 0) {
        throw std::invalid_argument("Result cap must be positive, got " + std::to_string(options_.cap));
    }
    if (options_.earliest_start < 0 || options_.latest_end > MINUTES_PER_DAY ||
        options_.earliest_start > options_.latest_end) {
        throw std::invalid_argument("Invalid availability window " + format_hhmm(options_.earliest_start) +
                                    "-" + format_hhmm(options_.latest_end));
    }
}

EnumerationResult ScheduleEnumerator::enumerate(const std::vector<const Course*>& courses) {
    result_ = EnumerationResult();
    partial_.clear();
    committed_.clear();
    stopped_ = false;

    for (const Course* course : courses) {
        if (course->sections.empty()) {
            return result_;
        }
    }

    courses_ = &courses;
    partial_.reserve(courses.size());
    search(0);
    courses_ = nullptr;

    return std::move(result_);
}

bool ScheduleEnumerator::section_allowed(const Section& section) const {
    for (const auto& block : section.blocks) {
        if ((block.days() & ~options_.allowed_days) != 0) return false;
        if (block.start() < options_.earliest_start || block.end() > options_.latest_end) return false;
    }
    return true;
}

void ScheduleEnumerator::search(size_t depth) {
    if (depth == courses_->size()) {
        // Reaching the cap ends the search; the rest of the space is never visited.
        result_.schedules.push_back(partial_);
        if (result_.schedules.size() >= static_cast<size_t>(options_.cap)) {
            result_.truncated = !at_last_candidate();
            stopped_ = true;
        }
        return;
    }

    const Course* course = (*courses_)[depth];
    for (const auto& section : course->sections) {
        if (stopped_) return;
        if (deadline_passed()) {
            result_.timed_out = true;
            stopped_ = true;
            return;
        }
        if (!section_allowed(section) || !fits_committed(section)) continue;

        partial_.push_back({course, &section});
        for (const auto& block : section.blocks) {
            committed_.push_back(&block);
        }

        search(depth + 1);

        committed_.resize(committed_.size() - section.blocks.size());
        partial_.pop_back();
    }
}

bool ScheduleEnumerator::fits_committed(const Section& section) const {
    for (const auto& block : section.blocks) {
        for (const TimeBlock* taken : committed_) {
            if (conflicts(block, *taken)) return false;
        }
    }
    return true;
}

// True when every course on the current path sits on its final section, so no
// unexplored branch remains.
bool ScheduleEnumerator::at_last_candidate() const {
    for (const auto& entry : partial_) {
        if (entry.section != &entry.course->sections.back()) return false;
    }
    return true;
}

bool ScheduleEnumerator::deadline_passed() const {
    return options_.has_deadline && std::chrono::steady_clock::now() >= options_.deadline;
}

EnumerationResult enumerate_schedules(const std::vector<const Course*>& courses, int cap) {
    EnumerationOptions options;
    options.cap = cap;
    ScheduleEnumerator enumerator(options);
    return enumerator.enumerate(courses);
}
