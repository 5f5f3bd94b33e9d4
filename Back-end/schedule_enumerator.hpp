#pragma once

#include "catalogue.hpp"

#include <chrono>
#include <utility>
#include <vector>

// ==================== RESULT TYPES ====================
struct ScheduleEntry {
    const Course* course;
    const Section* section;
};

// One section per requested course, in request order. Points into the catalogue
// snapshot the enumeration ran against; keep that snapshot alive while reading.
using Schedule = std::vector<ScheduleEntry>;

struct EnumerationResult {
    std::vector<Schedule> schedules;
    bool truncated{false};   // the cap was reached; more schedules may exist
    bool timed_out{false};   // stopped by the deadline
};

struct EnumerationOptions {
    static constexpr int DEFAULT_CAP = 50;

    int cap{DEFAULT_CAP};
    DayMask allowed_days{ALL_DAYS};
    int earliest_start{0};
    int latest_end{MINUTES_PER_DAY};

    bool has_deadline{false};
    std::chrono::steady_clock::time_point deadline{};

    void set_timeout(std::chrono::milliseconds timeout) {
        has_deadline = true;
        deadline = std::chrono::steady_clock::now() + timeout;
    }
};

// ==================== SCHEDULE ENUMERATOR ====================
class ScheduleEnumerator {
public:
    // Throws std::invalid_argument for a non-positive cap or an inverted time window.
    explicit ScheduleEnumerator(EnumerationOptions options = EnumerationOptions());

    // Depth-first over courses in the given order, sections in catalogue order.
    EnumerationResult enumerate(const std::vector<const Course*>& courses);

    bool section_allowed(const Section& section) const;

private:
    EnumerationOptions options_;

    // Per-call search state
    const std::vector<const Course*>* courses_{nullptr};
    Schedule partial_;
    std::vector<const TimeBlock*> committed_;
    EnumerationResult result_;
    bool stopped_{false};

    void search(size_t depth);
    bool fits_committed(const Section& section) const;
    bool at_last_candidate() const;
    bool deadline_passed() const;
};

// Convenience wrapper: enumerate(courses, cap).
EnumerationResult enumerate_schedules(const std::vector<const Course*>& courses,
                                      int cap = EnumerationOptions::DEFAULT_CAP);
