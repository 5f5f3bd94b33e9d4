#pragma once

#include "schedule_enumerator.hpp"

#include <string>
#include <vector>

// ==================== HTML VIEW ====================
struct FormValues {
    std::string courses;
    std::string start{"09:00"};
    std::string end{"16:00"};
    std::string days{"MTWRF"};
};

struct PageResult {
    std::vector<std::string> schedules;   // one preformatted block per schedule
    bool truncated{false};
    bool timed_out{false};
    int cap{0};
    std::string error;                    // shown instead of results when set
};

std::string html_escape(const std::string& text);

// "CS280  CRN:12345  MW  10:00-11:20" lines, one per course.
std::string format_schedule_text(const Schedule& schedule);

std::string render_page(const FormValues& form, const PageResult* result);
