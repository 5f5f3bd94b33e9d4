#pragma once

#include "catalogue.hpp"
#include "schedule_enumerator.hpp"

#include <string>
#include <utility>
#include <vector>

inline TimeBlock block(const std::string& days, const std::string& start, const std::string& end) {
    return TimeBlock(parse_days(days), parse_hhmm(start), parse_hhmm(end));
}

inline Section section(const std::string& id, std::vector<TimeBlock> blocks) {
    Section s;
    s.section_id = id;
    s.blocks = std::move(blocks);
    return s;
}

inline Course course(const std::string& id, std::vector<Section> sections) {
    Course c;
    c.course_id = id;
    c.sections = std::move(sections);
    return c;
}

inline std::vector<const Course*> pointers(const std::vector<Course>& courses) {
    std::vector<const Course*> out;
    for (const auto& c : courses) out.push_back(&c);
    return out;
}

// "A:A1 B:B1" per schedule, for readable comparisons.
inline std::vector<std::string> describe(const EnumerationResult& result) {
    std::vector<std::string> out;
    for (const auto& schedule : result.schedules) {
        std::string line;
        for (const auto& entry : schedule) {
            if (!line.empty()) line += " ";
            line += entry.course->course_id + ":" + entry.section->section_id;
        }
        out.push_back(line);
    }
    return out;
}
