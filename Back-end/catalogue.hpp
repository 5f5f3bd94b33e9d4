#pragma once

#include "time_block.hpp"

#include <string>
#include <unordered_map>
#include <vector>

// ==================== DATA MODELS ====================
struct Section {
    std::string section_id;   // CRN, unique within the course
    std::string section_number;
    std::string instructor;
    std::string title;
    std::string location;
    std::vector<TimeBlock> blocks;
};

struct Course {
    std::string course_id;
    std::vector<Section> sections;   // catalogue order
};

// A section without blocks (online, asynchronous) never clashes.
bool sections_conflict(const Section& a, const Section& b);

std::string normalize_course_id(const std::string& raw);

// ==================== CATALOGUE ====================
// Immutable once built; shared between requests through std::shared_ptr<const Catalogue>.
class Catalogue {
public:
    Catalogue() = default;
    explicit Catalogue(std::vector<Course> courses);   // throws MalformedCatalogue on duplicates

    // Resolves ids in request order; throws UnknownCourse naming every missing id.
    std::vector<const Course*> lookup(const std::vector<std::string>& course_ids) const;

    const Course* find(const std::string& course_id) const;
    std::vector<std::string> course_ids() const;

    size_t course_count() const { return courses_.size(); }
    size_t section_count() const { return section_count_; }

private:
    std::vector<Course> courses_;
    std::unordered_map<std::string, size_t> course_index_;
    size_t section_count_{0};
};
