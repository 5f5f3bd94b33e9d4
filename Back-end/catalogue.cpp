#include "catalogue.hpp"
#include "schedule_errors.hpp"

#include <utility>
#include <cctype>
#include <unordered_set>

bool sections_conflict(const Section& a, const Section& b) {
    for (const auto& block_a : a.blocks) {
        for (const auto& block_b : b.blocks) {
            if (conflicts(block_a, block_b)) return true;
        }
    }
    return false;
}

std::string normalize_course_id(const std::string& raw) {
    std::string id;
    for (char c : raw) {
        if (std::isspace(static_cast<unsigned char>(c))) continue;
        id += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return id;
}

Catalogue::Catalogue(std::vector<Course> courses) : courses_(std::move(courses)) {
    for (size_t i = 0; i < courses_.size(); ++i) {
        auto& course = courses_[i];
        course.course_id = normalize_course_id(course.course_id);
        if (course.course_id.empty()) {
            throw MalformedCatalogue("course with an empty identifier");
        }
        if (!course_index_.emplace(course.course_id, i).second) {
            throw MalformedCatalogue(course.course_id, "", "listed more than once");
        }

        std::unordered_set<std::string> seen;
        for (const auto& section : course.sections) {
            if (section.section_id.empty()) {
                throw MalformedCatalogue(course.course_id, "", "section without an identifier");
            }
            if (!seen.insert(section.section_id).second) {
                throw MalformedCatalogue(course.course_id, section.section_id, "duplicate section identifier");
            }
        }
        section_count_ += course.sections.size();
    }
}

std::vector<const Course*> Catalogue::lookup(const std::vector<std::string>& course_ids) const {
    std::vector<const Course*> found;
    std::vector<std::string> missing;
    found.reserve(course_ids.size());

    for (const auto& raw_id : course_ids) {
        const Course* course = find(raw_id);
        if (course == nullptr) {
            missing.push_back(normalize_course_id(raw_id));
            continue;
        }
        found.push_back(course);
    }

    if (!missing.empty()) {
        throw UnknownCourse(missing);
    }
    return found;
}

const Course* Catalogue::find(const std::string& course_id) const {
    auto it = course_index_.find(normalize_course_id(course_id));
    if (it == course_index_.end()) return nullptr;
    return &courses_[it->second];
}

std::vector<std::string> Catalogue::course_ids() const {
    std::vector<std::string> ids;
    ids.reserve(courses_.size());
    for (const auto& course : courses_) {
        ids.push_back(course.course_id);
    }
    return ids;
}
