#include "json_handler.hpp"
#include "schedule_errors.hpp"

#include <algorithm>
#include <fstream>
#include <stdexcept>
#include <utility>

namespace {

// Registrar fields arrive either as strings or as bare numbers (CRNs).
std::string string_field(const json& object, const char* key) {
    auto it = object.find(key);
    if (it == object.end() || it->is_null()) return "";
    if (it->is_string()) return it->get<std::string>();
    if (it->is_number_integer()) return std::to_string(it->get<long long>());
    throw std::invalid_argument(std::string("field \"") + key + "\" must be a string or an integer");
}

}  // namespace

// ==================== CATALOGUE PARSING ====================
Catalogue JsonHandler::parse_catalogue(const json& input_data) {
    if (!input_data.is_object()) {
        throw MalformedCatalogue("top level must be an object mapping course codes to section lists");
    }

    std::vector<Course> courses;
    courses.reserve(input_data.size());

    for (const auto& item : input_data.items()) {
        Course course;
        course.course_id = item.key();

        if (!item.value().is_array()) {
            throw MalformedCatalogue(course.course_id, "", "sections must be an array");
        }
        for (const auto& section_json : item.value()) {
            course.sections.push_back(parse_section(course.course_id, section_json));
        }

        courses.push_back(std::move(course));
    }

    return Catalogue(std::move(courses));
}

Catalogue JsonHandler::load_catalogue_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw MalformedCatalogue("cannot open " + path);
    }

    json input_data;
    try {
        input_data = json::parse(in);
    } catch (const json::parse_error& e) {
        throw MalformedCatalogue(path + ": " + e.what());
    }

    return parse_catalogue(input_data);
}

Section JsonHandler::parse_section(const std::string& course_id, const json& section_json) {
    if (!section_json.is_object()) {
        throw MalformedCatalogue(course_id, "", "section entry must be an object");
    }

    Section section;
    try {
        section.section_id = string_field(section_json, "crn");
        section.section_number = string_field(section_json, "section");
        section.instructor = string_field(section_json, "instructor");
        section.title = string_field(section_json, "title");
        section.location = string_field(section_json, "location");
    } catch (const std::invalid_argument& e) {
        throw MalformedCatalogue(course_id, section.section_id, e.what());
    }

    if (section.section_id.empty()) {
        section.section_id = section.section_number;
    }
    if (section.section_id.empty()) {
        throw MalformedCatalogue(course_id, "", "section has neither \"crn\" nor \"section\"");
    }

    if (section_json.contains("meetings")) {
        const auto& meetings = section_json["meetings"];
        if (!meetings.is_array()) {
            throw MalformedCatalogue(course_id, section.section_id, "\"meetings\" must be an array");
        }
        for (const auto& meeting_json : meetings) {
            section.blocks.push_back(parse_meeting(course_id, section.section_id, meeting_json));
        }
    } else if (section_json.contains("days") || section_json.contains("start") || section_json.contains("end")) {
        // Flat single-meeting form
        section.blocks.push_back(parse_meeting(course_id, section.section_id, section_json));
    }

    return section;
}

TimeBlock JsonHandler::parse_meeting(const std::string& course_id, const std::string& section_id,
                                     const json& meeting_json) {
    if (!meeting_json.is_object()) {
        throw MalformedCatalogue(course_id, section_id, "meeting entry must be an object");
    }
    for (const char* key : {"days", "start", "end"}) {
        if (!meeting_json.contains(key) || !meeting_json[key].is_string()) {
            throw MalformedCatalogue(course_id, section_id, std::string("meeting needs a string \"") + key + "\"");
        }
    }

    try {
        return TimeBlock(parse_days(meeting_json["days"].get<std::string>()),
                         parse_hhmm(meeting_json["start"].get<std::string>()),
                         parse_hhmm(meeting_json["end"].get<std::string>()));
    } catch (const std::invalid_argument& e) {
        throw MalformedCatalogue(course_id, section_id, e.what());
    }
}

// ==================== RESPONSES ====================
json JsonHandler::section_to_json(const Course& course, const Section& section) {
    json section_data;
    section_data["course"] = course.course_id;
    section_data["crn"] = section.section_id;
    section_data["section"] = section.section_number;
    section_data["instructor"] = section.instructor;
    section_data["title"] = section.title;
    section_data["location"] = section.location;

    json meetings_json = json::array();
    DayMask all_days = 0;
    int first_start = MINUTES_PER_DAY;
    int last_end = 0;
    for (const auto& block : section.blocks) {
        meetings_json.push_back({
            {"days", format_days(block.days())},
            {"start", format_hhmm(block.start())},
            {"end", format_hhmm(block.end())}
        });
        all_days |= block.days();
        first_start = std::min(first_start, block.start());
        last_end = std::max(last_end, block.end());
    }
    section_data["meetings"] = meetings_json;

    // Summary fields kept for clients of the flat format
    section_data["days"] = format_days(all_days);
    if (section.blocks.empty()) {
        section_data["start"] = nullptr;
        section_data["end"] = nullptr;
    } else {
        section_data["start"] = format_hhmm(first_start);
        section_data["end"] = format_hhmm(last_end);
    }

    return section_data;
}

json JsonHandler::schedule_to_json(const Schedule& schedule) {
    json schedule_json = json::array();
    for (const auto& entry : schedule) {
        schedule_json.push_back(section_to_json(*entry.course, *entry.section));
    }
    return schedule_json;
}

json JsonHandler::create_response(const EnumerationResult& result) {
    json response;
    response["success"] = true;
    response["count"] = result.schedules.size();
    response["truncated"] = result.truncated;
    response["timedOut"] = result.timed_out;

    json schedules_json = json::array();
    for (const auto& schedule : result.schedules) {
        schedules_json.push_back(schedule_to_json(schedule));
    }
    response["schedules"] = schedules_json;

    return response;
}

json JsonHandler::error_response(const std::string& error) {
    json response;
    response["success"] = false;
    response["error"] = error;
    return response;
}
