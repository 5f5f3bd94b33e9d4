#pragma once

#include "catalogue.hpp"
#include "schedule_enumerator.hpp"

#include <nlohmann/json.hpp>

#include <string>

using json = nlohmann::json;

// ==================== JSON HANDLER ====================
class JsonHandler {
public:
    // Catalogue document: { "<course>": [ {section}, ... ], ... }. Throws MalformedCatalogue.
    static Catalogue parse_catalogue(const json& input_data);
    static Catalogue load_catalogue_file(const std::string& path);

    static json section_to_json(const Course& course, const Section& section);
    static json schedule_to_json(const Schedule& schedule);
    static json create_response(const EnumerationResult& result);

    static json error_response(const std::string& error);

private:
    static Section parse_section(const std::string& course_id, const json& section_json);
    static TimeBlock parse_meeting(const std::string& course_id, const std::string& section_id,
                                   const json& meeting_json);
};
