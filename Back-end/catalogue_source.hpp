#pragma once

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

// ==================== REGISTRAR DUMP CONVERSION ====================
// The registrar's schedule-builder service answers with JavaScript shaped like
// `define({data:[ ... ]})`. These helpers turn that dump into the catalogue file.

struct RegistrarConversion {
    nlohmann::json catalogue = nlohmann::json::object();
    int section_count{0};
    std::vector<std::string> warnings;   // skipped rows and meetings
};

// Extracts the literal inside define( ... ) and quotes bare keys. Throws MalformedCatalogue.
std::string js_to_json(const std::string& js);

// Section records are [course, section, crn, units, instructor, flags..., title, meetings];
// meetings are [day 1..7 (U..S), start seconds, end seconds, room]. Throws MalformedCatalogue
// when the `data` array is missing.
RegistrarConversion transform_registrar_data(const nlohmann::json& blob);
