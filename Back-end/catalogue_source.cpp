#include "catalogue_source.hpp"
#include "schedule_errors.hpp"
#include "time_block.hpp"

#include <regex>

using json = nlohmann::json;

namespace {

const char DAY_MAP[] = {'U', 'M', 'T', 'W', 'R', 'F', 'S'};
constexpr int MIN_SECTION_FIELDS = 7;

struct MeetingGroup {
    int start_seconds;
    int end_seconds;
    DayMask days;
};

std::string scalar_text(const json& value) {
    if (value.is_string()) return value.get<std::string>();
    if (value.is_number_integer()) return std::to_string(value.get<long long>());
    return "";
}

}  // namespace

std::string js_to_json(const std::string& js) {
    auto open = js.find("define(");
    auto close = js.rfind(')');
    if (open == std::string::npos || close == std::string::npos || close < open + 7) {
        throw MalformedCatalogue("couldn't find the define( ... ) wrapper, the dump format changed");
    }
    std::string literal = js.substr(open + 7, close - open - 7);

    // Keys are only quoted outside string literals, so titles like "Intro, Part: Two" survive.
    static const std::regex bare_key(R"(([{\[,])\s*([A-Za-z_]\w*)\s*:)");
    std::string out;
    out.reserve(literal.size() + literal.size() / 8);

    size_t pos = 0;
    while (pos < literal.size()) {
        size_t quote = literal.find_first_of("\"'", pos);
        if (quote == std::string::npos) quote = literal.size();
        out += std::regex_replace(literal.substr(pos, quote - pos), bare_key, "$1\"$2\":");
        if (quote == literal.size()) break;

        size_t end = quote + 1;
        while (end < literal.size() && literal[end] != literal[quote]) {
            end += literal[end] == '\\' ? 2 : 1;
        }
        if (end >= literal.size()) {
            throw MalformedCatalogue("unterminated string literal in the registrar dump");
        }
        out.append(literal, quote, end - quote + 1);
        pos = end + 1;
    }
    return out;
}

RegistrarConversion transform_registrar_data(const json& blob) {
    if (!blob.is_object() || !blob.contains("data") || !blob["data"].is_array()) {
        throw MalformedCatalogue("registrar dump has no \"data\" array");
    }

    RegistrarConversion conversion;

    for (const auto& course_arr : blob["data"]) {
        if (!course_arr.is_array() || course_arr.empty() || !course_arr[0].is_string()) {
            conversion.warnings.push_back("skipped a course record without a course code");
            continue;
        }
        const std::string course_code = course_arr[0].get<std::string>();

        for (size_t i = 3; i < course_arr.size(); ++i) {
            const json& raw_sec = course_arr[i];
            if (!raw_sec.is_array() || raw_sec.size() < MIN_SECTION_FIELDS) {
                conversion.warnings.push_back(course_code + ": skipped a short section record");
                continue;
            }

            std::string crn = scalar_text(raw_sec[2]);
            if (crn.empty()) {
                conversion.warnings.push_back(course_code + ": skipped a section without a CRN");
                continue;
            }

            const json& meetings = raw_sec[raw_sec.size() - 1];
            std::vector<MeetingGroup> groups;
            std::string room;

            if (meetings.is_array()) {
                for (const auto& meeting : meetings) {
                    if (!meeting.is_array() || meeting.size() < 4) continue;   // malformed row
                    if (!meeting[0].is_number_integer() || !meeting[1].is_number_integer() ||
                        !meeting[2].is_number_integer()) {
                        continue;
                    }

                    int day_num = meeting[0].get<int>();
                    int start_seconds = meeting[1].get<int>();
                    int end_seconds = meeting[2].get<int>();
                    if (day_num < 1 || day_num > 7 || start_seconds < 0 || start_seconds >= end_seconds ||
                        end_seconds > MINUTES_PER_DAY * 60) {
                        conversion.warnings.push_back(course_code + " CRN " + crn + ": skipped an invalid meeting");
                        continue;
                    }

                    std::string meeting_room = scalar_text(meeting[3]);
                    if (!meeting_room.empty()) room = meeting_room;

                    // Same time on several days collapses into one block.
                    DayMask bit = day_bit(DAY_MAP[day_num - 1]);
                    bool merged = false;
                    for (auto& group : groups) {
                        if (group.start_seconds == start_seconds && group.end_seconds == end_seconds) {
                            group.days |= bit;
                            merged = true;
                            break;
                        }
                    }
                    if (!merged) {
                        groups.push_back({start_seconds, end_seconds, bit});
                    }
                }
            }

            json meetings_json = json::array();
            for (const auto& group : groups) {
                meetings_json.push_back({
                    {"days", format_days(group.days)},
                    {"start", format_hhmm(group.start_seconds / 60)},
                    {"end", format_hhmm((group.end_seconds + 59) / 60)}
                });
            }

            json section_json;
            section_json["crn"] = raw_sec[2];
            section_json["section"] = scalar_text(raw_sec[1]);
            section_json["instructor"] = scalar_text(raw_sec[4]);
            section_json["title"] = scalar_text(raw_sec[raw_sec.size() - 2]);
            section_json["location"] = room;
            section_json["meetings"] = meetings_json;

            conversion.catalogue[course_code].push_back(section_json);
            conversion.section_count++;
        }
    }

    return conversion;
}
