#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

// ==================== ERROR SYSTEM ====================
class ScheduleError : public std::runtime_error {
public:
    explicit ScheduleError(const std::string& message) : std::runtime_error(message) {}
};

class MalformedCatalogue : public ScheduleError {
public:
    explicit MalformedCatalogue(const std::string& message)
        : ScheduleError("Malformed catalogue: " + message) {}

    MalformedCatalogue(const std::string& course_id, const std::string& section_id, const std::string& message)
        : ScheduleError("Malformed catalogue: course " + course_id +
                        (section_id.empty() ? "" : " section " + section_id) + ": " + message),
          course_id_(course_id), section_id_(section_id) {}

    const std::string& course_id() const { return course_id_; }
    const std::string& section_id() const { return section_id_; }

private:
    std::string course_id_;
    std::string section_id_;
};

class UnknownCourse : public ScheduleError {
public:
    explicit UnknownCourse(std::vector<std::string> course_ids)
        : ScheduleError(build_message(course_ids)), course_ids_(std::move(course_ids)) {}

    const std::vector<std::string>& course_ids() const { return course_ids_; }

private:
    std::vector<std::string> course_ids_;

    static std::string build_message(const std::vector<std::string>& ids) {
        std::string message = ids.size() == 1 ? "Unknown course: " : "Unknown courses: ";
        for (size_t i = 0; i < ids.size(); ++i) {
            if (i > 0) message += ", ";
            message += ids[i];
        }
        return message;
    }
};

class MalformedRequest : public ScheduleError {
public:
    explicit MalformedRequest(const std::string& message) : ScheduleError("Malformed request: " + message) {}
};

class ConfigError : public ScheduleError {
public:
    explicit ConfigError(const std::string& message) : ScheduleError("Config error: " + message) {}
};
