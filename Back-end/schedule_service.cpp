#include "schedule_service.hpp"
#include "schedule_errors.hpp"

#include <ctime>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <unordered_set>

namespace {

void send_json(httplib::Response& res, const json& body, int status) {
    res.set_content(body.dump(2), "application/json");
    res.status = status;
}

std::string join(const std::vector<std::string>& items) {
    std::string out;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) out += " ";
        out += items[i];
    }
    return out;
}

}  // namespace

std::vector<std::string> split_course_list(const std::string& text) {
    std::vector<std::string> courses;
    std::istringstream in(text);
    std::string token;
    while (in >> token) {
        courses.push_back(normalize_course_id(token));
    }
    return courses;
}

ScheduleService::ScheduleService(CatalogueStore& store, const ServerConfig& config)
    : store_(store), config_(config) {}

void ScheduleService::register_routes(httplib::Server& svr) {
    svr.Get("/", [this](const httplib::Request& req, httplib::Response& res) { handle_index(req, res); });
    svr.Post("/", [this](const httplib::Request& req, httplib::Response& res) { handle_form(req, res); });
    svr.Post("/api/solve", [this](const httplib::Request& req, httplib::Response& res) { handle_solve(req, res); });
    svr.Get("/api/courses", [this](const httplib::Request& req, httplib::Response& res) { handle_courses(req, res); });
    svr.Get("/health", [this](const httplib::Request& req, httplib::Response& res) { handle_health(req, res); });

    // CORS preflight
    svr.Options("/api/solve", [](const httplib::Request&, httplib::Response& res) {
        res.set_header("Access-Control-Allow-Origin", "*");
        res.set_header("Access-Control-Allow-Methods", "POST, OPTIONS");
        res.set_header("Access-Control-Allow-Headers", "Content-Type");
        res.status = 204;
    });
}

// ==================== REQUEST PARSING ====================
int ScheduleService::checked_cap(long long cap) const {
    if (cap <= 0 || cap > config_.max_cap) {
        throw MalformedRequest("cap must be between 1 and " + std::to_string(config_.max_cap));
    }
    return static_cast<int>(cap);
}

// The search recurses once per course, so the list length bounds its stack depth.
void ScheduleService::check_course_list(const std::vector<std::string>& courses) const {
    if (courses.size() > static_cast<size_t>(config_.max_courses)) {
        throw MalformedRequest("at most " + std::to_string(config_.max_courses) + " courses per request, got " +
                               std::to_string(courses.size()));
    }
    std::unordered_set<std::string> seen;
    for (const auto& id : courses) {
        if (!seen.insert(id).second) {
            throw MalformedRequest("course " + id + " is listed more than once");
        }
    }
}

void ScheduleService::apply_window(EnumerationOptions& options, const std::string& start,
                                   const std::string& end, const std::string& days) const {
    try {
        if (!start.empty()) options.earliest_start = parse_hhmm(start);
        if (!end.empty()) options.latest_end = parse_hhmm(end);
        if (!days.empty()) options.allowed_days = parse_days(days);
    } catch (const std::invalid_argument& e) {
        throw MalformedRequest(e.what());
    }
    if (options.earliest_start > options.latest_end) {
        throw MalformedRequest("earliest start " + start + " is after latest finish " + end);
    }
}

SolveRequest ScheduleService::parse_solve_json(const json& body) const {
    if (!body.is_object()) {
        throw MalformedRequest("body must be a JSON object");
    }
    if (!body.contains("courses") || !body["courses"].is_array()) {
        throw MalformedRequest("\"courses\" must be an array of course codes");
    }

    SolveRequest request;
    for (const auto& course : body["courses"]) {
        if (!course.is_string()) {
            throw MalformedRequest("\"courses\" must be an array of course codes");
        }
        request.courses.push_back(normalize_course_id(course.get<std::string>()));
    }
    check_course_list(request.courses);

    std::string fields[3];
    const char* keys[3] = {"start", "end", "days"};
    for (int i = 0; i < 3; ++i) {
        if (!body.contains(keys[i])) continue;
        if (!body[keys[i]].is_string()) {
            throw MalformedRequest(std::string("\"") + keys[i] + "\" must be a string");
        }
        fields[i] = body[keys[i]].get<std::string>();
    }
    apply_window(request.options, fields[0], fields[1], fields[2]);

    request.options.cap = config_.default_cap;
    if (body.contains("cap")) {
        if (!body["cap"].is_number_integer()) {
            throw MalformedRequest("\"cap\" must be an integer");
        }
        // Unsigned values beyond the signed range are rejected as well.
        if (body["cap"].is_number_unsigned() &&
            body["cap"].get<unsigned long long>() > static_cast<unsigned long long>(config_.max_cap)) {
            throw MalformedRequest("cap must be between 1 and " + std::to_string(config_.max_cap));
        }
        request.options.cap = checked_cap(body["cap"].get<long long>());
    }

    return request;
}

SolveRequest ScheduleService::parse_form(const FormValues& form) const {
    SolveRequest request;
    request.courses = split_course_list(form.courses);
    if (request.courses.empty()) {
        throw MalformedRequest("enter at least one course");
    }
    check_course_list(request.courses);
    apply_window(request.options, form.start, form.end, form.days);
    request.options.cap = config_.default_cap;
    return request;
}

// ==================== SOLVING ====================
EnumerationResult ScheduleService::solve(const Catalogue& catalogue, const SolveRequest& request) const {
    auto courses = catalogue.lookup(request.courses);

    EnumerationOptions options = request.options;
    if (config_.search_timeout_ms > 0) {
        options.set_timeout(std::chrono::milliseconds(config_.search_timeout_ms));
    }

    ScheduleEnumerator enumerator(options);
    EnumerationResult result = enumerator.enumerate(courses);

    std::cout << "Solve [" << join(request.courses) << "]: " << result.schedules.size() << " schedule(s)"
              << (result.truncated ? ", truncated" : "") << (result.timed_out ? ", timed out" : "") << std::endl;
    return result;
}

// ==================== HANDLERS ====================
void ScheduleService::handle_index(const httplib::Request&, httplib::Response& res) const {
    res.set_content(render_page(FormValues(), nullptr), "text/html; charset=utf-8");
}

void ScheduleService::handle_form(const httplib::Request& req, httplib::Response& res) const {
    FormValues form;
    form.courses = req.get_param_value("courses");
    form.start = req.get_param_value("start");
    form.end = req.get_param_value("end");
    form.days = req.get_param_value("days");

    PageResult page;
    int status = 200;
    auto catalogue = store_.snapshot();

    try {
        SolveRequest request = parse_form(form);
        EnumerationResult result = solve(*catalogue, request);
        for (const auto& schedule : result.schedules) {
            page.schedules.push_back(format_schedule_text(schedule));
        }
        page.truncated = result.truncated;
        page.timed_out = result.timed_out;
        page.cap = request.options.cap;
    } catch (const UnknownCourse& e) {
        page.error = e.what();
        status = 422;
    } catch (const MalformedRequest& e) {
        page.error = e.what();
        status = 400;
    }

    res.set_content(render_page(form, &page), "text/html; charset=utf-8");
    res.status = status;
}

void ScheduleService::handle_solve(const httplib::Request& req, httplib::Response& res) const {
    res.set_header("Access-Control-Allow-Origin", "*");

    if (req.body.empty()) {
        json error_response = JsonHandler::error_response("malformed-request");
        error_response["message"] = "Empty request body";
        send_json(res, error_response, 400);
        return;
    }

    auto catalogue = store_.snapshot();
    try {
        SolveRequest request = parse_solve_json(json::parse(req.body));
        EnumerationResult result = solve(*catalogue, request);

        json response = JsonHandler::create_response(result);
        if (result.schedules.empty()) {
            response["success"] = false;
            response["error"] = "no-schedule";
            send_json(res, response, 404);
            return;
        }
        send_json(res, response, 200);

    } catch (const json::parse_error& e) {
        json error_response = JsonHandler::error_response("malformed-request");
        error_response["message"] = std::string("JSON parse error: ") + e.what();
        send_json(res, error_response, 400);
    } catch (const MalformedRequest& e) {
        json error_response = JsonHandler::error_response("malformed-request");
        error_response["message"] = e.what();
        send_json(res, error_response, 400);
    } catch (const UnknownCourse& e) {
        json error_response = JsonHandler::error_response("unknown-course");
        error_response["message"] = e.what();
        error_response["unknownCourses"] = e.course_ids();
        send_json(res, error_response, 422);
    }
}

void ScheduleService::handle_courses(const httplib::Request&, httplib::Response& res) const {
    auto catalogue = store_.snapshot();
    json response;
    response["success"] = true;
    response["courses"] = catalogue->course_ids();
    send_json(res, response, 200);
}

void ScheduleService::handle_health(const httplib::Request&, httplib::Response& res) const {
    auto catalogue = store_.snapshot();
    json response;
    response["status"] = "healthy";
    response["service"] = "schedule_builder";
    response["courses"] = catalogue->course_count();
    response["sections"] = catalogue->section_count();
    response["timestamp"] = std::to_string(std::time(nullptr));
    send_json(res, response, 200);
}
