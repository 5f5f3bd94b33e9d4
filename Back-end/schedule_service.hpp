#pragma once

#include "catalogue_store.hpp"
#include "html_view.hpp"
#include "json_handler.hpp"
#include "schedule_enumerator.hpp"
#include "server_config.hpp"

#include <httplib.h>

#include <string>
#include <vector>

// ==================== SOLVE REQUEST ====================
struct SolveRequest {
    std::vector<std::string> courses;
    EnumerationOptions options;
};

// ==================== SCHEDULE SERVICE ====================
// HTTP glue between cpp-httplib and the enumerator. Every handler takes its own
// catalogue snapshot, so a concurrent reload never changes a request midway.
class ScheduleService {
public:
    ScheduleService(CatalogueStore& store, const ServerConfig& config);

    void register_routes(httplib::Server& svr);

    void handle_index(const httplib::Request& req, httplib::Response& res) const;
    void handle_form(const httplib::Request& req, httplib::Response& res) const;
    void handle_solve(const httplib::Request& req, httplib::Response& res) const;
    void handle_courses(const httplib::Request& req, httplib::Response& res) const;
    void handle_health(const httplib::Request& req, httplib::Response& res) const;

    // Both throw MalformedRequest on bad fields.
    SolveRequest parse_solve_json(const json& body) const;
    SolveRequest parse_form(const FormValues& form) const;

    // Throws UnknownCourse before any search starts.
    EnumerationResult solve(const Catalogue& catalogue, const SolveRequest& request) const;

private:
    CatalogueStore& store_;
    const ServerConfig& config_;

    int checked_cap(long long cap) const;
    void check_course_list(const std::vector<std::string>& courses) const;
    void apply_window(EnumerationOptions& options, const std::string& start,
                      const std::string& end, const std::string& days) const;
};

std::vector<std::string> split_course_list(const std::string& text);
