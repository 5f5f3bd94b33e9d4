#include "catalogue_store.hpp"
#include "json_handler.hpp"
#include "schedule_errors.hpp"
#include "schedule_service.hpp"
#include "server_config.hpp"

#include <httplib.h>

#include <chrono>
#include <iostream>

// ==================== MAIN SERVER ====================
int main(int argc, char* argv[]) {
    ServerConfig config;
    try {
        config = ServerConfig::from_args(argc, argv);
    } catch (const ConfigError& e) {
        std::cerr << e.what() << std::endl;
        std::cerr << ServerConfig::usage(argv[0]);
        return 1;
    }

    // A catalogue that cannot be served is a startup failure, not a per-request one.
    CatalogueStore store;
    try {
        store.reload_from_file(config.catalogue_file);
    } catch (const MalformedCatalogue& e) {
        std::cerr << e.what() << std::endl;
        std::cerr << "Run catalogue_refresh to rebuild " << config.catalogue_file << " first." << std::endl;
        return 1;
    }
    store.start_watching(config.catalogue_file, std::chrono::seconds(config.reload_interval_seconds));

    httplib::Server svr;
    ScheduleService service(store, config);
    service.register_routes(svr);

    // Global error handler to prevent server crashes
    svr.set_exception_handler([](const httplib::Request&, httplib::Response& res, std::exception_ptr ep) {
        std::string message = "Unknown server error";
        try {
            std::rethrow_exception(ep);
        } catch (const std::exception& e) {
            message = std::string("Server error: ") + e.what();
        } catch (...) {
        }
        std::cerr << message << std::endl;
        res.set_content(JsonHandler::error_response(message).dump(2), "application/json");
        res.status = 500;
    });

    // 404 and other empty error responses
    svr.set_error_handler([](const httplib::Request& req, httplib::Response& res) {
        if (!res.body.empty()) return;
        std::string message = res.status == 404 ? "Endpoint not found: " + req.path
                                                : "Request failed with status " + std::to_string(res.status);
        res.set_content(JsonHandler::error_response(message).dump(2), "application/json");
    });

    std::cout << "==========================================" << std::endl;
    std::cout << "         Auto Schedule Builder            " << std::endl;
    std::cout << "==========================================" << std::endl;
    std::cout << "Server running on: http://" << config.host << ":" << config.port << std::endl;
    std::cout << "Catalogue: " << config.catalogue_file;
    if (config.reload_interval_seconds > 0) {
        std::cout << " (checked every " << config.reload_interval_seconds << "s)";
    }
    std::cout << std::endl;
    std::cout << "Result cap: " << config.default_cap << " (max " << config.max_cap << ")" << std::endl;
    std::cout << "Endpoints:" << std::endl;
    std::cout << "  GET  /             - Schedule form" << std::endl;
    std::cout << "  POST /             - Submit schedule form" << std::endl;
    std::cout << "  POST /api/solve    - Enumerate schedules (JSON)" << std::endl;
    std::cout << "  GET  /api/courses  - List catalogue courses" << std::endl;
    std::cout << "  GET  /health       - Health check" << std::endl;
    std::cout << "==========================================" << std::endl;

    if (!svr.listen(config.host, config.port)) {
        std::cerr << "Server failed to start on " << config.host << ":" << config.port << std::endl;
        store.stop_watching();
        return 1;
    }

    store.stop_watching();
    return 0;
}
