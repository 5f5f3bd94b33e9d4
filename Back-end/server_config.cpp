#include "server_config.hpp"
#include "schedule_errors.hpp"

#include <fstream>
#include <stdexcept>
#include <vector>

using json = nlohmann::json;

namespace {

int to_int(const std::string& flag, const std::string& value) {
    size_t used = 0;
    int parsed = 0;
    try {
        parsed = std::stoi(value, &used);
    } catch (const std::exception&) {
        throw ConfigError(flag + " expects an integer, got \"" + value + "\"");
    }
    if (used != value.size()) {
        throw ConfigError(flag + " expects an integer, got \"" + value + "\"");
    }
    return parsed;
}

template <typename T>
void read_key(const json& config_json, const char* key, T& target) {
    auto it = config_json.find(key);
    if (it == config_json.end()) return;
    try {
        target = it->get<T>();
    } catch (const json::type_error&) {
        throw ConfigError(std::string("\"") + key + "\" has the wrong type");
    }
}

}  // namespace

void ServerConfig::apply_json(const json& config_json) {
    if (!config_json.is_object()) {
        throw ConfigError("config file must contain a JSON object");
    }
    read_key(config_json, "host", host);
    read_key(config_json, "port", port);
    read_key(config_json, "catalogueFile", catalogue_file);
    read_key(config_json, "defaultCap", default_cap);
    read_key(config_json, "maxCap", max_cap);
    read_key(config_json, "maxCourses", max_courses);
    read_key(config_json, "reloadIntervalSeconds", reload_interval_seconds);
    read_key(config_json, "searchTimeoutMs", search_timeout_ms);
}

void ServerConfig::load_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigError("cannot open " + path);
    }
    try {
        apply_json(json::parse(in));
    } catch (const json::parse_error& e) {
        throw ConfigError(path + ": " + e.what());
    }
}

void ServerConfig::validate() const {
    if (host.empty()) throw ConfigError("host must not be empty");
    if (port <= 0 || port > 65535) throw ConfigError("port out of range: " + std::to_string(port));
    if (catalogue_file.empty()) throw ConfigError("catalogue file must not be empty");
    if (default_cap <= 0) throw ConfigError("default cap must be positive");
    if (max_cap < default_cap) throw ConfigError("max cap must be at least the default cap");
    if (max_courses <= 0) throw ConfigError("max courses must be positive");
    if (reload_interval_seconds < 0) throw ConfigError("reload interval must not be negative");
    if (search_timeout_ms < 0) throw ConfigError("search timeout must not be negative");
}

ServerConfig ServerConfig::from_args(int argc, const char* const argv[]) {
    std::vector<std::string> args(argv + 1, argv + argc);
    ServerConfig config;

    // The config file is applied first so flags always win.
    for (size_t i = 0; i < args.size(); ++i) {
        if (args[i] == "--config") {
            if (i + 1 >= args.size()) throw ConfigError("--config expects a value");
            config.load_file(args[i + 1]);
        }
    }

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& flag = args[i];
        if (i + 1 >= args.size()) {
            throw ConfigError(flag.rfind("--", 0) == 0 ? flag + " expects a value" : "unexpected argument " + flag);
        }
        const std::string& value = args[++i];

        if (flag == "--config") continue;
        else if (flag == "--host") config.host = value;
        else if (flag == "--port") config.port = to_int(flag, value);
        else if (flag == "--catalogue") config.catalogue_file = value;
        else if (flag == "--cap") config.default_cap = to_int(flag, value);
        else if (flag == "--max-cap") config.max_cap = to_int(flag, value);
        else if (flag == "--max-courses") config.max_courses = to_int(flag, value);
        else if (flag == "--reload-interval") config.reload_interval_seconds = to_int(flag, value);
        else if (flag == "--timeout-ms") config.search_timeout_ms = to_int(flag, value);
        else throw ConfigError("unknown option " + flag);
    }

    config.validate();
    return config;
}

std::string ServerConfig::usage(const std::string& program) {
    return "Usage: " + program + " [--config FILE] [--host HOST] [--port PORT]\n"
           "       [--catalogue FILE] [--cap N] [--max-cap N] [--max-courses N]\n"
           "       [--reload-interval SECONDS] [--timeout-ms MS]\n";
}
