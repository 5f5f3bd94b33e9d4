#pragma once

#include <nlohmann/json.hpp>

#include <string>

// ==================== SERVER CONFIG ====================
struct ServerConfig {
    std::string host{"0.0.0.0"};
    int port{8080};
    std::string catalogue_file{"all_sections.json"};
    int default_cap{50};
    int max_cap{500};
    int max_courses{30};              // longest course list a request may name
    int reload_interval_seconds{0};   // 0 disables the catalogue watcher
    int search_timeout_ms{0};         // 0 means no deadline

    // Applies every key present in the document; throws ConfigError on bad values.
    void apply_json(const nlohmann::json& config_json);
    void load_file(const std::string& path);
    void validate() const;

    // Defaults, then --config <file>, then the remaining flags. Throws ConfigError.
    static ServerConfig from_args(int argc, const char* const argv[]);
    static std::string usage(const std::string& program);
};
