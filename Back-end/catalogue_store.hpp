#pragma once

#include "catalogue.hpp"

#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

// ==================== CATALOGUE STORE ====================
// Holds the live catalogue. Readers take a snapshot per request; a reload builds a
// new Catalogue and swaps the pointer, so in-flight requests keep their old copy.
class CatalogueStore {
public:
    CatalogueStore();
    explicit CatalogueStore(std::shared_ptr<const Catalogue> initial);
    ~CatalogueStore();

    CatalogueStore(const CatalogueStore&) = delete;
    CatalogueStore& operator=(const CatalogueStore&) = delete;

    std::shared_ptr<const Catalogue> snapshot() const;
    void publish(std::shared_ptr<const Catalogue> catalogue);

    // Throws MalformedCatalogue and leaves the live catalogue untouched on failure.
    void reload_from_file(const std::string& path);

    // Polls the file's modification time and reloads when it changes. A zero
    // interval does nothing. Failed reloads are logged and skipped.
    void start_watching(const std::string& path, std::chrono::seconds interval);
    void stop_watching();

private:
    std::shared_ptr<const Catalogue> catalogue_;

    std::thread watcher_;
    std::mutex watch_mutex_;
    std::condition_variable watch_cv_;
    bool stop_requested_{false};

    void watch_loop(std::string path, std::chrono::seconds interval);
    bool poll_once(const std::string& path, std::filesystem::file_time_type& last_seen);
};
