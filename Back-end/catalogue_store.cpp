#include "catalogue_store.hpp"
#include "json_handler.hpp"
#include "schedule_errors.hpp"

#include <atomic>
#include <iostream>
#include <utility>

CatalogueStore::CatalogueStore() : catalogue_(std::make_shared<const Catalogue>()) {}

CatalogueStore::CatalogueStore(std::shared_ptr<const Catalogue> initial) : catalogue_(std::move(initial)) {
    if (!catalogue_) {
        catalogue_ = std::make_shared<const Catalogue>();
    }
}

CatalogueStore::~CatalogueStore() {
    stop_watching();
}

std::shared_ptr<const Catalogue> CatalogueStore::snapshot() const {
    return std::atomic_load(&catalogue_);
}

void CatalogueStore::publish(std::shared_ptr<const Catalogue> catalogue) {
    if (!catalogue) return;
    std::atomic_store(&catalogue_, std::move(catalogue));
}

void CatalogueStore::reload_from_file(const std::string& path) {
    auto fresh = std::make_shared<const Catalogue>(JsonHandler::load_catalogue_file(path));
    std::cout << "Loaded catalogue " << path << ": " << fresh->course_count() << " courses, "
              << fresh->section_count() << " sections" << std::endl;
    publish(std::move(fresh));
}

void CatalogueStore::start_watching(const std::string& path, std::chrono::seconds interval) {
    if (interval.count() <= 0 || watcher_.joinable()) return;

    {
        std::lock_guard<std::mutex> lock(watch_mutex_);
        stop_requested_ = false;
    }
    watcher_ = std::thread(&CatalogueStore::watch_loop, this, path, interval);
}

void CatalogueStore::stop_watching() {
    {
        std::lock_guard<std::mutex> lock(watch_mutex_);
        stop_requested_ = true;
    }
    watch_cv_.notify_all();
    if (watcher_.joinable()) {
        watcher_.join();
    }
}

void CatalogueStore::watch_loop(std::string path, std::chrono::seconds interval) {
    std::error_code ec;
    auto last_seen = std::filesystem::last_write_time(path, ec);
    if (ec) {
        std::cerr << "Catalogue watcher: cannot stat " << path << ": " << ec.message() << std::endl;
        last_seen = std::filesystem::file_time_type::min();
    }

    std::unique_lock<std::mutex> lock(watch_mutex_);
    while (!watch_cv_.wait_for(lock, interval, [this] { return stop_requested_; })) {
        lock.unlock();
        poll_once(path, last_seen);
        lock.lock();
    }
}

bool CatalogueStore::poll_once(const std::string& path, std::filesystem::file_time_type& last_seen) {
    std::error_code ec;
    auto modified = std::filesystem::last_write_time(path, ec);
    if (ec || modified == last_seen) return false;

    last_seen = modified;
    try {
        reload_from_file(path);
        return true;
    } catch (const ScheduleError& e) {
        std::cerr << "Catalogue reload failed, keeping previous catalogue: " << e.what() << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "Catalogue reload failed, keeping previous catalogue: Unexpected error: " << e.what() << std::endl;
    }
    return false;
}
