#include "log.hpp"
#include <atomic>
#include <iostream>
#include <mutex>

namespace wordclip {

namespace {
std::atomic<bool> g_verbose{false};
std::mutex g_log_mutex;  // track workers log concurrently
}

void set_verbose(bool verbose) { g_verbose.store(verbose); }
bool is_verbose() { return g_verbose.load(); }

void log_debug(const std::string& msg) {
    if (!g_verbose.load()) return;
    std::lock_guard<std::mutex> lock(g_log_mutex);
    std::cout << "[DEBUG] " << msg << std::endl;
}

void log_info(const std::string& msg) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    std::cout << "[INFO] " << msg << std::endl;
}

void log_warn(const std::string& msg) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    std::cerr << "[WARN] " << msg << std::endl;
}

void log_error(const std::string& msg) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    std::cerr << "[ERROR] " << msg << std::endl;
}

} // namespace wordclip
