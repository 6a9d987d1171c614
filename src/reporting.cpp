#include "procrt/reporting.hpp"

#include <atomic>
#include <iostream>
#include <mutex>

namespace procrt {
namespace reporting {

static std::atomic<bool> g_csv{false};
static std::atomic<bool> g_verbose{false};
static std::mutex g_io;

void set_csv(bool value) {
    g_csv.store(value, std::memory_order_relaxed);
}

bool csv_enabled() {
    return g_csv.load(std::memory_order_relaxed);
}

void set_verbose(bool value) {
    g_verbose.store(value, std::memory_order_relaxed);
}

bool verbose_enabled() {
    return g_verbose.load(std::memory_order_relaxed);
}

void info(std::string_view tag, const std::string& msg) {
    std::lock_guard<std::mutex> lk(g_io);
    std::cout << "[" << tag << "] " << msg << "\n";
}

void warn(std::string_view tag, const std::string& msg) {
    std::lock_guard<std::mutex> lk(g_io);
    std::cerr << "[" << tag << "] " << msg << "\n";
}

void debug(std::string_view tag, const std::string& msg) {
    if (!verbose_enabled()) return;
    std::lock_guard<std::mutex> lk(g_io);
    std::cout << "[" << tag << "] " << msg << "\n";
}

void report_event(const LifecycleEvent& evt) {
    std::lock_guard<std::mutex> lk(g_io);
    if (csv_enabled()) {
        std::cout << evt.process_id << "," << to_string(evt.state) << "," << evt.owner_id << ","
                  << evt.gateway_server_id << "," << evt.freed.cpu << "," << evt.freed.ram << ","
                  << evt.freed.hdd << "," << evt.freed.net << "," << to_millis(evt.at) << "\n";
        return;
    }
    std::cout << "[EVENT] process " << evt.process_id << " state=" << to_string(evt.state)
              << " owner=" << evt.owner_id << " gateway=" << evt.gateway_server_id
              << " freed " << evt.freed.to_string() << "\n";
}

void emit(const std::string& line) {
    std::lock_guard<std::mutex> lk(g_io);
    std::cout << line << "\n" << std::flush;
}

} // namespace reporting
} // namespace procrt
