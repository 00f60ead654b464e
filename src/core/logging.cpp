/**
 * ============================================================================
 * SOFTWARE: Assets: Personal Ledger Core
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: logging.cpp
 * ============================================================================
 */

#include "logging.hpp"
#include <chrono>
#include <ctime>
#include <deque>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace assets {

namespace {

const size_t MAX_LOG_LINES = 200;

std::deque<std::string> system_logs;
std::mutex log_mutex;
bool echo_enabled = true;

} // namespace

void log(const std::string& level, const std::string& message) {
    std::lock_guard<std::mutex> lock(log_mutex);

    if (system_logs.size() >= MAX_LOG_LINES) {
        system_logs.pop_front();
    }

    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local{};
    localtime_r(&now, &local);
    std::stringstream ss;
    ss << std::put_time(&local, "%H:%M:%S");

    std::string log_entry = "[" + ss.str() + "] [" + level + "] " + message;
    system_logs.push_back(log_entry);

    if (echo_enabled) {
        std::cout << log_entry << std::endl;
    }
}

std::vector<std::string> recent_logs() {
    std::lock_guard<std::mutex> lock(log_mutex);
    return std::vector<std::string>(system_logs.begin(), system_logs.end());
}

void set_log_echo(bool enabled) {
    std::lock_guard<std::mutex> lock(log_mutex);
    echo_enabled = enabled;
}

void clear_logs() {
    std::lock_guard<std::mutex> lock(log_mutex);
    system_logs.clear();
}

} // namespace assets
