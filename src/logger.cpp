// logger.cpp

#include "logger.hpp"
#include "utils.hpp"

#include <fstream>
#include <iostream>
#include <mutex>

namespace {

std::mutex log_mutex;
std::string log_dir = DEFAULT_LOGS_PATH;
bool debug_enabled = false;

void write_line(const std::string& line) {
    std::lock_guard<std::mutex> lock(log_mutex);

    // Log to STDOUT
    std::cout << line << std::endl;

    if (log_dir.empty()) {
        return;
    }

    // Log to a backup file inside the logs directory
    std::string logfile_path = log_dir;
    if (logfile_path.back() != '/') {
        logfile_path += '/';
    }
    logfile_path += LOG_FILE_NAME;
    std::ofstream logfile(logfile_path, std::ios::app);
    if (logfile.is_open()) {
        logfile << line << std::endl;
    }
}

}  // namespace

void set_log_dir(const std::string& dir) {
    std::lock_guard<std::mutex> lock(log_mutex);
    log_dir = dir;
}

void set_debug_logging(bool enabled) {
    std::lock_guard<std::mutex> lock(log_mutex);
    debug_enabled = enabled;
}

void log_status(const std::string& message) {
    write_line("[" + get_timestamp() + "] " + message);
}

void log_debug(const std::string& message) {
    {
        std::lock_guard<std::mutex> lock(log_mutex);
        if (!debug_enabled) {
            return;
        }
    }
    write_line("[" + get_timestamp() + "] DEBUG: " + message);
}
