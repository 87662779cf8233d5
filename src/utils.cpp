// utils.cpp

#include "utils.hpp"
#include "logger.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <dirent.h>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

// Creates a directory and any missing parents. Returns true if successful or if it already exists.
bool create_dir(const std::string& path) {
    if (path.empty()) {
        return false;
    }

    // Walk the path so nested base directories work on first run
    size_t pos = 0;
    while (true) {
        pos = path.find('/', pos + 1);
        std::string partial = path.substr(0, pos);
        if (!partial.empty() && mkdir(partial.c_str(), 0777) == -1 && errno != EEXIST) {
            std::cerr << "Error creating directory " << partial << ": " << strerror(errno) << std::endl;
            return false;
        }
        if (pos == std::string::npos) {
            break;
        }
    }
    return dir_exists(path);
}

bool dir_exists(const std::string& path) {
    struct stat info;
    return stat(path.c_str(), &info) == 0 && S_ISDIR(info.st_mode);
}

bool file_exists(const std::string& path) {
    struct stat info;
    return stat(path.c_str(), &info) == 0 && S_ISREG(info.st_mode);
}

static bool list_entries(const std::string& dir, bool want_dirs, std::vector<std::string>& out) {
    DIR* handle = opendir(dir.c_str());
    if (handle == nullptr) {
        return false;
    }

    while (struct dirent* entry = readdir(handle)) {
        std::string name = entry->d_name;
        if (name == "." || name == "..") {
            continue;
        }
        std::string full = dir + "/" + name;
        if (want_dirs ? dir_exists(full) : file_exists(full)) {
            out.push_back(want_dirs ? name : full);
        }
    }
    closedir(handle);

    std::sort(out.begin(), out.end());
    return true;
}

bool list_files(const std::string& dir, std::vector<std::string>& files) {
    files.clear();
    return list_entries(dir, false, files);
}

std::vector<std::string> list_dirs(const std::string& dir) {
    std::vector<std::string> dirs;
    list_entries(dir, true, dirs);
    return dirs;
}

bool remove_dir(const std::string& path) {
    std::vector<std::string> files;
    if (!list_files(path, files)) {
        return !dir_exists(path);
    }

    bool ok = true;
    for (const auto& file : files) {
        if (unlink(file.c_str()) == -1) {
            log_status("Warning: Could not remove " + file + ": " + strerror(errno));
            ok = false;
        }
    }
    if (rmdir(path.c_str()) == -1) {
        log_status("Warning: Could not remove directory " + path + ": " + strerror(errno));
        ok = false;
    }
    return ok;
}

bool copy_file(const std::string& from, const std::string& to) {
    std::ifstream src(from, std::ios::binary);
    if (!src.is_open()) {
        return false;
    }
    std::ofstream dst(to, std::ios::binary | std::ios::trunc);
    if (!dst.is_open()) {
        return false;
    }
    dst << src.rdbuf();
    return static_cast<bool>(dst);
}

// Formats seconds (double) into HH:MM:SS string format.
std::string format_duration(double seconds) {
    // Round to the nearest second
    long total_seconds = static_cast<long>(std::round(seconds));
    long h = total_seconds / 3600;
    long m = (total_seconds % 3600) / 60;
    long s = total_seconds % 60;

    std::stringstream ss;
    ss << std::setfill('0') << std::setw(2) << h << ":"
       << std::setfill('0') << std::setw(2) << m << ":"
       << std::setfill('0') << std::setw(2) << s;
    return ss.str();
}

// Reads the system CPU temperature file and returns a formatted string (e.g., "68.5°C").
std::string get_cpu_temp() {
    std::ifstream temp_file("/sys/class/thermal/thermal_zone0/temp");
    if (!temp_file.is_open()) {
        return "Temp N/A";
    }

    int temp_milli = 0;
    if (temp_file >> temp_milli) {
        // Convert millidegrees (e.g., 54200) to degrees Celsius (e.g., 54.2)
        double temp_c = static_cast<double>(temp_milli) / 1000.0;

        std::stringstream ss;
        ss << std::fixed << std::setprecision(1) << temp_c << "°C";
        return ss.str();
    }

    return "Temp Read Error";
}

std::string get_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::tm tm_buf;
    localtime_r(&time_t, &tm_buf);
    std::stringstream ss;
    ss << std::put_time(&tm_buf, "%Y%m%d_%H%M%S");
    return ss.str();
}

long get_epoch_seconds() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

std::string trim(const std::string& value) {
    size_t start = value.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = value.find_last_not_of(" \t\n\r");
    return value.substr(start, end - start + 1);
}

std::vector<std::string> split(const std::string& value, char separator) {
    std::vector<std::string> parts;
    std::stringstream ss(value);
    std::string part;
    while (std::getline(ss, part, separator)) {
        part = trim(part);
        if (!part.empty()) {
            parts.push_back(part);
        }
    }
    return parts;
}

std::string fill_template(const std::string& templ,
                          const std::vector<std::pair<std::string, std::string>>& values) {
    std::string result = templ;
    for (const auto& kv : values) {
        std::string token = "{" + kv.first + "}";
        size_t pos = 0;
        while ((pos = result.find(token, pos)) != std::string::npos) {
            result.replace(pos, token.size(), kv.second);
            pos += kv.second.size();
        }
    }
    return result;
}

bool run_command(const std::string& command) {
    int result = std::system(command.c_str());

    // 1. Check if the shell failed to execute the command itself.
    if (result == -1) {
        log_status("ERROR: Failed to execute shell command (system() returned -1). Command: " + command);
        return false;
    }

    // 2. The command ran but returned an error code.
    int exit_code = WEXITSTATUS(result);
    if (exit_code != 0) {
        log_status("COMMAND ERROR: exit code " + std::to_string(exit_code) + ". Command: " + command);
        return false;
    }
    return true;
}
