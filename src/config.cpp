// config.cpp

#include "config.hpp"
#include "logger.hpp"
#include "utils.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <climits>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace {

bool parse_bool(const std::string& value, bool& out) {
    std::string v = value;
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (v == "1" || v == "true" || v == "yes" || v == "on") {
        out = true;
    } else if (v == "0" || v == "false" || v == "no" || v == "off") {
        out = false;
    } else {
        return false;
    }
    return true;
}

bool parse_int(const std::string& value, int& out) {
    if (value.empty()) {
        return false;
    }
    char* end = nullptr;
    errno = 0;
    long parsed = std::strtol(value.c_str(), &end, 10);
    if (*end != '\0' || errno == ERANGE || parsed < INT_MIN || parsed > INT_MAX) {
        return false;
    }
    out = static_cast<int>(parsed);
    return true;
}

bool parse_double(const std::string& value, double& out) {
    if (value.empty()) {
        return false;
    }
    char* end = nullptr;
    double parsed = std::strtod(value.c_str(), &end);
    // nan and inf parse fine but never make a usable interval
    if (*end != '\0' || !std::isfinite(parsed)) {
        return false;
    }
    out = parsed;
    return true;
}

std::string bool_str(bool value) {
    return value ? "true" : "false";
}

std::string num_str(double value) {
    std::ostringstream ss;
    ss << value;
    return ss.str();
}

bool set_bot_option(BotConfig& c, const std::string& key, const std::string& value) {
    if (key == "chat_id") {
        c.chat_id = value;
        return true;
    }
    if (key == "debug") return parse_bool(value, c.debug);
    if (key == "log_path") {
        c.log_path = value;
        return true;
    }
    if (key == "light_device") {
        c.light_device = value;
        return true;
    }
    if (key == "light_command") {
        c.light_command = value;
        return true;
    }
    if (key == "send_command") {
        c.send_command = value;
        return true;
    }
    return false;
}

bool set_camera_option(CameraConfig& c, const std::string& key, const std::string& value) {
    if (key == "host") {
        // A device index has to fit an int
        int index = 0;
        if (is_device_index(value) && !parse_int(value, index)) {
            return false;
        }
        c.host = value;
        return true;
    }
    if (key == "flip_vertically") return parse_bool(value, c.flip_vertically);
    if (key == "flip_horizontally") return parse_bool(value, c.flip_horizontally);
    if (key == "rotate") {
        if (value != "" && value != "90_cw" && value != "90_ccw" && value != "180") {
            return false;
        }
        c.rotate = value;
        return true;
    }
    if (key == "fourcc") {
        if (value.size() != 4) {
            return false;
        }
        c.fourcc = value;
        return true;
    }
    if (key == "picture_quality") {
        if (value.empty()) {
            return false;
        }
        c.picture_quality = value;
        return true;
    }
    if (key == "light_control_timeout") return parse_int(value, c.light_control_timeout);
    if (key == "threads") return parse_int(value, c.threads);
    return false;
}

bool set_timelapse_option(TimelapseConfig& c, const std::string& key, const std::string& value) {
    if (key == "enabled") return parse_bool(value, c.enabled);
    if (key == "basedir") {
        c.base_dir = value;
        return !value.empty();
    }
    if (key == "copy_finished_timelapse_dir") {
        c.ready_dir = value;
        return true;
    }
    if (key == "cleanup") return parse_bool(value, c.cleanup);
    if (key == "manual_mode") return parse_bool(value, c.manual_mode);
    if (key == "height") return parse_double(value, c.height);
    if (key == "time") return parse_int(value, c.interval);
    if (key == "target_fps") return parse_int(value, c.target_fps);
    if (key == "min_lapse_duration") return parse_int(value, c.min_lapse_duration);
    if (key == "max_lapse_duration") return parse_int(value, c.max_lapse_duration);
    if (key == "last_frame_duration") return parse_int(value, c.last_frame_duration);
    if (key == "send_finished_lapse") return parse_bool(value, c.send_finished_lapse);
    if (key == "after_lapse_command") {
        c.after_lapse_command = value;
        return true;
    }
    if (key == "after_photo_command") {
        c.after_photo_command = value;
        return true;
    }
    if (key == "auto_render") return parse_bool(value, c.auto_render);
    if (key == "status_file") {
        c.status_file = value;
        return true;
    }
    return false;
}

bool set_notification_option(NotificationConfig& c, const std::string& key, const std::string& value) {
    if (key == "enabled") return parse_bool(value, c.enabled);
    if (key == "percent") return parse_int(value, c.percent);
    if (key == "height") return parse_double(value, c.height);
    if (key == "time") return parse_int(value, c.interval);
    if (key == "photo") return parse_bool(value, c.photo);
    if (key == "groups") {
        c.groups = split(value, ',');
        return true;
    }
    if (key == "group_only") return parse_bool(value, c.group_only);
    return false;
}

bool set_ui_option(UiConfig& c, const std::string& key, const std::string& value) {
    if (key == "silent_progress") return parse_bool(value, c.silent_progress);
    if (key == "silent_commands") return parse_bool(value, c.silent_commands);
    if (key == "status_message_content") {
        static const std::vector<std::string> known = {
            "progress", "height", "print_duration", "job_state", "last_update_time"};
        std::vector<std::string> parts = split(value, ',');
        for (const auto& part : parts) {
            if (std::find(known.begin(), known.end(), part) == known.end()) {
                return false;
            }
        }
        c.status_message_content = parts;
        return true;
    }
    return false;
}

// Splits "a=1 b=2" into pairs. Every token must be key=value.
bool split_pairs(const std::string& payload, std::vector<std::pair<std::string, std::string>>& pairs,
                 std::string& error) {
    std::vector<std::string> tokens = split(payload, ' ');
    if (tokens.empty()) {
        error = "no parameters given";
        return false;
    }
    for (const auto& token : tokens) {
        size_t equals_pos = token.find('=');
        if (equals_pos == std::string::npos || equals_pos == 0 || equals_pos + 1 == token.size()) {
            error = "malformed parameter `" + token + "`";
            return false;
        }
        pairs.emplace_back(token.substr(0, equals_pos), token.substr(equals_pos + 1));
    }
    return true;
}

}  // namespace

bool is_device_index(const std::string& host) {
    return !host.empty() &&
           std::all_of(host.begin(), host.end(), [](unsigned char c) { return std::isdigit(c) != 0; });
}

std::string CameraConfig::image_extension() const {
    if (picture_quality == "low") {
        return "jpeg";
    }
    if (picture_quality == "high") {
        return "webp";
    }
    return picture_quality;
}

bool parse_config(std::istream& input, Config& config, std::string& error) {
    Config parsed;
    std::string section;
    std::string line;
    int line_number = 0;

    while (std::getline(input, line)) {
        line_number++;
        line = trim(line);
        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }

        std::string where = "line " + std::to_string(line_number) + ": ";

        if (line.front() == '[') {
            if (line.back() != ']') {
                error = where + "malformed section header";
                return false;
            }
            section = trim(line.substr(1, line.size() - 2));
            if (section != "bot" && section != "camera" && section != "timelapse" &&
                section != "notification" && section != "ui") {
                error = where + "unknown section [" + section + "]";
                return false;
            }
            continue;
        }

        size_t equals_pos = line.find('=');
        if (equals_pos == std::string::npos) {
            error = where + "expected key = value";
            return false;
        }
        if (section.empty()) {
            error = where + "option outside of a section";
            return false;
        }

        std::string key = trim(line.substr(0, equals_pos));
        std::string value = trim(line.substr(equals_pos + 1));

        bool ok = false;
        if (section == "bot") {
            ok = set_bot_option(parsed.bot, key, value);
        } else if (section == "camera") {
            ok = set_camera_option(parsed.camera, key, value);
        } else if (section == "timelapse") {
            ok = set_timelapse_option(parsed.timelapse, key, value);
        } else if (section == "notification") {
            ok = set_notification_option(parsed.notification, key, value);
        } else if (section == "ui") {
            ok = set_ui_option(parsed.ui, key, value);
        }
        if (!ok) {
            error = where + "unknown key or invalid value: " + section + "." + key + " = " + value;
            return false;
        }
    }

    if (parsed.bot.chat_id.empty()) {
        error = "'chat_id' not found in [bot] section";
        return false;
    }
    if (!validate_timelapse(parsed.timelapse, error) || !validate_notification(parsed.notification, error)) {
        return false;
    }
    if (parsed.camera.light_control_timeout < 0 || parsed.camera.threads < 0) {
        error = "camera timeouts and thread counts must not be negative";
        return false;
    }

    config = parsed;
    return true;
}

bool load_config(const std::string& path, Config& config, std::string& error) {
    std::ifstream file(path);
    if (!file.is_open()) {
        error = "Could not find config file: " + path;
        return false;
    }
    return parse_config(file, config, error);
}

bool validate_timelapse(const TimelapseConfig& config, std::string& error) {
    if (config.target_fps < 1) {
        error = "target_fps must be at least 1";
        return false;
    }
    if (config.height < 0.0 || config.interval < 0 || config.min_lapse_duration < 0 ||
        config.max_lapse_duration < 0 || config.last_frame_duration < 0) {
        error = "timelapse intervals and durations must not be negative";
        return false;
    }
    if (config.max_lapse_duration > 0 && config.min_lapse_duration > config.max_lapse_duration) {
        log_status("Warning: min_lapse_duration " + std::to_string(config.min_lapse_duration) +
                   " is greater than max_lapse_duration " + std::to_string(config.max_lapse_duration));
    }
    return true;
}

bool validate_notification(const NotificationConfig& config, std::string& error) {
    if (config.percent < 0 || config.height < 0.0 || config.interval < 0) {
        error = "notification intervals must not be negative";
        return false;
    }
    return true;
}

bool apply_timelapse_overrides(const std::string& payload, TimelapseConfig& config,
                               std::string& changed, std::string& error) {
    std::vector<std::pair<std::string, std::string>> pairs;
    if (!split_pairs(payload, pairs, error)) {
        return false;
    }

    static const std::vector<std::string> allowed = {
        "enabled", "manual_mode", "height", "time", "target_fps",
        "min_lapse_duration", "max_lapse_duration", "last_frame_duration"};

    TimelapseConfig updated = config;
    std::string accepted;
    for (const auto& kv : pairs) {
        if (std::find(allowed.begin(), allowed.end(), kv.first) == allowed.end()) {
            error = "unknown param `" + kv.first + "`";
            return false;
        }
        if (!set_timelapse_option(updated, kv.first, kv.second)) {
            error = "failed parsing `" + kv.first + "=" + kv.second + "`";
            return false;
        }
        accepted += kv.first + "=" + kv.second + " ";
    }
    if (!validate_timelapse(updated, error)) {
        return false;
    }

    config = updated;
    changed = trim(accepted);
    return true;
}

bool apply_notification_overrides(const std::string& payload, NotificationConfig& config,
                                  std::string& changed, std::string& error) {
    std::vector<std::pair<std::string, std::string>> pairs;
    if (!split_pairs(payload, pairs, error)) {
        return false;
    }

    NotificationConfig updated = config;
    std::string accepted;
    for (const auto& kv : pairs) {
        if (kv.first != "percent" && kv.first != "height" && kv.first != "time") {
            error = "unknown param `" + kv.first + "`";
            return false;
        }
        if (!set_notification_option(updated, kv.first, kv.second)) {
            error = "failed parsing `" + kv.first + "=" + kv.second + "`";
            return false;
        }
        accepted += kv.first + "=" + kv.second + " ";
    }
    if (!validate_notification(updated, error)) {
        return false;
    }

    config = updated;
    changed = trim(accepted);
    return true;
}

std::string describe_timelapse(const TimelapseConfig& config) {
    return "enabled=" + bool_str(config.enabled) +
           " manual_mode=" + bool_str(config.manual_mode) +
           " height=" + num_str(config.height) +
           " time=" + std::to_string(config.interval) +
           " target_fps=" + std::to_string(config.target_fps) +
           " last_frame_duration=" + std::to_string(config.last_frame_duration) +
           " min_lapse_duration=" + std::to_string(config.min_lapse_duration) +
           " max_lapse_duration=" + std::to_string(config.max_lapse_duration);
}

std::string describe_notification(const NotificationConfig& config) {
    return "percent=" + std::to_string(config.percent) +
           " height=" + num_str(config.height) +
           " time=" + std::to_string(config.interval);
}

ConfigStore::ConfigStore(const Config& initial) : config(initial) {}

Config ConfigStore::snapshot() const {
    std::lock_guard<std::mutex> lock(config_mutex);
    return config;
}

void ConfigStore::replace_timelapse(const TimelapseConfig& section) {
    std::lock_guard<std::mutex> lock(config_mutex);
    config.timelapse = section;
}

void ConfigStore::replace_notification(const NotificationConfig& section) {
    std::lock_guard<std::mutex> lock(config_mutex);
    config.notification = section;
}

bool ConfigStore::override_timelapse(const std::string& payload, TimelapseConfig& applied,
                                     std::string& response) {
    std::lock_guard<std::mutex> lock(config_mutex);
    TimelapseConfig updated = config.timelapse;
    std::string changed;
    std::string error;
    if (!apply_timelapse_overrides(payload, updated, changed, error)) {
        response = "Timelapse params error: " + error;
        return false;
    }
    config.timelapse = updated;
    applied = updated;
    response = "Changed timelapse params: " + changed +
               "\nFull timelapse config: " + describe_timelapse(updated);
    return true;
}

bool ConfigStore::override_notification(const std::string& payload, NotificationConfig& applied,
                                        std::string& response) {
    std::lock_guard<std::mutex> lock(config_mutex);
    NotificationConfig updated = config.notification;
    std::string changed;
    std::string error;
    if (!apply_notification_overrides(payload, updated, changed, error)) {
        response = "Notification params error: " + error;
        return false;
    }
    config.notification = updated;
    applied = updated;
    response = "Changed notification params: " + changed +
               "\nFull notification config: " + describe_notification(updated);
    return true;
}
