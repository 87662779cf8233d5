#pragma once

#include <istream>
#include <mutex>
#include <string>
#include <vector>

// --- Constants ---
#define CONFIG_FILE "conf/lapsebot.conf"

struct BotConfig {
    std::string chat_id;          // required, default recipient
    bool debug = false;
    std::string log_path = "logs/";
    std::string light_device;     // empty: no light toggling
    std::string light_command;    // {device} {action}
    std::string send_command;     // {kind} {recipient} {silent} {text} {file}
};

struct CameraConfig {
    std::string host;             // empty disables the camera
    bool flip_vertically = false;
    bool flip_horizontally = false;
    std::string rotate;           // "", "90_cw", "90_ccw", "180"
    std::string fourcc = "mp4v";
    std::string picture_quality = "high";
    int light_control_timeout = 0;
    int threads = 0;

    bool enabled() const { return !host.empty(); }
    std::string image_extension() const;
};

// True for an all-digit host such as "0", which names a local device index
bool is_device_index(const std::string& host);

struct TimelapseConfig {
    bool enabled = false;
    std::string base_dir = "/tmp/timelapse";
    std::string ready_dir;        // retention copy, empty disables
    bool cleanup = true;
    bool manual_mode = false;
    double height = 0.0;
    int interval = 0;
    int target_fps = 15;
    int min_lapse_duration = 0;
    int max_lapse_duration = 0;
    int last_frame_duration = 5;
    bool send_finished_lapse = true;
    std::string after_lapse_command;
    std::string after_photo_command;
    bool auto_render = true;
    std::string status_file;
};

struct NotificationConfig {
    bool enabled = true;
    int percent = 0;
    double height = 0.0;
    int interval = 0;
    bool photo = true;
    std::vector<std::string> groups;
    bool group_only = false;
};

struct UiConfig {
    bool silent_progress = false;
    bool silent_commands = false;
    std::vector<std::string> status_message_content = {
        "progress", "height", "print_duration", "job_state", "last_update_time"};
};

struct Config {
    BotConfig bot;
    CameraConfig camera;
    TimelapseConfig timelapse;
    NotificationConfig notification;
    UiConfig ui;
};

// Reads "[section]" / "key = value" text. Unknown sections, keys or bad values fail the load.
bool parse_config(std::istream& input, Config& config, std::string& error);

bool load_config(const std::string& path, Config& config, std::string& error);

bool validate_timelapse(const TimelapseConfig& config, std::string& error);
bool validate_notification(const NotificationConfig& config, std::string& error);

// Applies space separated key=value pairs onto config. On any bad pair nothing
// is applied and false is returned. `changed` lists the accepted pairs.
bool apply_timelapse_overrides(const std::string& payload, TimelapseConfig& config,
                               std::string& changed, std::string& error);
bool apply_notification_overrides(const std::string& payload, NotificationConfig& config,
                                  std::string& changed, std::string& error);

std::string describe_timelapse(const TimelapseConfig& config);
std::string describe_notification(const NotificationConfig& config);

// Live configuration shared by the engine. Readers take snapshots, runtime
// overrides replace a whole section under one lock. Nothing is written back to disk.
class ConfigStore {
private:
    mutable std::mutex config_mutex;
    Config config;

public:
    explicit ConfigStore(const Config& initial);

    Config snapshot() const;

    void replace_timelapse(const TimelapseConfig& section);
    void replace_notification(const NotificationConfig& section);

    // Parse, validate and replace in one step. On failure the section is untouched
    // and `response` carries the error.
    bool override_timelapse(const std::string& payload, TimelapseConfig& applied, std::string& response);
    bool override_notification(const std::string& payload, NotificationConfig& applied, std::string& response);
};
