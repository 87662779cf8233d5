#pragma once

#include <string>
#include <vector>

#include "encoder.hpp"

// --- Constants ---
#define LOCK_FILE_NAME "lapse.lock"

struct RenderJob {
    std::string session_id;
    std::string session_dir;
    int target_fps = 15;
    int min_duration = 0;         // seconds, 0 = unset
    int max_duration = 0;         // seconds, 0 = unset
    int last_frame_duration = 0;  // seconds of hold on the final frame
    double computed_fps = 0.0;
    std::string output_path;
};

struct RenderOptions {
    std::string codec = "mp4v";
    std::string ready_dir;        // retention copy, empty disables
    bool cleanup = true;
    std::string after_lapse_command;
};

// Turns a finished session's frames into a video
class VideoAssembler {
private:
    VideoEncoder& encoder;

public:
    explicit VideoAssembler(VideoEncoder& encoder);

    // Target fps, stretched to reach min_duration or squeezed to fit max_duration. Never below 1.
    static double compute_fps(size_t frame_count, int target_fps, int min_duration, int max_duration);

    // round(fps * seconds)
    static size_t hold_frame_count(double fps, int last_frame_duration);

    // Frames in order followed by the last frame repeated for the hold
    static std::vector<std::string> build_frame_list(const std::vector<std::string>& frames, double fps,
                                                     int last_frame_duration);

    // Session frames sorted by sequence index
    static bool list_frames(const std::string& session_dir, std::vector<std::string>& frames);

    // Session directories under base_dir left with a lock file by an interrupted render
    static std::vector<std::string> find_unfinished(const std::string& base_dir);

    // Encodes, then copies to the retention dir, cleans up and runs the post-render command.
    // On failure nothing is deleted and `error` says why.
    bool render(RenderJob& job, const RenderOptions& options, std::string& error);
};
