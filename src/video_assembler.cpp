// video_assembler.cpp

#include "video_assembler.hpp"
#include "logger.hpp"
#include "utils.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <unistd.h>

VideoAssembler::VideoAssembler(VideoEncoder& encoder) : encoder(encoder) {}

double VideoAssembler::compute_fps(size_t frame_count, int target_fps, int min_duration, int max_duration) {
    double frames = static_cast<double>(frame_count);
    double fps = static_cast<double>(target_fps);
    double duration = frames / fps;

    if (min_duration > 0 && duration < min_duration) {
        fps = frames / min_duration;
    } else if (max_duration > 0 && duration > max_duration) {
        fps = frames / max_duration;
    }
    return std::max(1.0, fps);
}

size_t VideoAssembler::hold_frame_count(double fps, int last_frame_duration) {
    if (last_frame_duration <= 0) {
        return 0;
    }
    return static_cast<size_t>(std::llround(fps * last_frame_duration));
}

std::vector<std::string> VideoAssembler::build_frame_list(const std::vector<std::string>& frames, double fps,
                                                          int last_frame_duration) {
    std::vector<std::string> list = frames;
    if (!frames.empty()) {
        list.insert(list.end(), hold_frame_count(fps, last_frame_duration), frames.back());
    }
    return list;
}

bool VideoAssembler::list_frames(const std::string& session_dir, std::vector<std::string>& frames) {
    std::vector<std::string> files;
    if (!list_files(session_dir, files)) {
        return false;
    }

    frames.clear();
    std::string lock_suffix = std::string("/") + LOCK_FILE_NAME;
    for (const auto& file : files) {
        if (file.size() >= lock_suffix.size() &&
            file.compare(file.size() - lock_suffix.size(), lock_suffix.size(), lock_suffix) == 0) {
            continue;
        }
        frames.push_back(file);
    }
    // Zero-padded names sort by sequence index
    std::sort(frames.begin(), frames.end());
    return true;
}

std::vector<std::string> VideoAssembler::find_unfinished(const std::string& base_dir) {
    std::vector<std::string> unfinished;
    for (const auto& name : list_dirs(base_dir)) {
        if (file_exists(base_dir + "/" + name + "/" + LOCK_FILE_NAME)) {
            unfinished.push_back(name);
        }
    }
    return unfinished;
}

bool VideoAssembler::render(RenderJob& job, const RenderOptions& options, std::string& error) {
    std::vector<std::string> frames;
    if (!list_frames(job.session_dir, frames) || frames.empty()) {
        error = "Empty photos list for " + job.session_id + " in lapse path " + job.session_dir;
        return false;
    }

    std::string lock_path = job.session_dir + "/" + LOCK_FILE_NAME;
    {
        std::ofstream lock_file(lock_path);
        if (!lock_file.is_open()) {
            log_status("Warning: Could not create " + lock_path);
        }
    }

    job.computed_fps = compute_fps(frames.size(), job.target_fps, job.min_duration, job.max_duration);
    std::vector<std::string> frame_list = build_frame_list(frames, job.computed_fps, job.last_frame_duration);

    log_status("Creating video from " + std::to_string(frames.size()) + " photos at " +
               std::to_string(job.computed_fps) + " fps, repeating last image for " +
               std::to_string(job.last_frame_duration) + " seconds");

    if (file_exists(job.output_path)) {
        unlink(job.output_path.c_str());
    }

    if (!encoder.encode(frame_list, job.computed_fps, options.codec, job.output_path)) {
        error = "Encoder failed for " + job.session_id;
        return false;
    }

    if (!options.ready_dir.empty()) {
        std::string name = job.output_path.substr(job.output_path.find_last_of('/') + 1);
        std::string target = options.ready_dir + "/" + name;
        if (!create_dir(options.ready_dir) || !copy_file(job.output_path, target)) {
            log_status("Warning: Could not copy lapse to " + target);
        } else {
            log_status("Copied lapse to " + target);
        }
    }

    unlink(lock_path.c_str());

    if (options.cleanup) {
        if (!remove_dir(job.session_dir)) {
            log_status("Warning: Cleanup of " + job.session_dir + " incomplete");
        }
    }

    if (!options.after_lapse_command.empty()) {
        std::string command = fill_template(options.after_lapse_command, {{"video", job.output_path}});
        if (!run_command(command)) {
            log_status("Warning: Post-render command failed");
        }
    }
    return true;
}
