// encoder.cpp

#include "encoder.hpp"
#include "logger.hpp"
#include "utils.hpp"

#include <chrono>
#include <opencv2/opencv.hpp> // Video processing

bool OpenCvVideoEncoder::encode(const std::vector<std::string>& frame_paths, double fps,
                                const std::string& codec, const std::string& output_path) {
    if (frame_paths.empty()) {
        log_status("No photos to create video from! Skipping.");
        return false;
    }
    if (codec.size() != 4) {
        log_status("ERROR: Invalid fourcc '" + codec + "'");
        return false;
    }

    // 1. Read the first image to determine frame size
    cv::Mat first_image = cv::imread(frame_paths[0]);
    if (first_image.empty()) {
        log_status("Error reading first image! Cannot determine frame size. Check photo integrity.");
        return false;
    }
    cv::Size frame_size(first_image.cols, first_image.rows);

    // --- Start Timing for Video Compilation ---
    auto start_time = std::chrono::steady_clock::now();

    // 2. Initialize the video writer
    cv::VideoWriter video_writer(output_path,
                                 cv::VideoWriter::fourcc(codec[0], codec[1], codec[2], codec[3]),
                                 fps, frame_size);

    if (!video_writer.isOpened()) {
        log_status("Error creating cv::VideoWriter! Check dependencies (FFMPEG) and permissions.");
        return false;
    }

    // 3. Write every frame; the hold tail repeats the same path so cache the last read
    std::string cached_path;
    cv::Mat image;
    size_t written = 0;
    for (size_t i = 0; i < frame_paths.size(); i++) {
        if (frame_paths[i] != cached_path) {
            image = cv::imread(frame_paths[i]);
            cached_path = frame_paths[i];
        }
        if (image.empty()) {
            log_status("Warning: Skipping unreadable frame " + frame_paths[i]);
            continue;
        }
        if (image.cols != frame_size.width || image.rows != frame_size.height) {
            cv::Mat resized;
            cv::resize(image, resized, frame_size);
            video_writer.write(resized);
        } else {
            video_writer.write(image);
        }
        written++;
        if (i % 100 == 0 && i != 0) {
            log_status("Video progress: " + std::to_string(i) + "/" + std::to_string(frame_paths.size()) +
                       "   ||   CPU: " + get_cpu_temp());
        }
    }

    // 4. Release the writer to finalize the video file
    video_writer.release();

    if (written == 0) {
        log_status("ERROR: No readable frames were written to " + output_path);
        return false;
    }

    // --- Stop Timing and Calculate Duration ---
    std::chrono::duration<double> elapsed_time = std::chrono::steady_clock::now() - start_time;
    log_status("Video saved as " + output_path);
    log_status("Actual video length: " + std::to_string(static_cast<double>(written) / fps) + " seconds");
    log_status("Video compilation finished! Time to encode: " + format_duration(elapsed_time.count()));
    return true;
}
