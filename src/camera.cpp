// camera.cpp

#include "camera.hpp"
#include "logger.hpp"

#include <cstdlib>

#include <opencv2/core/utility.hpp>
#include <opencv2/imgproc.hpp>

Rotation rotation_from_config(const CameraConfig& config) {
    if (config.rotate == "90_cw") {
        return Rotation::Clockwise90;
    }
    if (config.rotate == "90_ccw") {
        return Rotation::CounterClockwise90;
    }
    if (config.rotate == "180") {
        return Rotation::Rotate180;
    }
    return Rotation::None;
}

Flip flip_from_config(const CameraConfig& config) {
    if (config.flip_vertically && config.flip_horizontally) {
        return Flip::Both;
    }
    if (config.flip_horizontally) {
        return Flip::Horizontal;
    }
    if (config.flip_vertically) {
        return Flip::Vertical;
    }
    return Flip::None;
}

void apply_transform(cv::Mat& frame, Rotation rotation, Flip flip) {
    switch (flip) {
        case Flip::Horizontal: cv::flip(frame, frame, 1); break;
        case Flip::Vertical: cv::flip(frame, frame, 0); break;
        case Flip::Both: cv::flip(frame, frame, -1); break;
        case Flip::None: break;
    }

    switch (rotation) {
        case Rotation::Clockwise90: cv::rotate(frame, frame, cv::ROTATE_90_CLOCKWISE); break;
        case Rotation::CounterClockwise90: cv::rotate(frame, frame, cv::ROTATE_90_COUNTERCLOCKWISE); break;
        case Rotation::Rotate180: cv::rotate(frame, frame, cv::ROTATE_180); break;
        case Rotation::None: break;
    }
}

OpenCvCamera::OpenCvCamera(const CameraConfig& config) : host(config.host) {
    if (config.threads > 0) {
        cv::setNumThreads(config.threads);
    }
}

bool OpenCvCamera::get_frame(Rotation rotation, Flip flip, cv::Mat& frame) {
    std::lock_guard<std::mutex> lock(capture_mutex);

    bool opened = false;
    if (is_device_index(host)) {
        opened = capture.open(static_cast<int>(std::strtol(host.c_str(), nullptr, 10)));
    } else {
        opened = capture.open(host);
    }
    if (!opened) {
        log_status("ERROR: Could not open camera " + host);
        return false;
    }

    capture.set(cv::CAP_PROP_BUFFERSIZE, 1);
    bool success = capture.read(frame);
    capture.release();

    if (!success || frame.empty()) {
        log_debug("failed to get camera frame from " + host);
        return false;
    }

    apply_transform(frame, rotation, flip);
    return true;
}
