#pragma once

#include <mutex>
#include <string>

#include <opencv2/core.hpp>
#include <opencv2/videoio.hpp>

#include "config.hpp"

enum class Rotation {
    None,
    Clockwise90,
    CounterClockwise90,
    Rotate180
};

enum class Flip {
    None,
    Horizontal,
    Vertical,
    Both
};

Rotation rotation_from_config(const CameraConfig& config);
Flip flip_from_config(const CameraConfig& config);

// Flips first, then rotates, into `frame`
void apply_transform(cv::Mat& frame, Rotation rotation, Flip flip);

// Source of still frames
class CameraSource {
public:
    virtual ~CameraSource() = default;

    // Grabs one frame with the transform applied. False if the camera is unreachable.
    virtual bool get_frame(Rotation rotation, Flip flip, cv::Mat& frame) = 0;
};

// Opens the configured device index or stream URL for every grab and releases it afterwards
class OpenCvCamera : public CameraSource {
private:
    std::string host;
    std::mutex capture_mutex;
    cv::VideoCapture capture;

public:
    explicit OpenCvCamera(const CameraConfig& config);

    bool get_frame(Rotation rotation, Flip flip, cv::Mat& frame) override;
};
