// frame_capture.cpp

#include "frame_capture.hpp"
#include "logger.hpp"
#include "utils.hpp"

#include <chrono>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <thread>

#include <opencv2/imgcodecs.hpp>

std::string capture_result_name(CaptureResult result) {
    switch (result) {
        case CaptureResult::Captured: return "captured";
        case CaptureResult::Dropped: return "dropped";
        case CaptureResult::Cancelled: return "cancelled";
        case CaptureResult::CameraError: return "camera error";
        case CaptureResult::WriteError: return "write error";
    }
    return "unknown";
}

FrameCapture::FrameCapture(CameraSource& camera, PowerDevice* light_device, const std::string& light_device_id,
                           const CameraConfig& config)
    : camera(camera),
      light_device(light_device),
      light_device_id(light_device_id),
      rotation(rotation_from_config(config)),
      flip(flip_from_config(config)),
      extension(config.image_extension()),
      settle_delay_s(config.light_control_timeout),
      in_flight(false),
      cancel_generation(0),
      worker("capture") {}

FrameCapture::~FrameCapture() {
    cancel();
    worker.stop();
}

std::string FrameCapture::frame_path(const std::string& session_dir, int index, const std::string& extension) {
    // Assemble filename (e.g., session_dir/000042.webp)
    std::stringstream ss;
    ss << session_dir << "/" << std::setfill('0') << std::setw(6) << index << "." << extension;
    return ss.str();
}

std::string FrameCapture::frame_path(const std::string& session_dir, int index) const {
    return frame_path(session_dir, index, extension);
}

unsigned long FrameCapture::current_generation() {
    std::lock_guard<std::mutex> lock(cancel_mutex);
    return cancel_generation;
}

bool FrameCapture::cancelled_since(unsigned long generation) {
    std::lock_guard<std::mutex> lock(cancel_mutex);
    return cancel_generation != generation;
}

void FrameCapture::cancel() {
    {
        std::lock_guard<std::mutex> lock(cancel_mutex);
        cancel_generation++;
    }
    cancel_condition.notify_all();
}

bool FrameCapture::busy() const {
    return in_flight.load();
}

void FrameCapture::wait_idle() {
    worker.wait_idle();
}

bool FrameCapture::take_frame(cv::Mat& frame, bool cancellable, unsigned long generation, CaptureResult& result) {
    std::lock_guard<std::mutex> camera_lock(camera_mutex);

    if (cancellable && cancelled_since(generation)) {
        result = CaptureResult::Cancelled;
        return false;
    }

    // No light device configured: skip the light steps silently
    bool light_on = false;
    if (light_device != nullptr && !light_device_id.empty()) {
        light_on = light_device->set_power(light_device_id, true);
        if (light_on && settle_delay_s > 0) {
            if (cancellable) {
                std::unique_lock<std::mutex> lock(cancel_mutex);
                cancel_condition.wait_for(lock, std::chrono::seconds(settle_delay_s),
                                          [this, generation] { return cancel_generation != generation; });
            } else {
                std::this_thread::sleep_for(std::chrono::seconds(settle_delay_s));
            }
        }
    }

    bool ok = false;
    if (cancellable && cancelled_since(generation)) {
        result = CaptureResult::Cancelled;
    } else {
        // A throwing camera counts as unreachable; the light still goes off below
        try {
            ok = camera.get_frame(rotation, flip, frame);
        } catch (const std::exception& e) {
            log_status(std::string("ERROR: Camera failed: ") + e.what());
            ok = false;
        }
        if (!ok) {
            result = CaptureResult::CameraError;
        }
    }

    if (light_on) {
        light_device->set_power(light_device_id, false);
    }
    return ok;
}

CaptureResult FrameCapture::run_capture(const std::string& session_dir, int index, unsigned long generation) {
    cv::Mat frame;
    CaptureResult result = CaptureResult::Captured;
    if (!take_frame(frame, true, generation, result)) {
        if (result == CaptureResult::Cancelled) {
            log_status("Capture of frame " + std::to_string(index) + " cancelled");
        } else {
            log_status("ERROR: Camera unreachable, skipping frame " + std::to_string(index));
        }
        return result;
    }

    // The session owns its directory; a frame landing after it was cleared must not recreate it
    if (!dir_exists(session_dir)) {
        log_status("ERROR: Session directory is gone, dropping frame " + std::to_string(index));
        return CaptureResult::WriteError;
    }

    std::string filename = frame_path(session_dir, index);
    try {
        if (!cv::imwrite(filename, frame)) {
            log_status("ERROR: Could not write frame " + filename);
            return CaptureResult::WriteError;
        }
    } catch (const cv::Exception& e) {
        log_status("ERROR: Could not write frame " + filename + ": " + e.what());
        return CaptureResult::WriteError;
    }

    log_debug("Photo captured successfully: " + filename);
    return CaptureResult::Captured;
}

CaptureResult FrameCapture::capture(const std::string& session_dir, int index) {
    bool expected = false;
    if (!in_flight.compare_exchange_strong(expected, true)) {
        log_status("Warning: Capture already in flight, dropping frame " + std::to_string(index));
        return CaptureResult::Dropped;
    }

    CaptureResult result = run_capture(session_dir, index, current_generation());
    in_flight = false;
    return result;
}

bool FrameCapture::capture_async(const std::string& session_dir, int index,
                                 std::function<void(CaptureResult)> done) {
    bool expected = false;
    if (!in_flight.compare_exchange_strong(expected, true)) {
        log_status("Warning: Capture already in flight, dropping frame " + std::to_string(index));
        return false;
    }

    // Taken now so a cancel() between posting and running still applies
    unsigned long generation = current_generation();
    bool posted = worker.post([this, session_dir, index, generation, done] {
        CaptureResult result = run_capture(session_dir, index, generation);
        // Report before releasing so the next request sees the updated frame count
        if (done) {
            done(result);
        }
        in_flight = false;
    });
    if (!posted) {
        in_flight = false;
        return false;
    }
    return true;
}

bool FrameCapture::snapshot(const std::string& path) {
    cv::Mat frame;
    CaptureResult result = CaptureResult::Captured;
    if (!take_frame(frame, false, 0, result)) {
        log_status("ERROR: Camera unreachable, no snapshot taken");
        return false;
    }
    try {
        if (!cv::imwrite(path, frame)) {
            log_status("ERROR: Could not write snapshot " + path);
            return false;
        }
    } catch (const cv::Exception& e) {
        log_status("ERROR: Could not write snapshot " + path + ": " + e.what());
        return false;
    }
    return true;
}
