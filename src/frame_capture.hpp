#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>

#include "camera.hpp"
#include "config.hpp"
#include "power_device.hpp"
#include "task_queue.hpp"

enum class CaptureResult {
    Captured,
    Dropped,      // another capture was in flight
    Cancelled,    // cancel() arrived before the frame was taken
    CameraError,
    WriteError
};

std::string capture_result_name(CaptureResult result);

// Takes single frames: light on, settle, grab, transform, write, light off.
//
// Only one session capture runs at a time. A request that arrives while one is
// in flight is dropped, never queued.
//
// The light is assumed to be toggled by nobody else while a capture runs. If the
// printer also switches it, the light may be left in whichever state came last.
class FrameCapture {
private:
    CameraSource& camera;
    PowerDevice* light_device;
    std::string light_device_id;
    Rotation rotation;
    Flip flip;
    std::string extension;
    int settle_delay_s;

    // Held across the whole light-on .. light-off sequence
    std::mutex camera_mutex;
    std::atomic<bool> in_flight;

    std::mutex cancel_mutex;
    std::condition_variable cancel_condition;
    unsigned long cancel_generation;

    TaskQueue worker;

    unsigned long current_generation();
    bool cancelled_since(unsigned long generation);
    bool take_frame(cv::Mat& frame, bool cancellable, unsigned long generation, CaptureResult& result);
    CaptureResult run_capture(const std::string& session_dir, int index, unsigned long generation);

public:
    FrameCapture(CameraSource& camera, PowerDevice* light_device, const std::string& light_device_id,
                 const CameraConfig& config);
    ~FrameCapture();

    static std::string frame_path(const std::string& session_dir, int index, const std::string& extension);
    std::string frame_path(const std::string& session_dir, int index) const;

    // Blocking capture into session_dir under index
    CaptureResult capture(const std::string& session_dir, int index);

    // Runs the capture on the pipeline worker and reports through `done`.
    // Returns false when dropped because a capture is already in flight.
    bool capture_async(const std::string& session_dir, int index, std::function<void(CaptureResult)> done);

    // One-off picture outside any session, e.g. for a notification. Waits for the camera.
    bool snapshot(const std::string& path);

    // Aborts captures still waiting for the light to settle
    void cancel();

    bool busy() const;

    void wait_idle();
};
