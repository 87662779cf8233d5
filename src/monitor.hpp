#pragma once

#include <istream>
#include <memory>
#include <string>

#include "camera.hpp"
#include "commands.hpp"
#include "config.hpp"
#include "encoder.hpp"
#include "frame_capture.hpp"
#include "messenger.hpp"
#include "notifications.hpp"
#include "power_device.hpp"
#include "telemetry.hpp"
#include "timelapse.hpp"
#include "video_assembler.hpp"

struct Collaborators {
    std::unique_ptr<CameraSource> camera;
    std::unique_ptr<PowerDevice> light;   // may be null
    std::unique_ptr<VideoEncoder> encoder;
    std::unique_ptr<Messenger> messenger;
};

// OpenCV camera and encoder, command driven light and messaging
Collaborators make_default_collaborators(const Config& config);

// Wires the engine together and feeds it telemetry and commands
class Monitor {
private:
    ConfigStore config_store;
    Collaborators collaborators;
    FrameCapture capture;
    VideoAssembler assembler;
    TimeLapse timelapse;
    NotificationScheduler notifier;
    CommandRegistry commands;

public:
    Monitor(const Config& config, Collaborators collaborators);

    Monitor(const Monitor&) = delete;
    Monitor& operator=(const Monitor&) = delete;

    // Hands the sample to the timelapse and the notifier; returns without waiting on either
    void on_sample(const TelemetrySample& sample);

    CommandResult handle_command(const std::string& line);

    // Reads "sample ..." records and command lines until EOF
    void run(std::istream& input);

    void wait_idle();

    TimeLapse& timelapse_engine() { return timelapse; }
    NotificationScheduler& notification_scheduler() { return notifier; }
    ConfigStore& config() { return config_store; }
};
