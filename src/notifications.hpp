#pragma once

#include <mutex>
#include <string>

#include "config.hpp"
#include "frame_capture.hpp"
#include "messenger.hpp"
#include "task_queue.hpp"
#include "telemetry.hpp"
#include "trigger.hpp"

// Progress notifications, independent of the timelapse triggers.
// Percent, height and time each have their own accumulator; any crossing sends
// one status message, with a photo when configured. Sending happens on a worker.
class NotificationScheduler {
private:
    ConfigStore& config_store;
    Messenger& messenger;
    FrameCapture* capture;       // nullptr without a camera
    std::string snapshot_dir;

    std::mutex state_mutex;
    TriggerAccumulator percent_trigger;
    TriggerAccumulator height_trigger;
    TriggerAccumulator time_trigger;
    bool have_sample;
    TelemetrySample last_sample;
    int sent_count;

    TaskQueue worker;

    void reset_triggers(const NotificationConfig& config);
    void notify(const TelemetrySample& sample, const Config& config);
    void deliver(const std::string& text, bool silent, bool with_photo, const Config& config);

public:
    NotificationScheduler(ConfigStore& config_store, Messenger& messenger, FrameCapture* capture,
                          const std::string& snapshot_dir);
    ~NotificationScheduler();

    // Never blocks on sending
    void on_sample(const TelemetrySample& sample);

    // Rebases accumulators whose interval changed onto the last sample
    void apply_overrides(const NotificationConfig& updated);

    // Free text from the operator side, sent with the silent_commands flag
    void send_manual(const std::string& text);

    // The progress message for a sample, built from ui.status_message_content
    static std::string compose_message(const TelemetrySample& sample, const UiConfig& ui);

    int notifications_sent();

    void wait_idle();
};
