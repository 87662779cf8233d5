// notifications.cpp

#include "notifications.hpp"
#include "logger.hpp"
#include "utils.hpp"

#include <algorithm>
#include <cmath>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace {

bool wants(const UiConfig& ui, const std::string& part) {
    return std::find(ui.status_message_content.begin(), ui.status_message_content.end(), part) !=
           ui.status_message_content.end();
}

std::string clock_time() {
    std::time_t now = std::time(nullptr);
    std::tm tm_buf;
    localtime_r(&now, &tm_buf);
    std::stringstream ss;
    ss << std::put_time(&tm_buf, "%H:%M:%S");
    return ss.str();
}

}  // namespace

NotificationScheduler::NotificationScheduler(ConfigStore& config_store, Messenger& messenger, FrameCapture* capture,
                                             const std::string& snapshot_dir)
    : config_store(config_store),
      messenger(messenger),
      capture(capture),
      snapshot_dir(snapshot_dir),
      percent_trigger(TriggerSpec{TriggerKind::Percent, 0.0, 0.0}),
      height_trigger(TriggerSpec{TriggerKind::Height, 0.0, 0.0}),
      time_trigger(TriggerSpec{TriggerKind::Time, 0.0, 0.0}),
      have_sample(false),
      sent_count(0),
      worker("notify") {
    reset_triggers(config_store.snapshot().notification);
}

NotificationScheduler::~NotificationScheduler() {
    worker.stop();
}

void NotificationScheduler::reset_triggers(const NotificationConfig& config) {
    percent_trigger.register_spec(TriggerSpec{TriggerKind::Percent, static_cast<double>(config.percent), 0.0});
    height_trigger.register_spec(TriggerSpec{TriggerKind::Height, config.height, 0.0});
    time_trigger.register_spec(TriggerSpec{TriggerKind::Time, static_cast<double>(config.interval), 0.0});
}

void NotificationScheduler::on_sample(const TelemetrySample& sample) {
    Config config = config_store.snapshot();
    std::lock_guard<std::mutex> lock(state_mutex);

    bool new_job = sample.job_state == JobState::Printing &&
                   (!have_sample || !job_active(last_sample.job_state));
    last_sample = sample;
    have_sample = true;

    if (new_job) {
        reset_triggers(config.notification);
    }

    if (!config.notification.enabled || !job_active(sample.job_state) || sample.elapsed_s <= 0.0) {
        return;
    }

    // Evaluate every accumulator so each one tracks its own crossings
    bool fired = percent_trigger.observe(sample);
    fired = height_trigger.observe(sample) || fired;
    fired = time_trigger.observe(sample) || fired;
    if (!fired) {
        return;
    }

    if (!worker.post([this, sample, config] { notify(sample, config); })) {
        log_status("Warning: Notification worker stopped, dropping progress update");
    }
}

void NotificationScheduler::apply_overrides(const NotificationConfig& updated) {
    std::lock_guard<std::mutex> lock(state_mutex);
    TelemetrySample current = have_sample ? last_sample : TelemetrySample();

    if (percent_trigger.current_spec().interval != static_cast<double>(updated.percent)) {
        percent_trigger.override_interval(static_cast<double>(updated.percent), current);
    }
    if (height_trigger.current_spec().interval != updated.height) {
        height_trigger.override_interval(updated.height, current);
    }
    if (time_trigger.current_spec().interval != static_cast<double>(updated.interval)) {
        time_trigger.override_interval(static_cast<double>(updated.interval), current);
    }
}

void NotificationScheduler::send_manual(const std::string& text) {
    Config config = config_store.snapshot();
    if (!worker.post([this, text, config] { deliver(text, config.ui.silent_commands, false, config); })) {
        log_status("Warning: Notification worker stopped, dropping message");
    }
}

std::string NotificationScheduler::compose_message(const TelemetrySample& sample, const UiConfig& ui) {
    std::stringstream ss;
    if (wants(ui, "progress")) {
        ss << "Printed " << static_cast<int>(std::round(sample.percent)) << "%\n";
    }
    if (wants(ui, "height")) {
        ss << "Height: " << std::fixed << std::setprecision(2) << sample.height_mm << "mm\n";
    }
    if (wants(ui, "print_duration")) {
        ss << "Printing for " << format_duration(sample.elapsed_s) << "\n";
    }
    if (wants(ui, "job_state")) {
        ss << "State: " << job_state_name(sample.job_state) << "\n";
    }
    if (wants(ui, "last_update_time")) {
        ss << "Last update at " << clock_time() << "\n";
    }
    return trim(ss.str());
}

void NotificationScheduler::notify(const TelemetrySample& sample, const Config& config) {
    deliver(compose_message(sample, config.ui), config.ui.silent_progress, config.notification.photo, config);
}

void NotificationScheduler::deliver(const std::string& text, bool silent, bool with_photo, const Config& config) {
    OutgoingMessage message;
    message.text = text;
    message.silent = silent;
    message.recipient = config.notification.group_only ? "" : config.bot.chat_id;
    message.extra_recipients = config.notification.groups;

    if (with_photo && capture != nullptr && config.camera.enabled()) {
        std::string path = snapshot_dir + "/notification." + config.camera.image_extension();
        if (create_dir(snapshot_dir) && capture->snapshot(path)) {
            message.kind = MessageKind::Photo;
            message.attachment_path = path;
        } else {
            log_status("Warning: No photo for notification, sending text only");
        }
    }

    if (message.recipient.empty() && message.extra_recipients.empty()) {
        log_status("Warning: Notification has no recipients");
        return;
    }
    if (!messenger.send(message)) {
        log_status("ERROR: Failed to send notification");
        return;
    }

    std::lock_guard<std::mutex> lock(state_mutex);
    sent_count++;
}

int NotificationScheduler::notifications_sent() {
    std::lock_guard<std::mutex> lock(state_mutex);
    return sent_count;
}

void NotificationScheduler::wait_idle() {
    worker.wait_idle();
}
