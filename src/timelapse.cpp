// timelapse.cpp

#include <chrono>
#include <fstream>
#include <iomanip>
#include <stdexcept>
#include <string>

#include "timelapse.hpp"
#include "logger.hpp"
#include "utils.hpp"

namespace {

long now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now().time_since_epoch()).count();
}

bool capture_allowed(const Config& config) {
    return config.timelapse.enabled && config.camera.enabled();
}

}  // namespace

std::string timelapse_state_name(TimelapseState state) {
    switch (state) {
        case TimelapseState::Idle: return "idle";
        case TimelapseState::Running: return "running";
        case TimelapseState::Paused: return "paused";
        case TimelapseState::Stopped: return "stopped";
        case TimelapseState::Rendering: return "rendering";
    }
    return "unknown";
}

// constructor
TimeLapse::TimeLapse(ConfigStore& config_store, FrameCapture& capture, VideoAssembler& assembler,
                     Messenger& messenger)
    : config_store(config_store),
      capture(capture),
      assembler(assembler),
      messenger(messenger),
      state(TimelapseState::Idle),
      frame_count(0),
      height_trigger(TriggerSpec{TriggerKind::Height, 0.0, 0.0}),
      time_trigger(TriggerSpec{TriggerKind::Time, 0.0, 0.0}),
      have_sample(false),
      capture_errors(0),
      last_capture_duration_ms(0),
      last_capture_success(false),
      last_capture_epoch(0),
      render_worker("render") {
    Config config = config_store.snapshot();
    if (!create_dir(config.timelapse.base_dir)) {
        throw std::runtime_error("Failed to create timelapse directory: " + config.timelapse.base_dir);
    }
}

TimeLapse::~TimeLapse() {
    capture.cancel();
    capture.wait_idle();
    render_worker.stop();
}

// Private methods implementations
std::string TimeLapse::new_session_id(const std::string& base_dir) const {
    std::string base_id = "lapse_" + get_timestamp();
    std::string id = base_id;
    for (int suffix = 2; dir_exists(base_dir + "/" + id); suffix++) {
        id = base_id + "_" + std::to_string(suffix);
    }
    return id;
}

void TimeLapse::write_status_file(const Config& config) {
    if (config.timelapse.status_file.empty()) {
        return;
    }

    std::ofstream f(config.timelapse.status_file);
    if (!f.is_open()) {
        log_status("Warning: Could not write status file");
        return;
    }

    f << "{\n"
      << "  \"status\": \"" << timelapse_state_name(state) << "\",\n"
      << "  \"session\": \"" << session_id << "\",\n"
      << "  \"manual_mode\": " << (config.timelapse.manual_mode ? "true" : "false") << ",\n"
      << "  \"photos_captured\": " << frame_count << ",\n"
      << "  \"capture_errors\": " << capture_errors << ",\n"
      << "  \"last_capture_success\": " << (last_capture_success ? "true" : "false") << ",\n"
      << "  \"last_capture_timestamp\": " << last_capture_epoch << ",\n"
      << "  \"last_capture_duration_ms\": " << std::fixed << std::setprecision(1) << last_capture_duration_ms << ",\n"
      << "  \"updated_at\": " << get_epoch_seconds() << "\n"
      << "}\n";
}

CommandResult TimeLapse::start_locked(const Config& config) {
    if (state != TimelapseState::Idle && state != TimelapseState::Stopped) {
        return command_failed(CommandStatus::InvalidTransition,
                              "Cannot start timelapse while " + timelapse_state_name(state));
    }
    if (!capture_allowed(config)) {
        return command_failed(CommandStatus::Rejected, "Timelapse is disabled or no camera is configured");
    }

    // A new session replaces whatever the previous one left behind
    if (!session_dir.empty() && dir_exists(session_dir)) {
        log_status("Clearing frames of previous session " + session_id);
        remove_dir(session_dir);
    }

    std::string id = new_session_id(config.timelapse.base_dir);
    std::string dir = config.timelapse.base_dir + "/" + id;
    if (!create_dir(dir)) {
        return command_failed(CommandStatus::Rejected, "Failed to create session directory: " + dir);
    }

    session_id = id;
    session_dir = dir;
    frame_count = 0;
    capture_errors = 0;
    last_capture_success = false;
    height_trigger.register_spec(TriggerSpec{TriggerKind::Height, config.timelapse.height, 0.0});
    time_trigger.register_spec(TriggerSpec{TriggerKind::Time, static_cast<double>(config.timelapse.interval), 0.0});

    state = TimelapseState::Running;
    write_status_file(config);
    log_status("Timelapse started - Output: " + session_dir);
    return command_ok("Timelapse started");
}

CommandResult TimeLapse::pause_locked(const Config& config) {
    if (state != TimelapseState::Running) {
        return command_failed(CommandStatus::InvalidTransition,
                              "Cannot pause timelapse while " + timelapse_state_name(state));
    }
    state = TimelapseState::Paused;
    write_status_file(config);
    log_status("Timelapse paused");
    return command_ok("Timelapse paused");
}

CommandResult TimeLapse::resume_locked(const Config& config) {
    if (state != TimelapseState::Paused) {
        return command_failed(CommandStatus::InvalidTransition,
                              "Cannot resume timelapse while " + timelapse_state_name(state));
    }
    state = TimelapseState::Running;
    write_status_file(config);
    log_status("Timelapse resumed");
    return command_ok("Timelapse resumed");
}

CommandResult TimeLapse::stop_locked(const Config& config) {
    if (state != TimelapseState::Running && state != TimelapseState::Paused) {
        return command_failed(CommandStatus::InvalidTransition,
                              "Cannot stop timelapse while " + timelapse_state_name(state));
    }
    // A capture still waiting on the light must not land after the stop
    capture.cancel();
    state = TimelapseState::Stopped;
    write_status_file(config);
    log_status("Timelapse stopped with " + std::to_string(frame_count) + " frames");
    return command_ok("Timelapse stopped");
}

CommandResult TimeLapse::create_locked(const Config& config) {
    if (state == TimelapseState::Rendering) {
        return command_failed(CommandStatus::Busy, "Timelapse render already in progress");
    }
    if (state != TimelapseState::Stopped) {
        return command_failed(CommandStatus::InvalidTransition,
                              "Cannot create timelapse while " + timelapse_state_name(state) + ", stop it first");
    }

    RenderJob job;
    job.session_id = session_id;
    job.session_dir = session_dir;
    job.target_fps = config.timelapse.target_fps;
    job.min_duration = config.timelapse.min_lapse_duration;
    job.max_duration = config.timelapse.max_lapse_duration;
    job.last_frame_duration = config.timelapse.last_frame_duration;
    job.output_path = config.timelapse.base_dir + "/" + session_id + ".mp4";

    RenderOptions options;
    options.codec = config.camera.fourcc;
    options.ready_dir = config.timelapse.ready_dir;
    options.cleanup = config.timelapse.cleanup;
    options.after_lapse_command = config.timelapse.after_lapse_command;

    bool send_video = config.timelapse.send_finished_lapse;
    std::string recipient = config.bot.chat_id;
    bool silent = config.ui.silent_progress;

    state = TimelapseState::Rendering;
    bool posted = render_worker.post([this, job, options, send_video, recipient, silent] {
        run_render(job, options, send_video, recipient, silent);
    });
    if (!posted) {
        state = TimelapseState::Stopped;
        return command_failed(CommandStatus::Rejected, "Render worker is shutting down");
    }

    write_status_file(config);
    log_status("Starting time-lapse assembly for " + session_id);
    return command_ok("Starting time-lapse assembly for " + session_id);
}

CommandResult TimeLapse::dispatch_capture_locked(bool run_after_command) {
    std::string captured_session = session_id;
    int index = frame_count;
    long started = now_ms();
    bool accepted = capture.capture_async(session_dir, index,
        [this, captured_session, index, started, run_after_command](CaptureResult result) {
            on_capture_done(captured_session, index, result, started, run_after_command);
        });
    if (!accepted) {
        return command_failed(CommandStatus::Busy, "Capture already in progress");
    }
    return command_ok("Capturing photo " + std::to_string(index));
}

void TimeLapse::on_capture_done(const std::string& captured_session, int index, CaptureResult result,
                                long started_ms, bool run_after_command) {
    Config config = config_store.snapshot();
    {
        std::lock_guard<std::mutex> lock(state_mutex);
        if (captured_session != session_id) {
            return;
        }

        last_capture_duration_ms = static_cast<double>(now_ms() - started_ms);
        if (result == CaptureResult::Captured) {
            frame_count = index + 1;
            last_capture_success = true;
            last_capture_epoch = get_epoch_seconds();
        } else if (result != CaptureResult::Cancelled) {
            capture_errors++;
            last_capture_success = false;
            log_status("Warning: Frame " + std::to_string(index) + " of " + captured_session + " not taken: " +
                       capture_result_name(result));
        }
        write_status_file(config);
    }

    if (run_after_command && result == CaptureResult::Captured && !config.timelapse.after_photo_command.empty()) {
        if (!run_command(config.timelapse.after_photo_command)) {
            log_status("Warning: after_photo_command failed");
        }
    }
}

void TimeLapse::run_render(RenderJob job, RenderOptions options, bool send_video, std::string recipient,
                           bool silent) {
    // Frames still being written by a capture that passed its settle delay before the stop
    capture.wait_idle();

    std::string error;
    bool ok = assembler.render(job, options, error);

    {
        std::lock_guard<std::mutex> lock(state_mutex);
        state = ok ? TimelapseState::Idle : TimelapseState::Stopped;
        write_status_file(config_store.snapshot());
    }

    OutgoingMessage message;
    message.recipient = recipient;
    message.silent = silent;
    if (!ok) {
        log_status("ERROR: Time-lapse render failed: " + error);
        message.text = "Time-lapse creation failed: " + error;
        message.silent = false;
    } else if (send_video) {
        message.kind = MessageKind::Video;
        message.text = "time-lapse of " + job.session_id;
        message.attachment_path = job.output_path;
    } else {
        message.text = "Time-lapse creation finished: " + job.output_path;
    }
    if (!messenger.send(message)) {
        log_status("Warning: Could not deliver render report");
    }
}

void TimeLapse::handle_job_edge(bool had_previous, JobState previous, JobState current, const Config& config) {
    CommandResult result;
    switch (current) {
        case JobState::Printing:
            if (had_previous && previous == JobState::Paused && state == TimelapseState::Paused) {
                result = resume_locked(config);
            } else if ((!had_previous || previous != JobState::Paused) &&
                       (state == TimelapseState::Idle || state == TimelapseState::Stopped)) {
                result = start_locked(config);
            }
            break;
        case JobState::Paused:
            if (state == TimelapseState::Running) {
                result = pause_locked(config);
            }
            break;
        case JobState::Complete:
            if (state == TimelapseState::Running || state == TimelapseState::Paused) {
                result = stop_locked(config);
                if (result.ok() && config.timelapse.auto_render && frame_count > 0) {
                    result = create_locked(config);
                }
            }
            break;
        case JobState::Canceled:
        case JobState::Error:
            if (state == TimelapseState::Running || state == TimelapseState::Paused) {
                result = stop_locked(config);
            }
            break;
    }
    if (!result.ok()) {
        log_status("Warning: Job went " + job_state_name(current) + " but timelapse did not follow: " +
                   result.message);
    }
}

// Public methods implementation
CommandResult TimeLapse::start() {
    Config config = config_store.snapshot();
    std::lock_guard<std::mutex> lock(state_mutex);
    return start_locked(config);
}

CommandResult TimeLapse::pause() {
    Config config = config_store.snapshot();
    std::lock_guard<std::mutex> lock(state_mutex);
    return pause_locked(config);
}

CommandResult TimeLapse::resume() {
    Config config = config_store.snapshot();
    std::lock_guard<std::mutex> lock(state_mutex);
    return resume_locked(config);
}

CommandResult TimeLapse::stop() {
    Config config = config_store.snapshot();
    std::lock_guard<std::mutex> lock(state_mutex);
    return stop_locked(config);
}

CommandResult TimeLapse::create() {
    Config config = config_store.snapshot();
    std::lock_guard<std::mutex> lock(state_mutex);
    if (state == TimelapseState::Stopped && frame_count == 0) {
        return command_failed(CommandStatus::Rejected, "No frames captured for " + session_id);
    }
    return create_locked(config);
}

CommandResult TimeLapse::photo(bool run_after_command) {
    Config config = config_store.snapshot();
    std::lock_guard<std::mutex> lock(state_mutex);
    if (state != TimelapseState::Running && state != TimelapseState::Paused) {
        return command_failed(CommandStatus::InvalidTransition,
                              "No timelapse session is active (" + timelapse_state_name(state) + ")");
    }
    if (!config.camera.enabled()) {
        return command_failed(CommandStatus::Rejected, "No camera is configured");
    }
    return dispatch_capture_locked(run_after_command);
}

void TimeLapse::on_sample(const TelemetrySample& sample) {
    Config config = config_store.snapshot();
    std::lock_guard<std::mutex> lock(state_mutex);

    bool had_previous = have_sample;
    JobState previous = last_sample.job_state;
    last_sample = sample;
    have_sample = true;

    if (!capture_allowed(config)) {
        return;
    }

    if (!config.timelapse.manual_mode && (!had_previous || previous != sample.job_state)) {
        handle_job_edge(had_previous, previous, sample.job_state, config);
    }

    if (state != TimelapseState::Running && state != TimelapseState::Paused) {
        return;
    }

    // Both accumulate while paused; only a running automatic session acts on them
    bool fired = height_trigger.observe(sample);
    fired = time_trigger.observe(sample) || fired;

    if (!fired || state != TimelapseState::Running || config.timelapse.manual_mode) {
        return;
    }

    CommandResult result = dispatch_capture_locked(false);
    if (!result.ok()) {
        log_debug("Trigger fired but capture was skipped: " + result.message);
    }
}

void TimeLapse::apply_overrides(const TimelapseConfig& updated) {
    std::lock_guard<std::mutex> lock(state_mutex);
    TelemetrySample current = have_sample ? last_sample : TelemetrySample();

    if (height_trigger.current_spec().interval != updated.height) {
        height_trigger.override_interval(updated.height, current);
    }
    if (time_trigger.current_spec().interval != static_cast<double>(updated.interval)) {
        time_trigger.override_interval(static_cast<double>(updated.interval), current);
    }
}

TimelapseState TimeLapse::current_state() const {
    std::lock_guard<std::mutex> lock(state_mutex);
    return state;
}

int TimeLapse::frames_captured() const {
    std::lock_guard<std::mutex> lock(state_mutex);
    return frame_count;
}

std::string TimeLapse::current_session_dir() const {
    std::lock_guard<std::mutex> lock(state_mutex);
    return session_dir;
}

std::string TimeLapse::status_summary() const {
    std::lock_guard<std::mutex> lock(state_mutex);
    std::string summary = "timelapse=" + timelapse_state_name(state) + " frames=" + std::to_string(frame_count);
    if (!session_id.empty()) {
        summary += " session=" + session_id;
    }
    return summary;
}

void TimeLapse::wait_idle() {
    capture.wait_idle();
    render_worker.wait_idle();
}
