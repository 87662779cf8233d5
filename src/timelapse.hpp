// timelapse.hpp

#pragma once

#include <mutex>
#include <string>

#include "command_result.hpp"
#include "config.hpp"
#include "frame_capture.hpp"
#include "messenger.hpp"
#include "task_queue.hpp"
#include "telemetry.hpp"
#include "trigger.hpp"
#include "video_assembler.hpp"

enum class TimelapseState {
    Idle,
    Running,
    Paused,
    Stopped,
    Rendering
};

std::string timelapse_state_name(TimelapseState state);

// --- Class Definition ---
// Owns one capture session at a time:
//   Idle/Stopped --start--> Running <--pause/resume--> Paused
//   Running/Paused --stop--> Stopped --create--> Rendering --> Idle (ok) | Stopped (failed)
// Renders run on their own worker so telemetry and captures never wait on them.
class TimeLapse {
private:
    ConfigStore& config_store;
    FrameCapture& capture;
    VideoAssembler& assembler;
    Messenger& messenger;

    mutable std::mutex state_mutex;
    TimelapseState state;

    // Session data
    std::string session_id;
    std::string session_dir;
    int frame_count;

    // Trigger state, threaded through on_sample()
    TriggerAccumulator height_trigger;
    TriggerAccumulator time_trigger;
    bool have_sample;
    TelemetrySample last_sample;

    // Metrics tracking
    int capture_errors;
    double last_capture_duration_ms;
    bool last_capture_success;
    long last_capture_epoch;

    // Declared last so a running render finishes before the rest is torn down
    TaskQueue render_worker;

    // Private utility methods
    void write_status_file(const Config& config);
    std::string new_session_id(const std::string& base_dir) const;
    void handle_job_edge(bool had_previous, JobState previous, JobState current, const Config& config);

    // Transitions, state_mutex held
    CommandResult start_locked(const Config& config);
    CommandResult pause_locked(const Config& config);
    CommandResult resume_locked(const Config& config);
    CommandResult stop_locked(const Config& config);
    CommandResult create_locked(const Config& config);
    CommandResult dispatch_capture_locked(bool run_after_command);

    void on_capture_done(const std::string& captured_session, int index, CaptureResult result,
                         long started_ms, bool run_after_command);
    void run_render(RenderJob job, RenderOptions options, bool send_video, std::string recipient, bool silent);

public:
    // Constructor
    TimeLapse(ConfigStore& config_store, FrameCapture& capture, VideoAssembler& assembler, Messenger& messenger);
    ~TimeLapse();

    TimeLapse(const TimeLapse&) = delete;
    TimeLapse& operator=(const TimeLapse&) = delete;

    CommandResult start();
    CommandResult pause();
    CommandResult resume();
    CommandResult stop();
    CommandResult create();

    // One-off capture into the current session, allowed in manual mode and while paused
    CommandResult photo(bool run_after_command = false);

    // Feeds one telemetry sample. Never waits on capture or render work.
    void on_sample(const TelemetrySample& sample);

    // Rebases triggers whose interval changed so the new value never fires retroactively
    void apply_overrides(const TimelapseConfig& updated);

    TimelapseState current_state() const;
    int frames_captured() const;
    std::string current_session_dir() const;
    std::string status_summary() const;

    // Blocks until outstanding captures and renders have finished
    void wait_idle();
};
