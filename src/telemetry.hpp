#pragma once

#include <string>

enum class JobState {
    Printing,
    Paused,
    Complete,
    Canceled,
    Error
};

// One progress sample from the print controller. Read-only to the engine.
struct TelemetrySample {
    long timestamp = 0;
    double height_mm = 0.0;
    double percent = 0.0;
    double elapsed_s = 0.0;
    JobState job_state = JobState::Printing;
};

std::string job_state_name(JobState state);

bool parse_job_state(const std::string& name, JobState& state);

// Parses "sample <height_mm> <percent> <elapsed_s> <job_state>".
// The timestamp is set to the arrival time.
bool parse_sample(const std::string& line, TelemetrySample& sample);

// True while the job is running or paused
bool job_active(JobState state);
