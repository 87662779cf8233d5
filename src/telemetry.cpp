// telemetry.cpp

#include "telemetry.hpp"
#include "utils.hpp"

#include <sstream>

std::string job_state_name(JobState state) {
    switch (state) {
        case JobState::Printing: return "printing";
        case JobState::Paused: return "paused";
        case JobState::Complete: return "complete";
        case JobState::Canceled: return "canceled";
        case JobState::Error: return "error";
    }
    return "unknown";
}

bool parse_job_state(const std::string& name, JobState& state) {
    if (name == "printing") {
        state = JobState::Printing;
    } else if (name == "paused") {
        state = JobState::Paused;
    } else if (name == "complete") {
        state = JobState::Complete;
    } else if (name == "canceled" || name == "cancelled") {
        state = JobState::Canceled;
    } else if (name == "error") {
        state = JobState::Error;
    } else {
        return false;
    }
    return true;
}

bool parse_sample(const std::string& line, TelemetrySample& sample) {
    std::istringstream ss(line);
    std::string tag;
    std::string state_name;
    TelemetrySample parsed;

    if (!(ss >> tag) || tag != "sample") {
        return false;
    }
    if (!(ss >> parsed.height_mm >> parsed.percent >> parsed.elapsed_s >> state_name)) {
        return false;
    }
    std::string extra;
    if (ss >> extra) {
        return false;
    }
    if (!parse_job_state(state_name, parsed.job_state)) {
        return false;
    }

    parsed.timestamp = get_epoch_seconds();
    sample = parsed;
    return true;
}

bool job_active(JobState state) {
    return state == JobState::Printing || state == JobState::Paused;
}
