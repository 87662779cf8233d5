#pragma once

#include <string>

enum class CommandStatus {
    Ok,
    InvalidTransition,
    Busy,
    Rejected
};

struct CommandResult {
    CommandStatus status = CommandStatus::Ok;
    std::string message;

    bool ok() const { return status == CommandStatus::Ok; }
};

inline CommandResult command_ok(const std::string& message) {
    return CommandResult{CommandStatus::Ok, message};
}

inline CommandResult command_failed(CommandStatus status, const std::string& message) {
    return CommandResult{status, message};
}

inline std::string command_status_name(CommandStatus status) {
    switch (status) {
        case CommandStatus::Ok: return "ok";
        case CommandStatus::InvalidTransition: return "invalid transition";
        case CommandStatus::Busy: return "busy";
        case CommandStatus::Rejected: return "rejected";
    }
    return "unknown";
}
