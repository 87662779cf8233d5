// commands.cpp

#include "commands.hpp"
#include "logger.hpp"
#include "utils.hpp"

#include <utility>

SimpleCommand::SimpleCommand(std::function<CommandResult()> action) : action(std::move(action)) {}

bool SimpleCommand::validate(const std::string& payload, std::string& error) const {
    if (!trim(payload).empty()) {
        error = "command takes no parameters";
        return false;
    }
    return true;
}

CommandResult SimpleCommand::execute(const std::string& /*payload*/) {
    return action();
}

TimelapseParamsCommand::TimelapseParamsCommand(ConfigStore& config_store, TimeLapse& timelapse)
    : config_store(config_store), timelapse(timelapse) {}

bool TimelapseParamsCommand::validate(const std::string& payload, std::string& error) const {
    TimelapseConfig scratch = config_store.snapshot().timelapse;
    std::string changed;
    return apply_timelapse_overrides(payload, scratch, changed, error);
}

CommandResult TimelapseParamsCommand::execute(const std::string& payload) {
    TimelapseConfig applied;
    std::string response;
    if (!config_store.override_timelapse(payload, applied, response)) {
        return command_failed(CommandStatus::Rejected, response);
    }
    timelapse.apply_overrides(applied);
    return command_ok(response);
}

NotificationParamsCommand::NotificationParamsCommand(ConfigStore& config_store, NotificationScheduler& notifier)
    : config_store(config_store), notifier(notifier) {}

bool NotificationParamsCommand::validate(const std::string& payload, std::string& error) const {
    NotificationConfig scratch = config_store.snapshot().notification;
    std::string changed;
    return apply_notification_overrides(payload, scratch, changed, error);
}

CommandResult NotificationParamsCommand::execute(const std::string& payload) {
    NotificationConfig applied;
    std::string response;
    if (!config_store.override_notification(payload, applied, response)) {
        return command_failed(CommandStatus::Rejected, response);
    }
    notifier.apply_overrides(applied);
    return command_ok(response);
}

NotifyCommand::NotifyCommand(NotificationScheduler& notifier) : notifier(notifier) {}

bool NotifyCommand::validate(const std::string& payload, std::string& error) const {
    if (trim(payload).empty()) {
        error = "nothing to send";
        return false;
    }
    return true;
}

CommandResult NotifyCommand::execute(const std::string& payload) {
    notifier.send_manual(trim(payload));
    return command_ok("Notification queued");
}

void CommandRegistry::register_command(const std::string& name, std::unique_ptr<Command> command) {
    commands[name] = std::move(command);
}

bool CommandRegistry::contains(const std::string& name) const {
    return commands.find(name) != commands.end();
}

std::vector<std::string> CommandRegistry::names() const {
    std::vector<std::string> result;
    for (const auto& entry : commands) {
        result.push_back(entry.first);
    }
    return result;
}

CommandResult CommandRegistry::dispatch(const std::string& name, const std::string& payload) {
    auto it = commands.find(name);
    if (it == commands.end()) {
        std::string known;
        for (const auto& command_name : names()) {
            known += (known.empty() ? "" : ", ") + command_name;
        }
        return command_failed(CommandStatus::Rejected, "Unknown command `" + name + "`, known: " + known);
    }

    std::string error;
    if (!it->second->validate(payload, error)) {
        return command_failed(CommandStatus::Rejected, name + ": " + error);
    }
    return it->second->execute(payload);
}

CommandResult CommandRegistry::dispatch_line(const std::string& line) {
    std::string trimmed = trim(line);
    size_t space = trimmed.find(' ');
    if (space == std::string::npos) {
        return dispatch(trimmed, "");
    }
    return dispatch(trimmed.substr(0, space), trim(trimmed.substr(space + 1)));
}

void register_default_commands(CommandRegistry& registry, ConfigStore& config_store, TimeLapse& timelapse,
                               NotificationScheduler& notifier) {
    registry.register_command("start", std::make_unique<SimpleCommand>([&timelapse] {
        return timelapse.start();
    }));
    registry.register_command("stop", std::make_unique<SimpleCommand>([&timelapse] {
        return timelapse.stop();
    }));
    registry.register_command("pause", std::make_unique<SimpleCommand>([&timelapse] {
        return timelapse.pause();
    }));
    registry.register_command("resume", std::make_unique<SimpleCommand>([&timelapse] {
        return timelapse.resume();
    }));
    registry.register_command("photo", std::make_unique<SimpleCommand>([&timelapse] {
        return timelapse.photo(false);
    }));
    registry.register_command("photo_and_command", std::make_unique<SimpleCommand>([&timelapse] {
        return timelapse.photo(true);
    }));
    registry.register_command("create", std::make_unique<SimpleCommand>([&timelapse] {
        return timelapse.create();
    }));
    registry.register_command("status", std::make_unique<SimpleCommand>([&timelapse, &config_store] {
        Config config = config_store.snapshot();
        return command_ok(timelapse.status_summary() +
                          "\nTimelapse config: " + describe_timelapse(config.timelapse) +
                          "\nNotification config: " + describe_notification(config.notification));
    }));
    registry.register_command("set_timelapse_params",
                              std::make_unique<TimelapseParamsCommand>(config_store, timelapse));
    registry.register_command("set_notify_params",
                              std::make_unique<NotificationParamsCommand>(config_store, notifier));
    registry.register_command("notify", std::make_unique<NotifyCommand>(notifier));
}
