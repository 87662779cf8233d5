#pragma once

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "command_result.hpp"
#include "config.hpp"
#include "notifications.hpp"
#include "timelapse.hpp"

// One entry of the command table
class Command {
public:
    virtual ~Command() = default;

    // Checks the payload without side effects
    virtual bool validate(const std::string& payload, std::string& error) const = 0;

    virtual CommandResult execute(const std::string& payload) = 0;
};

// Command that takes no payload and forwards to a callable
class SimpleCommand : public Command {
private:
    std::function<CommandResult()> action;

public:
    explicit SimpleCommand(std::function<CommandResult()> action);

    bool validate(const std::string& payload, std::string& error) const override;
    CommandResult execute(const std::string& payload) override;
};

// set_timelapse_params key=value ...
class TimelapseParamsCommand : public Command {
private:
    ConfigStore& config_store;
    TimeLapse& timelapse;

public:
    TimelapseParamsCommand(ConfigStore& config_store, TimeLapse& timelapse);

    bool validate(const std::string& payload, std::string& error) const override;
    CommandResult execute(const std::string& payload) override;
};

// set_notify_params key=value ...
class NotificationParamsCommand : public Command {
private:
    ConfigStore& config_store;
    NotificationScheduler& notifier;

public:
    NotificationParamsCommand(ConfigStore& config_store, NotificationScheduler& notifier);

    bool validate(const std::string& payload, std::string& error) const override;
    CommandResult execute(const std::string& payload) override;
};

// notify <text>
class NotifyCommand : public Command {
private:
    NotificationScheduler& notifier;

public:
    explicit NotifyCommand(NotificationScheduler& notifier);

    bool validate(const std::string& payload, std::string& error) const override;
    CommandResult execute(const std::string& payload) override;
};

// Name -> command. Dispatch validates before executing.
class CommandRegistry {
private:
    std::map<std::string, std::unique_ptr<Command>> commands;

public:
    void register_command(const std::string& name, std::unique_ptr<Command> command);

    bool contains(const std::string& name) const;
    std::vector<std::string> names() const;

    CommandResult dispatch(const std::string& name, const std::string& payload);

    // "<name> [payload]"
    CommandResult dispatch_line(const std::string& line);
};

void register_default_commands(CommandRegistry& registry, ConfigStore& config_store, TimeLapse& timelapse,
                               NotificationScheduler& notifier);
