#pragma once

#include <mutex>
#include <string>

// Switchable device such as the chamber light
class PowerDevice {
public:
    virtual ~PowerDevice() = default;

    virtual bool set_power(const std::string& device_id, bool on) = 0;
};

// Switches a device by running the configured light_command with
// {device} and {action} (on/off) substituted.
class CommandPowerDevice : public PowerDevice {
private:
    std::string command_template;
    std::mutex state_mutex;

public:
    explicit CommandPowerDevice(const std::string& command_template);

    bool set_power(const std::string& device_id, bool on) override;
};
