// power_device.cpp

#include "power_device.hpp"
#include "logger.hpp"
#include "utils.hpp"

CommandPowerDevice::CommandPowerDevice(const std::string& command_template)
    : command_template(command_template) {}

bool CommandPowerDevice::set_power(const std::string& device_id, bool on) {
    std::lock_guard<std::mutex> lock(state_mutex);
    if (command_template.empty()) {
        log_status("Warning: No light_command configured, cannot switch " + device_id);
        return false;
    }

    std::string command = fill_template(command_template, {{"device", device_id}, {"action", on ? "on" : "off"}});
    if (!run_command(command)) {
        log_status("ERROR: Power device switch failed for " + device_id);
        return false;
    }
    log_debug("Power device " + device_id + (on ? " on" : " off"));
    return true;
}
