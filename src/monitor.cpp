// monitor.cpp

#include "monitor.hpp"
#include "logger.hpp"
#include "utils.hpp"

#include <memory>
#include <stdexcept>
#include <utility>

Collaborators make_default_collaborators(const Config& config) {
    Collaborators c;
    c.camera = std::make_unique<OpenCvCamera>(config.camera);
    if (!config.bot.light_device.empty()) {
        c.light = std::make_unique<CommandPowerDevice>(config.bot.light_command);
    }
    c.encoder = std::make_unique<OpenCvVideoEncoder>();
    c.messenger = std::make_unique<CommandMessenger>(config.bot.send_command);
    return c;
}

static const Collaborators& checked(const Collaborators& c) {
    if (!c.camera || !c.encoder || !c.messenger) {
        throw std::runtime_error("Camera, encoder and messenger collaborators are required");
    }
    return c;
}

Monitor::Monitor(const Config& config, Collaborators collaborators)
    : config_store(config),
      collaborators(std::move(collaborators)),
      capture(*checked(this->collaborators).camera, this->collaborators.light.get(), config.bot.light_device,
              config.camera),
      assembler(*this->collaborators.encoder),
      timelapse(config_store, capture, assembler, *this->collaborators.messenger),
      notifier(config_store, *this->collaborators.messenger, config.camera.enabled() ? &capture : nullptr,
               config.timelapse.base_dir) {
    register_default_commands(commands, config_store, timelapse, notifier);

    for (const auto& name : VideoAssembler::find_unfinished(config.timelapse.base_dir)) {
        log_status("Warning: Unfinished timelapse found: " + config.timelapse.base_dir + "/" + name);
    }
}

void Monitor::on_sample(const TelemetrySample& sample) {
    timelapse.on_sample(sample);
    notifier.on_sample(sample);
}

CommandResult Monitor::handle_command(const std::string& line) {
    CommandResult result = commands.dispatch_line(line);
    if (result.ok()) {
        log_status("Command `" + line + "`: " + result.message);
    } else {
        log_status("Warning: Command `" + line + "` " + command_status_name(result.status) + ": " + result.message);
    }
    return result;
}

void Monitor::run(std::istream& input) {
    std::string line;
    while (std::getline(input, line)) {
        line = trim(line);
        if (line.empty()) {
            continue;
        }

        if (line.compare(0, 7, "sample ") == 0) {
            TelemetrySample sample;
            if (!parse_sample(line, sample)) {
                log_status("Warning: Malformed telemetry sample: " + line);
                continue;
            }
            on_sample(sample);
        } else {
            handle_command(line);
        }
    }
    log_status("Input closed, waiting for outstanding work");
    wait_idle();
}

void Monitor::wait_idle() {
    timelapse.wait_idle();
    notifier.wait_idle();
}
