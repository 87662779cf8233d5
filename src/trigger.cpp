// trigger.cpp

#include "trigger.hpp"

#include <cmath>

namespace {

// Heights like 0.2 mm are not exact in binary; 0.6 / 0.2 must count as 3 steps
const double STEP_EPSILON = 1e-9;

long step_of(double value, double interval) {
    return static_cast<long>(std::floor(value / interval + STEP_EPSILON));
}

}  // namespace

TriggerAccumulator::TriggerAccumulator() {}

TriggerAccumulator::TriggerAccumulator(const TriggerSpec& initial) : spec(initial) {}

double TriggerAccumulator::value_of(TriggerKind kind, const TelemetrySample& sample) {
    switch (kind) {
        case TriggerKind::Percent: return sample.percent;
        case TriggerKind::Height: return sample.height_mm;
        case TriggerKind::Time: return sample.elapsed_s;
    }
    return 0.0;
}

void TriggerAccumulator::register_spec(const TriggerSpec& new_spec) {
    std::lock_guard<std::mutex> lock(spec_mutex);
    spec = new_spec;
}

bool TriggerAccumulator::observe(const TelemetrySample& sample) {
    std::lock_guard<std::mutex> lock(spec_mutex);
    if (spec.interval <= 0.0) {
        return false;
    }

    double current = value_of(spec.kind, sample);

    // A new job or a z-hop takes height/percent back down; start counting from there
    if (spec.kind != TriggerKind::Time && current < spec.last_fired_value - spec.interval) {
        spec.last_fired_value = current;
        return false;
    }

    if (step_of(current, spec.interval) > step_of(spec.last_fired_value, spec.interval)) {
        spec.last_fired_value = current;
        return true;
    }
    return false;
}

void TriggerAccumulator::override_interval(double interval, const TelemetrySample& current) {
    std::lock_guard<std::mutex> lock(spec_mutex);
    spec.interval = interval;
    spec.last_fired_value = value_of(spec.kind, current);
}

void TriggerAccumulator::reset() {
    std::lock_guard<std::mutex> lock(spec_mutex);
    spec.last_fired_value = 0.0;
}

TriggerSpec TriggerAccumulator::current_spec() const {
    std::lock_guard<std::mutex> lock(spec_mutex);
    return spec;
}

bool TriggerAccumulator::enabled() const {
    std::lock_guard<std::mutex> lock(spec_mutex);
    return spec.interval > 0.0;
}
