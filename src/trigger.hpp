#pragma once

#include <mutex>
#include <string>

#include "telemetry.hpp"

enum class TriggerKind {
    Percent,
    Height,
    Time
};

struct TriggerSpec {
    TriggerKind kind = TriggerKind::Height;
    double interval = 0.0;  // 0 disables the trigger
    double last_fired_value = 0.0;
};

// Turns one monotonically evolving sample field into discrete events.
// Fires when floor(current / interval) moves past floor(last_fired_value / interval),
// so each interval crossing fires exactly once however many samples land in between.
//
// The time kind reads elapsed job time and is not gated on job state: elapsed
// time keeps growing while a job is paused, and so does the trigger.
class TriggerAccumulator {
private:
    mutable std::mutex spec_mutex;
    TriggerSpec spec;

    static double value_of(TriggerKind kind, const TelemetrySample& sample);

public:
    TriggerAccumulator();
    explicit TriggerAccumulator(const TriggerSpec& initial);

    // Installs a spec as-is, keeping its last_fired_value
    void register_spec(const TriggerSpec& new_spec);

    // Returns true when this sample crosses into a new interval
    bool observe(const TelemetrySample& sample);

    // Swaps the interval and rebases last_fired_value onto the sample in effect,
    // so the new interval never fires retroactively.
    void override_interval(double interval, const TelemetrySample& current);

    // Back to last_fired_value = 0 for a new session
    void reset();

    TriggerSpec current_spec() const;
    bool enabled() const;
};
