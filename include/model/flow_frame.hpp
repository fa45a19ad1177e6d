#pragma once

#include <cstdint>
#include <type_traits>

namespace flow_control::model {

enum class loop_state : std::uint8_t {
    STOPPED = 0,
    RUNNING = 1,
    FAULTED = 2,
};

inline const char* to_string(const loop_state state) noexcept {
    switch (state) {
        case loop_state::STOPPED:
            return "STOPPED";
        case loop_state::RUNNING:
            return "RUNNING";
        case loop_state::FAULTED:
            return "FAULTED";
    }
    return "UNKNOWN";
}

// One scale reading. Time is monotonic seconds, mass in the scale's units.
struct weight_sample {
    double timestamp_s;
    double mass;
};

struct flow_estimate {
    double timestamp_s;
    double raw_rate;
    double rate;
    bool valid;
};

// Snapshot published once per tick for monitoring consumers.
struct flow_observation {
    std::uint64_t tick;
    double timestamp_s;
    double raw_rate;
    double estimated_flow;
    bool valid;
    double setpoint;
    double controller_output;
    double commanded_position;
    loop_state state;

    struct LoopHealth {
        float compute_time_ms;
        std::uint32_t missed_ticks;
        std::uint32_t stale_ticks;
    };

    LoopHealth health;
};

static_assert(std::is_standard_layout_v<flow_observation>, "flow_observation must be standard layout");
static_assert(std::is_trivial_v<flow_observation>, "flow_observation must be trivial");

} // namespace flow_control::model
