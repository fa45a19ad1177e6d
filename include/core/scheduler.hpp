#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "control/pid_controller.hpp"
#include "core/config.hpp"
#include "core/loop_context.hpp"
#include "estimation/flow_estimator.hpp"
#include "io/valve_actuator.hpp"
#include "io/weight_source.hpp"
#include "model/flow_frame.hpp"

namespace flow_control::core {

struct LoopStats {
  std::size_t ticks_executed{0};
  std::size_t ticks_skipped{0};
  std::size_t stale_ticks{0};
  std::size_t faults{0};
};

enum class TickOutcome : std::uint8_t {
  executed,
  held,
  skipped_busy,
  not_running,
  faulted,
};

// Owns the estimator and controller and runs them once per tick:
// read scale -> estimate flow -> PID -> valve -> publish observation.
// Ticks are serialized; a tick that finds another one in progress is skipped.
// Observers are called after the tick lock is released, one at a time, newest observation only.
class ControlLoopScheduler {
 public:
  using Clock = std::function<double()>;
  using Observer = std::function<bool(const model::flow_observation&)>;

  ControlLoopScheduler(LoopConfig config, LoopContext& context, io::WeightSampleSource& source,
                       io::ValveActuator& valve, Clock clock = {});

  ControlLoopScheduler(const ControlLoopScheduler&) = delete;
  ControlLoopScheduler& operator=(const ControlLoopScheduler&) = delete;

  void add_observer(std::string name, Observer publish);

  // STOPPED -> RUNNING. False (and still STOPPED) when the configuration is invalid.
  bool start();
  // RUNNING -> STOPPED after the in-flight tick completes; commands the fail-safe position.
  void stop();
  // FAULTED -> STOPPED.
  bool reset_fault();

  TickOutcome tick();

  // Runs ticks on the configured cadence until total_ticks have run (0 = no limit),
  // the loop leaves RUNNING, or shutdown is raised.
  LoopStats run_for_ticks(std::size_t total_ticks, const std::atomic<bool>* shutdown = nullptr);

  [[nodiscard]] model::loop_state state() const noexcept { return state_.load(); }
  [[nodiscard]] LoopStats stats() const noexcept;
  [[nodiscard]] std::optional<control::ControllerState> controller_state() const;

 private:
  struct ObserverRegistration {
    std::string name;
    Observer publish;
    bool healthy;
  };

  struct Publication {
    model::flow_observation observation{};
    std::uint64_t sequence{0};
  };

  TickOutcome run_tick_locked(Publication& publication);
  Publication enter_fault(const std::string& reason, double now_s);
  void command_fail_safe();
  Publication record(const model::flow_observation& observation);
  void notify_observers(const Publication& publication);
  model::flow_observation make_observation(double now_s, const model::flow_estimate& estimate, double setpoint,
                                           double output, double command) const;
  [[nodiscard]] double clamp_setpoint(double requested) const noexcept;
  [[nodiscard]] double output_to_command(double output) const noexcept;
  [[nodiscard]] double command_to_output(double command) const noexcept;

  LoopConfig config_;
  LoopContext& context_;
  io::WeightSampleSource& source_;
  io::ValveActuator& valve_;
  Clock clock_;

  mutable std::mutex tick_mutex_;
  std::atomic<model::loop_state> state_{model::loop_state::STOPPED};

  estimation::FlowEstimator estimator_;
  std::optional<control::PIDController> controller_{};
  double last_tick_s_{0.0};
  double last_setpoint_{0.0};
  double last_output_{0.0};
  std::uint64_t tick_count_{0};
  std::uint64_t publish_sequence_{0};
  bool in_stale_episode_{false};

  std::atomic<std::size_t> ticks_executed_{0};
  std::atomic<std::size_t> ticks_skipped_{0};
  std::atomic<std::size_t> stale_ticks_{0};
  std::atomic<std::size_t> faults_{0};
  float last_compute_ms_{0.0F};

  std::mutex observer_mutex_;
  std::vector<ObserverRegistration> observers_{};
  std::uint64_t notified_sequence_{0};
};

}  // namespace flow_control::core
