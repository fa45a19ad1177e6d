#include <atomic>
#include <chrono>
#include <cmath>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <deque>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <unistd.h>

#include <hiredis/hiredis.h>

#include "core/config.hpp"
#include "core/loop_context.hpp"
#include "core/scheduler.hpp"
#include "io/file_source.hpp"
#include "io/latest_sample_buffer.hpp"
#include "io/pinch_valve.hpp"
#include "io/serial_port.hpp"
#include "io/serial_scale.hpp"
#include "io/simulated_rig.hpp"
#include "model/flow_frame.hpp"
#include "sinks/redis_ts.hpp"
#include "sinks/stdout_debug.hpp"

using flow_control::control::ControllerState;
using flow_control::core::AppConfig;
using flow_control::core::ControlLoopScheduler;
using flow_control::core::LoopConfig;
using flow_control::core::LoopContext;
using flow_control::core::TickOutcome;
using flow_control::core::load_app_config;
using flow_control::io::CommandStatus;
using flow_control::io::DryRunValve;
using flow_control::io::FileWeightSource;
using flow_control::io::LatestSampleBuffer;
using flow_control::io::ReadResult;
using flow_control::io::ReadStatus;
using flow_control::io::SerialPinchValve;
using flow_control::io::SerialPort;
using flow_control::io::SerialScaleSource;
using flow_control::io::SimulatedRig;
using flow_control::model::flow_observation;
using flow_control::model::loop_state;
using flow_control::sinks::RedisTsSink;

namespace {

struct RedisMockState {
  std::vector<std::string> last_argv{};
  int command_argv_calls{0};
  int set_timeout_calls{0};
  struct timeval last_timeout{};
};

RedisMockState g_redis_mock{};

extern "C" {

redisContext* redisConnectWithTimeout(const char*, int, const struct timeval) {
  auto* context = static_cast<redisContext*>(std::calloc(1, sizeof(redisContext)));
  context->err = REDIS_OK;
  return context;
}

redisContext* redisConnectUnixWithTimeout(const char*, const struct timeval) {
  auto* context = static_cast<redisContext*>(std::calloc(1, sizeof(redisContext)));
  context->err = REDIS_OK;
  return context;
}

void redisFree(redisContext* c) { std::free(c); }

int redisSetTimeout(redisContext*, const struct timeval tv) {
  g_redis_mock.set_timeout_calls += 1;
  g_redis_mock.last_timeout = tv;
  return REDIS_OK;
}

void* redisCommandArgv(redisContext*, int argc, const char** argv, const size_t*) {
  g_redis_mock.command_argv_calls += 1;
  g_redis_mock.last_argv.clear();
  for (int i = 0; i < argc; ++i) {
    g_redis_mock.last_argv.emplace_back(argv[i]);
  }
  auto* reply = static_cast<redisReply*>(std::calloc(1, sizeof(redisReply)));
  reply->type = REDIS_REPLY_ARRAY;
  return reply;
}

void freeReplyObject(void* reply) { std::free(reply); }

}  // extern "C"

bool almost_equal(double a, double b, double eps = 1e-9) {
  return std::fabs(a - b) <= eps;
}

int fail(const char* name, const char* msg) {
  std::cerr << "[FAIL] " << name << ": " << msg << '\n';
  return 1;
}

struct FakeClock {
  double now_s{100.0};

  ControlLoopScheduler::Clock fn() {
    return [this]() { return now_s; };
  }
};

// Plays back scripted reads; once the script runs out it reports stale.
class ScriptedSource final : public flow_control::io::WeightSampleSource {
 public:
  ReadResult read() override {
    ++reads;
    if (on_read) {
      on_read();
    }
    if (script.empty()) {
      return ReadResult{ReadStatus::stale, {}, {}};
    }
    ReadResult next = script.front();
    script.pop_front();
    return next;
  }

  const char* name() const override { return "scripted"; }

  void push_fresh(double t, double mass) { script.push_back({ReadStatus::fresh, {t, mass}, {}}); }
  void push_stale() { script.push_back({ReadStatus::stale, {}, {}}); }
  void push_failure(const std::string& why) { script.push_back({ReadStatus::hard_failure, {}, why}); }

  std::deque<ReadResult> script{};
  std::function<void()> on_read{};
  int reads{0};
};

class RecordingValve final : public flow_control::io::ValveActuator {
 public:
  CommandStatus command(double position) override {
    if (reject_next) {
      reject_next = false;
      return CommandStatus::rejected;
    }
    commands.push_back(position);
    position_ = position;
    return CommandStatus::ok;
  }

  double last_position() const override { return position_; }
  const char* name() const override { return "recording"; }

  std::vector<double> commands{};
  bool reject_next{false};

 private:
  double position_{0.0};
};

LoopConfig make_loop_config() {
  LoopConfig config{};
  config.sample_interval = std::chrono::milliseconds(100);
  config.kp = 2.0;
  config.ki = 1.0;
  config.kd = 0.0;
  config.output_min = 0.0;
  config.output_max = 400.0;
  config.integral_min = -200.0;
  config.integral_max = 200.0;
  config.max_output_slew_per_s = 4000.0;
  config.flow_min = 0.0;
  config.flow_max = 40.0;
  config.fail_safe_position = 0.0;
  config.estimator.filter_tau_s = 0.0;
  config.estimator.min_dt_s = 0.001;
  config.estimator.max_staleness_s = 5.0;
  return config;
}

// Advances the fake clock by one interval and runs a tick.
TickOutcome step(ControlLoopScheduler& scheduler, FakeClock& clock) {
  clock.now_s += 0.1;
  return scheduler.tick();
}

int test_start_rejects_invalid_configuration() {
  LoopConfig config = make_loop_config();
  config.output_min = 10.0;
  config.output_max = 1.0;

  LoopContext context{5.0};
  ScriptedSource source;
  RecordingValve valve;
  ControlLoopScheduler scheduler(config, context, source, valve);

  if (scheduler.start()) {
    return fail("test_start_rejects_invalid_configuration", "start must fail for output min > max");
  }
  if (scheduler.state() != loop_state::STOPPED || scheduler.tick() != TickOutcome::not_running) {
    return fail("test_start_rejects_invalid_configuration", "loop must stay STOPPED");
  }
  if (source.reads != 0) {
    return fail("test_start_rejects_invalid_configuration", "a stopped loop must not read the scale");
  }
  return 0;
}

int test_tick_pipeline_commands_valve_and_publishes() {
  FakeClock clock;
  LoopContext context{10.0};
  ScriptedSource source;
  RecordingValve valve;
  ControlLoopScheduler scheduler(make_loop_config(), context, source, valve, clock.fn());

  std::vector<flow_observation> observed;
  scheduler.add_observer("recorder", [&observed](const flow_observation& observation) {
    observed.push_back(observation);
    return true;
  });

  source.push_fresh(0.1, 0.0);
  source.push_fresh(0.2, 0.4);
  if (!scheduler.start()) {
    return fail("test_tick_pipeline_commands_valve_and_publishes", "start failed");
  }

  if (step(scheduler, clock) != TickOutcome::held) {
    return fail("test_tick_pipeline_commands_valve_and_publishes", "first tick has no rate yet and must hold");
  }
  if (step(scheduler, clock) != TickOutcome::executed) {
    return fail("test_tick_pipeline_commands_valve_and_publishes", "second tick should run the controller");
  }

  // Rate 4, error 6: P = 12, I = 1 * 0.6 = 0.6.
  const flow_observation snapshot = context.observations.snapshot();
  if (!snapshot.valid || !almost_equal(snapshot.estimated_flow, 4.0, 1e-9) || !almost_equal(snapshot.setpoint, 10.0)) {
    return fail("test_tick_pipeline_commands_valve_and_publishes", "snapshot should carry the estimate and setpoint");
  }
  if (!almost_equal(snapshot.controller_output, 12.6, 1e-9) ||
      !almost_equal(snapshot.commanded_position, 12.6 / 400.0, 1e-12)) {
    return fail("test_tick_pipeline_commands_valve_and_publishes", "output should map linearly onto the valve range");
  }
  if (valve.commands.size() != 2 || !almost_equal(valve.commands.back(), snapshot.commanded_position)) {
    return fail("test_tick_pipeline_commands_valve_and_publishes", "valve should receive one command per tick");
  }
  if (observed.size() != 2 || observed.back().tick != 2 || observed.back().state != loop_state::RUNNING) {
    return fail("test_tick_pipeline_commands_valve_and_publishes", "observers should see every tick");
  }
  return 0;
}

int test_sensor_hard_failure_faults_to_fail_safe() {
  FakeClock clock;
  LoopConfig config = make_loop_config();
  config.fail_safe_position = 0.25;
  LoopContext context{10.0};
  ScriptedSource source;
  RecordingValve valve;
  ControlLoopScheduler scheduler(config, context, source, valve, clock.fn());

  source.push_fresh(0.1, 0.0);
  source.push_fresh(0.2, 0.4);
  source.push_failure("scale unplugged");
  scheduler.start();
  step(scheduler, clock);
  step(scheduler, clock);

  if (step(scheduler, clock) != TickOutcome::faulted || scheduler.state() != loop_state::FAULTED) {
    return fail("test_sensor_hard_failure_faults_to_fail_safe", "hard failure must fault the loop");
  }
  if (valve.commands.empty() || !almost_equal(valve.commands.back(), 0.25)) {
    return fail("test_sensor_hard_failure_faults_to_fail_safe", "fail-safe position must be commanded in the same tick");
  }
  if (context.observations.snapshot().state != loop_state::FAULTED) {
    return fail("test_sensor_hard_failure_faults_to_fail_safe", "fault must be visible to observers");
  }

  const int reads_at_fault = source.reads;
  const std::size_t commands_at_fault = valve.commands.size();
  for (int i = 0; i < 3; ++i) {
    if (step(scheduler, clock) != TickOutcome::not_running) {
      return fail("test_sensor_hard_failure_faults_to_fail_safe", "a faulted loop must not tick");
    }
  }
  if (source.reads != reads_at_fault || valve.commands.size() != commands_at_fault) {
    return fail("test_sensor_hard_failure_faults_to_fail_safe", "no I/O may happen while FAULTED");
  }

  if (scheduler.start()) {
    return fail("test_sensor_hard_failure_faults_to_fail_safe", "start from FAULTED must be refused");
  }
  if (!scheduler.reset_fault() || scheduler.state() != loop_state::STOPPED) {
    return fail("test_sensor_hard_failure_faults_to_fail_safe", "operator reset should move FAULTED -> STOPPED");
  }
  if (!scheduler.start() || scheduler.stats().faults != 1) {
    return fail("test_sensor_hard_failure_faults_to_fail_safe", "loop should restart after reset");
  }
  return 0;
}

int test_actuator_rejection_faults_without_committing() {
  FakeClock clock;
  LoopContext context{10.0};
  ScriptedSource source;
  RecordingValve valve;
  ControlLoopScheduler scheduler(make_loop_config(), context, source, valve, clock.fn());

  source.push_fresh(0.1, 0.0);
  source.push_fresh(0.2, 0.4);
  source.push_fresh(0.3, 0.5);
  scheduler.start();
  step(scheduler, clock);
  step(scheduler, clock);
  const ControllerState before = *scheduler.controller_state();

  valve.reject_next = true;
  if (step(scheduler, clock) != TickOutcome::faulted) {
    return fail("test_actuator_rejection_faults_without_committing", "rejected command must fault the loop");
  }

  const ControllerState after = *scheduler.controller_state();
  if (!almost_equal(after.integral, before.integral) || !almost_equal(after.previous_error, before.previous_error) ||
      !almost_equal(after.previous_output, before.previous_output)) {
    return fail("test_actuator_rejection_faults_without_committing", "a rejected tick must not touch controller state");
  }
  if (!almost_equal(valve.commands.back(), 0.0)) {
    return fail("test_actuator_rejection_faults_without_committing", "fail-safe should follow the rejection");
  }
  return 0;
}

int test_setpoint_change_mid_tick_applies_next_tick() {
  FakeClock clock;
  LoopContext context{10.0};
  ScriptedSource source;
  RecordingValve valve;
  ControlLoopScheduler scheduler(make_loop_config(), context, source, valve, clock.fn());

  source.push_fresh(0.1, 0.0);
  source.push_fresh(0.2, 0.4);
  source.push_fresh(0.3, 0.8);
  scheduler.start();
  step(scheduler, clock);

  source.on_read = [&context]() { context.setpoint.set(20.0); };
  step(scheduler, clock);
  source.on_read = nullptr;
  if (!almost_equal(context.observations.snapshot().setpoint, 10.0)) {
    return fail("test_setpoint_change_mid_tick_applies_next_tick", "in-flight tick must keep the old setpoint");
  }

  step(scheduler, clock);
  if (!almost_equal(context.observations.snapshot().setpoint, 20.0)) {
    return fail("test_setpoint_change_mid_tick_applies_next_tick", "new setpoint should apply on the next tick");
  }

  context.setpoint.set(1000.0);
  step(scheduler, clock);
  if (!almost_equal(context.observations.snapshot().setpoint, 40.0)) {
    return fail("test_setpoint_change_mid_tick_applies_next_tick", "setpoint must be clamped to the flow range");
  }
  return 0;
}

int test_stale_ticks_freeze_controller() {
  FakeClock clock;
  LoopContext context{10.0};
  ScriptedSource source;
  RecordingValve valve;
  ControlLoopScheduler scheduler(make_loop_config(), context, source, valve, clock.fn());

  source.push_fresh(0.1, 0.0);
  source.push_fresh(0.2, 0.4);
  for (int i = 0; i < 5; ++i) {
    source.push_stale();
  }
  source.push_fresh(0.8, 1.6);

  scheduler.start();
  step(scheduler, clock);
  step(scheduler, clock);
  const ControllerState before = *scheduler.controller_state();
  const double held_command = valve.commands.back();

  for (int i = 0; i < 5; ++i) {
    if (step(scheduler, clock) != TickOutcome::held) {
      return fail("test_stale_ticks_freeze_controller", "stale ticks must hold the controller");
    }
    if (!almost_equal(valve.commands.back(), held_command)) {
      return fail("test_stale_ticks_freeze_controller", "valve command must stay frozen");
    }
  }

  const ControllerState during = *scheduler.controller_state();
  if (!almost_equal(during.integral, before.integral) || !almost_equal(during.previous_error, before.previous_error)) {
    return fail("test_stale_ticks_freeze_controller", "integral and previous error must not change while stale");
  }
  if (scheduler.stats().stale_ticks != 5 || scheduler.state() != loop_state::RUNNING) {
    return fail("test_stale_ticks_freeze_controller", "stale data is counted but not a fault");
  }

  // Baseline is still (0.2, 0.4): 1.2 over 0.6 s.
  if (step(scheduler, clock) != TickOutcome::executed ||
      !almost_equal(context.observations.snapshot().raw_rate, 2.0, 1e-9)) {
    return fail("test_stale_ticks_freeze_controller", "control should resume once samples return");
  }
  return 0;
}

int test_reset_request_and_setpoint_jump_reset_controller() {
  FakeClock clock;
  LoopConfig config = make_loop_config();
  config.setpoint_reset_threshold = 5.0;
  LoopContext context{10.0};
  ScriptedSource source;
  RecordingValve valve;
  ControlLoopScheduler scheduler(config, context, source, valve, clock.fn());

  for (int i = 0; i < 8; ++i) {
    source.push_fresh(0.1 * (i + 1), 0.2 * i);
  }
  scheduler.start();
  for (int i = 0; i < 4; ++i) {
    step(scheduler, clock);
  }

  // Rate 2, error 8; after reset the integral holds a single step.
  context.request_controller_reset();
  step(scheduler, clock);
  if (!almost_equal(scheduler.controller_state()->integral, 0.8, 1e-9)) {
    return fail("test_reset_request_and_setpoint_jump_reset_controller", "operator reset should clear the integral");
  }
  if (context.controller_reset_requested.load()) {
    return fail("test_reset_request_and_setpoint_jump_reset_controller", "reset request must be consumed");
  }

  step(scheduler, clock);
  context.setpoint.set(30.0);
  step(scheduler, clock);
  if (!almost_equal(scheduler.controller_state()->integral, 2.8, 1e-9)) {
    return fail("test_reset_request_and_setpoint_jump_reset_controller", "a large setpoint jump should reset");
  }

  context.setpoint.set(33.0);
  step(scheduler, clock);
  if (!almost_equal(scheduler.controller_state()->integral, 2.8 + 3.1, 1e-9)) {
    return fail("test_reset_request_and_setpoint_jump_reset_controller", "small moves must keep the integral");
  }
  return 0;
}

int test_stop_commands_fail_safe_and_restart_is_deterministic() {
  FakeClock clock;
  LoopConfig config = make_loop_config();
  config.kd = 0.3;
  config.estimator.filter_tau_s = 0.4;
  LoopContext context{12.0};
  ScriptedSource source;
  RecordingValve valve;
  ControlLoopScheduler scheduler(config, context, source, valve, clock.fn());

  const auto run_session = [&]() {
    clock.now_s = 100.0;
    source.script.clear();
    for (int i = 0; i < 12; ++i) {
      source.push_fresh(0.1 * (i + 1), (0.03 * i * i) + (0.5 * i));
    }
    valve.commands.clear();
    scheduler.start();
    for (int i = 0; i < 12; ++i) {
      step(scheduler, clock);
    }
    std::vector<double> commands = valve.commands;
    scheduler.stop();
    return commands;
  };

  const std::vector<double> first = run_session();
  if (scheduler.state() != loop_state::STOPPED || !almost_equal(valve.commands.back(), 0.0)) {
    return fail("test_stop_commands_fail_safe_and_restart_is_deterministic", "stop must leave the valve at fail-safe");
  }

  const std::vector<double> second = run_session();
  if (first.size() != 12 || first != second) {
    return fail("test_stop_commands_fail_safe_and_restart_is_deterministic", "restart should reproduce the outputs");
  }
  return 0;
}

int test_busy_tick_is_skipped_and_stop_waits() {
  LoopContext context{10.0};
  ScriptedSource source;
  RecordingValve valve;
  ControlLoopScheduler scheduler(make_loop_config(), context, source, valve);

  std::atomic<bool> in_read{false};
  std::atomic<bool> release{false};
  source.on_read = [&]() {
    in_read.store(true);
    while (!release.load()) {
      std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
  };

  scheduler.start();
  std::thread ticker([&scheduler]() { scheduler.tick(); });
  while (!in_read.load()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }

  if (scheduler.tick() != TickOutcome::skipped_busy || scheduler.stats().ticks_skipped != 1) {
    release.store(true);
    ticker.join();
    return fail("test_busy_tick_is_skipped_and_stop_waits", "overlapping tick must be skipped");
  }

  std::atomic<bool> stopped{false};
  std::thread stopper([&]() {
    scheduler.stop();
    stopped.store(true);
  });
  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  const bool stopped_early = stopped.load();

  release.store(true);
  ticker.join();
  stopper.join();

  if (stopped_early) {
    return fail("test_busy_tick_is_skipped_and_stop_waits", "stop must wait for the in-flight tick");
  }
  if (valve.commands.size() != 2 || scheduler.state() != loop_state::STOPPED) {
    return fail("test_busy_tick_is_skipped_and_stop_waits", "tick command then fail-safe command expected");
  }
  return 0;
}

int test_closed_loop_on_simulated_rig() {
  FakeClock clock;
  LoopConfig config = make_loop_config();
  config.max_output_slew_per_s = 400.0;
  config.estimator.filter_tau_s = 0.5;

  LoopContext context{10.0};
  SimulatedRig rig(40.0, clock.fn());
  ControlLoopScheduler scheduler(config, context, rig, rig, clock.fn());
  scheduler.start();

  for (int i = 0; i < 1000; ++i) {
    step(scheduler, clock);
  }

  const flow_observation snapshot = context.observations.snapshot();
  if (!snapshot.valid || std::fabs(snapshot.estimated_flow - 10.0) > 0.2) {
    return fail("test_closed_loop_on_simulated_rig", "flow should settle on the setpoint");
  }
  if (std::fabs(rig.last_position() - 0.25) > 0.01) {
    return fail("test_closed_loop_on_simulated_rig", "valve should settle near a quarter open");
  }
  return 0;
}

int test_hung_observer_cannot_block_stop() {
  LoopContext context{10.0};
  ScriptedSource source;
  RecordingValve valve;
  ControlLoopScheduler scheduler(make_loop_config(), context, source, valve);

  std::atomic<bool> sink_blocked{false};
  std::atomic<bool> release_sink{false};
  scheduler.add_observer("hung-sink", [&](const flow_observation& observation) {
    if (observation.state == loop_state::RUNNING) {
      sink_blocked.store(true);
      while (!release_sink.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
      }
    }
    return true;
  });

  scheduler.start();
  std::thread ticker([&scheduler]() { scheduler.tick(); });
  while (!sink_blocked.load()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }

  std::thread stopper([&scheduler]() { scheduler.stop(); });
  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
  while (scheduler.state() != loop_state::STOPPED && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
  const bool stopped_while_sink_hung = scheduler.state() == loop_state::STOPPED;
  const bool tick_lock_free = scheduler.controller_state().has_value();

  release_sink.store(true);
  ticker.join();
  stopper.join();

  if (!stopped_while_sink_hung || !tick_lock_free) {
    return fail("test_hung_observer_cannot_block_stop", "a blocked observer must not hold the tick lock");
  }
  if (valve.commands.size() != 2 || !almost_equal(valve.commands.back(), 0.0)) {
    return fail("test_hung_observer_cannot_block_stop", "valve should end at the fail-safe position");
  }
  if (context.observations.snapshot().state != loop_state::STOPPED) {
    return fail("test_hung_observer_cannot_block_stop", "board should show the stopped loop");
  }
  return 0;
}

int test_run_for_ticks_paces_and_honours_shutdown() {
  LoopConfig config = make_loop_config();
  config.sample_interval = std::chrono::milliseconds(2);
  LoopContext context{5.0};
  SimulatedRig rig(40.0);
  ControlLoopScheduler scheduler(config, context, rig, rig);
  scheduler.start();

  const auto started = std::chrono::steady_clock::now();
  const auto stats = scheduler.run_for_ticks(5);
  const auto elapsed = std::chrono::steady_clock::now() - started;
  if (stats.ticks_executed != 5) {
    return fail("test_run_for_ticks_paces_and_honours_shutdown", "five ticks should execute");
  }
  if (elapsed < std::chrono::milliseconds(8)) {
    return fail("test_run_for_ticks_paces_and_honours_shutdown", "ticks must be paced by the interval");
  }

  std::atomic<bool> shutdown{true};
  if (scheduler.run_for_ticks(0, &shutdown).ticks_executed != 5) {
    return fail("test_run_for_ticks_paces_and_honours_shutdown", "raised shutdown must prevent further ticks");
  }
  return 0;
}

int test_config_loading_and_validation() {
  const auto path = std::filesystem::temp_directory_path() / "flow_control_config.yaml";
  {
    std::ofstream out(path);
    out << "loop:\n  rate_hz: 4\n"
        << "pid:\n  kp: 1.5  # proportional\n  ki: 0.25\n  kd: 0\n"
        << "output:\n  min: 0\n  max: 200\n  max_slew_per_s: 50\n"
        << "flow:\n  max: 25\n"
        << "safety:\n  fail_safe_position: 0.1\n"
        << "setpoint:\n  initial: 7.5\n"
        << "io:\n  source: file\n  source_path: /tmp/weights.log\n  valve: dry_run\n  valve_steps: 800\n"
        << "sinks:\n  stdout_format: json\n"
        << "redis:\n  address: unix:///run/redis.sock\n  command_timeout_ms: 250\n";
  }

  AppConfig config{};
  try {
    config = load_app_config(path.string());
  } catch (const std::exception& ex) {
    std::filesystem::remove(path);
    std::cerr << ex.what() << '\n';
    return fail("test_config_loading_and_validation", "valid config should load");
  }
  std::filesystem::remove(path);

  if (config.loop.sample_interval != std::chrono::milliseconds(250) || !almost_equal(config.loop.kp, 1.5) ||
      !almost_equal(config.loop.ki, 0.25) || !almost_equal(config.loop.output_max, 200.0) ||
      !almost_equal(config.loop.flow_max, 25.0) || !almost_equal(config.loop.fail_safe_position, 0.1) ||
      !almost_equal(config.initial_setpoint, 7.5)) {
    return fail("test_config_loading_and_validation", "loop keys parsed incorrectly");
  }
  if (config.source.kind != flow_control::core::SourceKind::file || config.source.path != "/tmp/weights.log" ||
      config.valve.kind != flow_control::core::ValveKind::dry_run || config.valve.steps != 800) {
    return fail("test_config_loading_and_validation", "io keys parsed incorrectly");
  }
  if (!config.sinks.stdout_json || !config.redis.enabled || config.redis.unix_socket != "/run/redis.sock" ||
      config.redis.command_timeout != std::chrono::milliseconds(250)) {
    return fail("test_config_loading_and_validation", "sink keys parsed incorrectly");
  }

  const std::vector<std::string> bad_configs = {
      "output:\n  min: 10\n  max: 5\n",
      "pid:\n  kp: fast\n",
      "pid:\n  ki: 1.0x\n",
      "io:\n  source: carrier_pigeon\n",
      "io:\n  source: serial\n",
      "redis:\n  address: localhost:99999\n",
      "safety:\n  fail_safe_position: 1.5\n",
      "loop:\n  rate_hz: 0\n",
  };
  for (const auto& body : bad_configs) {
    const auto bad_path = std::filesystem::temp_directory_path() / "flow_control_bad.yaml";
    {
      std::ofstream out(bad_path);
      out << body;
    }
    bool threw = false;
    try {
      (void)load_app_config(bad_path.string());
    } catch (const std::exception&) {
      threw = true;
    }
    std::filesystem::remove(bad_path);
    if (!threw) {
      std::cerr << body;
      return fail("test_config_loading_and_validation", "invalid config should throw");
    }
  }

  bool missing_threw = false;
  try {
    (void)load_app_config("/nonexistent/flow_control.yaml");
  } catch (const std::exception&) {
    missing_threw = true;
  }
  if (!missing_threw) {
    return fail("test_config_loading_and_validation", "missing file should throw");
  }
  return 0;
}

int test_file_source_tails_complete_lines() {
  const auto path = std::filesystem::temp_directory_path() / "flow_control_weights.log";
  std::filesystem::remove(path);

  FileWeightSource source(path.string(), []() { return 42.0; });
  if (source.read().status != ReadStatus::hard_failure) {
    return fail("test_file_source_tails_complete_lines", "missing file is a hard failure");
  }

  {
    std::ofstream out(path);
    out << "1.0 10.0\n2.0 12.5\n";
  }
  ReadResult first = source.read();
  if (first.status != ReadStatus::fresh || !almost_equal(first.sample.timestamp_s, 2.0) ||
      !almost_equal(first.sample.mass, 12.5)) {
    return fail("test_file_source_tails_complete_lines", "latest complete line should be returned");
  }
  if (source.read().status != ReadStatus::stale) {
    return fail("test_file_source_tails_complete_lines", "no new line means stale");
  }

  {
    std::ofstream out(path, std::ios::app);
    out << "15.25";
  }
  if (source.read().status != ReadStatus::stale) {
    return fail("test_file_source_tails_complete_lines", "a partial line must not be consumed");
  }
  {
    std::ofstream out(path, std::ios::app);
    out << "\n";
  }
  ReadResult bare = source.read();
  if (bare.status != ReadStatus::fresh || !almost_equal(bare.sample.timestamp_s, 42.0) ||
      !almost_equal(bare.sample.mass, 15.25)) {
    return fail("test_file_source_tails_complete_lines", "bare mass line should be stamped on read");
  }

  {
    std::ofstream out(path, std::ios::app);
    out << "garbage\n";
  }
  if (source.read().status != ReadStatus::hard_failure) {
    return fail("test_file_source_tails_complete_lines", "unparsable line is a hard failure");
  }

  std::filesystem::remove(path);
  return 0;
}

int test_serial_pinch_valve_protocol() {
  if (flow_control::io::format_valve_command(200) != "/1A200R\r\n" || flow_control::io::to_valve_steps(0.5, 400) != 200 ||
      flow_control::io::to_valve_steps(1.7, 400) != 400) {
    return fail("test_serial_pinch_valve_protocol", "step conversion or command format mismatch");
  }

  int fds[2];
  if (::pipe(fds) != 0) {
    return fail("test_serial_pinch_valve_protocol", "pipe failed");
  }

  SerialPinchValve valve(std::make_unique<SerialPort>(fds[1]), 400, std::chrono::milliseconds(100));
  if (valve.command(0.5) != CommandStatus::ok || !almost_equal(valve.last_position(), 0.5)) {
    ::close(fds[0]);
    return fail("test_serial_pinch_valve_protocol", "command should be accepted");
  }

  char buffer[32] = {};
  const ssize_t n = ::read(fds[0], buffer, sizeof(buffer) - 1);
  if (n <= 0 || std::string(buffer, static_cast<std::size_t>(n)) != "/1A200R\r\n") {
    ::close(fds[0]);
    return fail("test_serial_pinch_valve_protocol", "valve controller should receive /1A200R");
  }

  if (valve.command(-0.1) != CommandStatus::rejected) {
    ::close(fds[0]);
    return fail("test_serial_pinch_valve_protocol", "out of range command must be rejected");
  }

  ::close(fds[0]);
  if (valve.command(0.25) != CommandStatus::rejected || !almost_equal(valve.last_position(), 0.5)) {
    return fail("test_serial_pinch_valve_protocol", "a dead link must reject and keep the last position");
  }
  return 0;
}

int test_serial_scale_source_buffers_latest_line() {
  const auto parsed = flow_control::io::parse_weight("ST,GS,+  12.34 g");
  if (!parsed.has_value() || !almost_equal(*parsed, 12.34) || flow_control::io::parse_weight("OL").has_value() ||
      !almost_equal(*flow_control::io::parse_weight("  -3.5\r"), -3.5)) {
    return fail("test_serial_scale_source_buffers_latest_line", "weight line parsing mismatch");
  }

  int fds[2];
  if (::pipe(fds) != 0) {
    return fail("test_serial_scale_source_buffers_latest_line", "pipe failed");
  }

  double fake_now = 7.0;
  SerialScaleSource source(std::make_unique<SerialPort>(fds[0]), std::chrono::milliseconds(500),
                           [&fake_now]() { return fake_now; });

  const std::string lines = "ST,GS,+  10.00 g\r\nST,GS,+  12.34 g\r\n";
  if (::write(fds[1], lines.data(), lines.size()) != static_cast<ssize_t>(lines.size())) {
    ::close(fds[1]);
    return fail("test_serial_scale_source_buffers_latest_line", "pipe write failed");
  }

  ReadResult latest{};
  for (int attempt = 0; attempt < 10; ++attempt) {
    latest = source.read();
    if (latest.status == ReadStatus::fresh && almost_equal(latest.sample.mass, 12.34)) {
      break;
    }
  }
  if (latest.status != ReadStatus::fresh || !almost_equal(latest.sample.mass, 12.34) ||
      !almost_equal(latest.sample.timestamp_s, 7.0)) {
    ::close(fds[1]);
    return fail("test_serial_scale_source_buffers_latest_line", "newest line should be returned");
  }

  if (source.read().status != ReadStatus::stale) {
    ::close(fds[1]);
    return fail("test_serial_scale_source_buffers_latest_line", "nothing new within the timeout means stale");
  }

  ::close(fds[1]);
  ReadResult closed{};
  for (int attempt = 0; attempt < 10 && closed.status != ReadStatus::hard_failure; ++attempt) {
    closed = source.read();
  }
  if (closed.status != ReadStatus::hard_failure) {
    return fail("test_serial_scale_source_buffers_latest_line", "a closed link is a hard failure");
  }
  return 0;
}

int test_latest_sample_buffer_keeps_newest() {
  LatestSampleBuffer buffer;
  buffer.push({1.0, 1.0});
  buffer.push({2.0, 3.0});

  const ReadResult first = buffer.pull(std::chrono::milliseconds(1));
  if (first.status != ReadStatus::fresh || !almost_equal(first.sample.mass, 3.0)) {
    return fail("test_latest_sample_buffer_keeps_newest", "only the newest sample should be delivered");
  }
  if (buffer.pull(std::chrono::milliseconds(1)).status != ReadStatus::stale) {
    return fail("test_latest_sample_buffer_keeps_newest", "a consumed sample must not be delivered twice");
  }

  std::thread producer([&buffer]() {
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    buffer.push({3.0, 4.0});
  });
  const ReadResult waited = buffer.pull(std::chrono::milliseconds(1000));
  producer.join();
  if (waited.status != ReadStatus::fresh || !almost_equal(waited.sample.mass, 4.0)) {
    return fail("test_latest_sample_buffer_keeps_newest", "pull should wake for a new sample");
  }

  buffer.fail("gone");
  const ReadResult failed = buffer.pull(std::chrono::milliseconds(1));
  if (failed.status != ReadStatus::hard_failure || failed.error != "gone") {
    return fail("test_latest_sample_buffer_keeps_newest", "failure should be reported");
  }
  return 0;
}

int test_simulated_rig_and_dry_run_valve() {
  FakeClock clock;
  auto rig = std::make_shared<SimulatedRig>(40.0, clock.fn());
  DryRunValve valve(400, rig);

  rig->read();
  if (valve.command(0.5) != CommandStatus::ok) {
    return fail("test_simulated_rig_and_dry_run_valve", "dry run should accept the command");
  }
  clock.now_s += 2.0;
  const ReadResult reading = rig->read();
  if (!almost_equal(reading.sample.mass, 40.0) || !almost_equal(valve.last_position(), 0.5)) {
    return fail("test_simulated_rig_and_dry_run_valve", "half open for 2 s should add 40 units");
  }
  if (valve.command(2.0) != CommandStatus::rejected) {
    return fail("test_simulated_rig_and_dry_run_valve", "out of range command must be rejected");
  }
  if (rig->command(1.5) != CommandStatus::rejected || rig->command(-0.1) != CommandStatus::rejected ||
      !almost_equal(rig->last_position(), 0.5)) {
    return fail("test_simulated_rig_and_dry_run_valve", "rig must reject out of range positions and keep its opening");
  }
  return 0;
}

int test_sinks_publish_observation() {
  flow_observation observation{};
  observation.tick = 9;
  observation.timestamp_s = 12.5;
  observation.estimated_flow = 9.75;
  observation.valid = true;
  observation.setpoint = 10.0;
  observation.commanded_position = 0.25;
  observation.state = loop_state::RUNNING;
  observation.health.stale_ticks = 3;

  const auto json = flow_control::sinks::observation_to_json(observation);
  if (json.at("tick").get<std::uint64_t>() != 9 || json.at("loop_state").get<std::string>() != "RUNNING" ||
      !almost_equal(json.at("estimated_flow").get<double>(), 9.75) || !json.at("valid").get<bool>()) {
    return fail("test_sinks_publish_observation", "json observation mismatch");
  }

  flow_control::core::RedisConfig redis{};
  redis.enabled = true;
  redis.key_prefix = "flow:test";
  redis.command_timeout = std::chrono::milliseconds(250);
  RedisTsSink sink(redis);
  if (sink.series_keys().size() != 10 || sink.series_keys().front() != "flow:test:flow:raw") {
    return fail("test_sinks_publish_observation", "series keys should carry the prefix");
  }
  g_redis_mock = {};
  if (!sink.publish(observation)) {
    return fail("test_sinks_publish_observation", "redis publish should succeed against the mock");
  }
  if (g_redis_mock.last_argv.empty() || g_redis_mock.last_argv.front() != "TS.MADD") {
    return fail("test_sinks_publish_observation", "publish should issue TS.MADD");
  }
  if (g_redis_mock.set_timeout_calls != 1 || g_redis_mock.last_timeout.tv_sec != 0 ||
      g_redis_mock.last_timeout.tv_usec != 250000) {
    return fail("test_sinks_publish_observation", "every connection must carry the command timeout");
  }

  bool found_estimate = false;
  bool found_state = false;
  bool found_stale = false;
  for (std::size_t i = 0; i + 2 < g_redis_mock.last_argv.size(); ++i) {
    if (g_redis_mock.last_argv[i] == "flow:test:flow:estimate") {
      found_estimate = g_redis_mock.last_argv[i + 2] == "9.750000";
    }
    if (g_redis_mock.last_argv[i] == "flow:test:loop:state") {
      found_state = g_redis_mock.last_argv[i + 2] == "1.000000";
    }
    if (g_redis_mock.last_argv[i] == "flow:test:loop:stale_ticks") {
      found_stale = g_redis_mock.last_argv[i + 2] == "3.000000";
    }
  }
  if (!found_estimate || !found_state || !found_stale) {
    return fail("test_sinks_publish_observation", "TS.MADD payload missing flow or state samples");
  }
  return 0;
}

}  // namespace

int main() {
  std::signal(SIGPIPE, SIG_IGN);

  if (int rc = test_start_rejects_invalid_configuration(); rc != 0) return rc;
  if (int rc = test_tick_pipeline_commands_valve_and_publishes(); rc != 0) return rc;
  if (int rc = test_sensor_hard_failure_faults_to_fail_safe(); rc != 0) return rc;
  if (int rc = test_actuator_rejection_faults_without_committing(); rc != 0) return rc;
  if (int rc = test_setpoint_change_mid_tick_applies_next_tick(); rc != 0) return rc;
  if (int rc = test_stale_ticks_freeze_controller(); rc != 0) return rc;
  if (int rc = test_reset_request_and_setpoint_jump_reset_controller(); rc != 0) return rc;
  if (int rc = test_stop_commands_fail_safe_and_restart_is_deterministic(); rc != 0) return rc;
  if (int rc = test_busy_tick_is_skipped_and_stop_waits(); rc != 0) return rc;
  if (int rc = test_closed_loop_on_simulated_rig(); rc != 0) return rc;
  if (int rc = test_hung_observer_cannot_block_stop(); rc != 0) return rc;
  if (int rc = test_run_for_ticks_paces_and_honours_shutdown(); rc != 0) return rc;
  if (int rc = test_config_loading_and_validation(); rc != 0) return rc;
  if (int rc = test_file_source_tails_complete_lines(); rc != 0) return rc;
  if (int rc = test_serial_pinch_valve_protocol(); rc != 0) return rc;
  if (int rc = test_serial_scale_source_buffers_latest_line(); rc != 0) return rc;
  if (int rc = test_latest_sample_buffer_keeps_newest(); rc != 0) return rc;
  if (int rc = test_simulated_rig_and_dry_run_valve(); rc != 0) return rc;
  if (int rc = test_sinks_publish_observation(); rc != 0) return rc;

  std::cout << "[PASS] loop unit tests\n";
  return 0;
}
