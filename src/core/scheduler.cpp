#include "core/scheduler.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <thread>
#include <utility>

#include "core/math.hpp"
#include "core/timestamp.hpp"

namespace flow_control::core {
namespace {

model::flow_estimate held_estimate(const estimation::FlowEstimator& estimator) {
  model::flow_estimate estimate = estimator.last();
  estimate.valid = false;
  return estimate;
}

}  // namespace

ControlLoopScheduler::ControlLoopScheduler(LoopConfig config, LoopContext& context, io::WeightSampleSource& source,
                                           io::ValveActuator& valve, Clock clock)
    : config_(config),
      context_(context),
      source_(source),
      valve_(valve),
      clock_(std::move(clock)),
      estimator_(config.estimator) {
  if (!clock_) {
    clock_ = monotonic_now_s;
  }
}

void ControlLoopScheduler::add_observer(std::string name, Observer publish) {
  const std::lock_guard<std::mutex> lock(observer_mutex_);
  observers_.push_back({std::move(name), std::move(publish), true});
}

bool ControlLoopScheduler::start() {
  const std::lock_guard<std::mutex> lock(tick_mutex_);
  if (state_.load() != model::loop_state::STOPPED) {
    std::cerr << "[loop] start ignored in state " << model::to_string(state_.load()) << '\n';
    return false;
  }

  try {
    controller_.emplace(config_);
  } catch (const std::invalid_argument& ex) {
    std::cerr << "[loop] start rejected: " << ex.what() << '\n';
    controller_.reset();
    return false;
  }

  estimator_ = estimation::FlowEstimator(config_.estimator);
  controller_->reset(command_to_output(valve_.last_position()));
  context_.controller_reset_requested.store(false);

  last_tick_s_ = clock_();
  last_setpoint_ = clamp_setpoint(context_.setpoint.get());
  last_output_ = controller_->state().previous_output;
  in_stale_episode_ = false;

  state_.store(model::loop_state::RUNNING);
  std::cerr << "[loop] STOPPED -> RUNNING | interval_ms=" << config_.sample_interval.count() << " kp=" << config_.kp
            << " ki=" << config_.ki << " kd=" << config_.kd << " setpoint=" << last_setpoint_ << '\n';
  return true;
}

void ControlLoopScheduler::stop() {
  Publication publication{};
  {
    const std::lock_guard<std::mutex> lock(tick_mutex_);
    if (state_.load() != model::loop_state::RUNNING) {
      return;
    }

    if (valve_.command(config_.fail_safe_position) != io::CommandStatus::ok) {
      publication = enter_fault("valve rejected fail-safe command during stop", clock_());
    } else {
      state_.store(model::loop_state::STOPPED);
      std::cerr << "[loop] RUNNING -> STOPPED | valve at fail-safe " << config_.fail_safe_position << '\n';
      publication = record(make_observation(clock_(), held_estimate(estimator_), last_setpoint_,
                                            command_to_output(config_.fail_safe_position), config_.fail_safe_position));
    }
  }
  notify_observers(publication);
}

bool ControlLoopScheduler::reset_fault() {
  const std::lock_guard<std::mutex> lock(tick_mutex_);
  if (state_.load() != model::loop_state::FAULTED) {
    return false;
  }
  state_.store(model::loop_state::STOPPED);
  std::cerr << "[loop] FAULTED -> STOPPED (operator reset)\n";
  return true;
}

TickOutcome ControlLoopScheduler::tick() {
  Publication publication{};
  TickOutcome outcome = TickOutcome::not_running;
  {
    std::unique_lock<std::mutex> lock(tick_mutex_, std::try_to_lock);
    if (!lock.owns_lock()) {
      ++ticks_skipped_;
      std::cerr << "[loop] previous tick still in progress; skipping\n";
      return TickOutcome::skipped_busy;
    }
    if (state_.load() != model::loop_state::RUNNING) {
      return TickOutcome::not_running;
    }
    outcome = run_tick_locked(publication);
  }
  // Observers run outside the tick lock.
  notify_observers(publication);
  return outcome;
}

TickOutcome ControlLoopScheduler::run_tick_locked(Publication& publication) {
  const auto cycle_start = std::chrono::steady_clock::now();
  const double now_s = clock_();
  const double setpoint = clamp_setpoint(context_.setpoint.get());

  // Work on copies; nothing is committed unless the valve accepts the command.
  estimation::FlowEstimator estimator = estimator_;
  control::PIDController controller = *controller_;

  const io::ReadResult reading = source_.read();
  if (reading.status == io::ReadStatus::hard_failure) {
    publication = enter_fault("weight source " + std::string(source_.name()) + ": " + reading.error, now_s);
    return TickOutcome::faulted;
  }

  const model::flow_estimate estimate =
      reading.status == io::ReadStatus::fresh ? estimator.update(reading.sample) : estimator.hold();

  bool reset_controller = context_.controller_reset_requested.exchange(false);
  if (reset_controller) {
    std::cerr << "[loop] controller reset requested\n";
  } else if (config_.setpoint_reset_threshold > 0.0 &&
             std::fabs(setpoint - last_setpoint_) > config_.setpoint_reset_threshold) {
    std::cerr << "[loop] setpoint moved " << last_setpoint_ << " -> " << setpoint << "; resetting controller\n";
    reset_controller = true;
  }
  if (reset_controller) {
    controller.reset(command_to_output(valve_.last_position()));
  }

  const control::ControllerOutput output =
      controller.update(setpoint, estimate.rate, estimate.valid, now_s - last_tick_s_, now_s);
  const double command = output_to_command(output.output);

  if (valve_.command(command) != io::CommandStatus::ok) {
    publication = enter_fault("valve " + std::string(valve_.name()) + " rejected command " + std::to_string(command), now_s);
    return TickOutcome::faulted;
  }

  estimator_ = estimator;
  controller_ = controller;
  last_tick_s_ = now_s;
  last_setpoint_ = setpoint;
  last_output_ = output.output;
  ++tick_count_;
  ++ticks_executed_;

  if (reading.status == io::ReadStatus::stale) {
    ++stale_ticks_;
    if (!in_stale_episode_) {
      std::cerr << "[loop] no new weight sample; holding valve at " << command << '\n';
      in_stale_episode_ = true;
    }
  } else if (in_stale_episode_) {
    std::cerr << "[loop] weight samples resumed\n";
    in_stale_episode_ = false;
  }

  last_compute_ms_ = std::chrono::duration_cast<std::chrono::duration<float, std::milli>>(
                         std::chrono::steady_clock::now() - cycle_start)
                         .count();
  publication = record(make_observation(now_s, estimate, setpoint, output.output, command));
  return output.held ? TickOutcome::held : TickOutcome::executed;
}

ControlLoopScheduler::Publication ControlLoopScheduler::enter_fault(const std::string& reason, const double now_s) {
  const model::loop_state previous = state_.exchange(model::loop_state::FAULTED);
  ++faults_;
  std::cerr << "[loop] " << model::to_string(previous) << " -> FAULTED: " << reason << '\n';

  command_fail_safe();
  return record(make_observation(now_s, held_estimate(estimator_), last_setpoint_,
                                 command_to_output(config_.fail_safe_position), config_.fail_safe_position));
}

void ControlLoopScheduler::command_fail_safe() {
  if (valve_.command(config_.fail_safe_position) != io::CommandStatus::ok) {
    std::cerr << "[loop] valve rejected fail-safe position " << config_.fail_safe_position << '\n';
  }
}

ControlLoopScheduler::Publication ControlLoopScheduler::record(const model::flow_observation& observation) {
  context_.observations.publish(observation);
  return Publication{observation, ++publish_sequence_};
}

void ControlLoopScheduler::notify_observers(const Publication& publication) {
  const std::lock_guard<std::mutex> lock(observer_mutex_);
  // Zero means nothing was recorded; an older sequence lost the race to a newer observation.
  if (publication.sequence <= notified_sequence_) {
    return;
  }
  notified_sequence_ = publication.sequence;
  const model::flow_observation& observation = publication.observation;

  for (auto& observer : observers_) {
    const bool ok = observer.publish(observation);
    if (!ok && observer.healthy) {
      std::cerr << "[" << observer.name << "] publish failed\n";
      observer.healthy = false;
    } else if (ok && !observer.healthy) {
      std::cerr << "[" << observer.name << "] publish recovered\n";
      observer.healthy = true;
    }
  }
}

model::flow_observation ControlLoopScheduler::make_observation(const double now_s, const model::flow_estimate& estimate,
                                                               const double setpoint, const double output,
                                                               const double command) const {
  model::flow_observation observation{};
  observation.tick = tick_count_;
  observation.timestamp_s = now_s;
  observation.raw_rate = estimate.raw_rate;
  observation.estimated_flow = estimate.rate;
  observation.valid = estimate.valid;
  observation.setpoint = setpoint;
  observation.controller_output = output;
  observation.commanded_position = command;
  observation.state = state_.load();
  observation.health.compute_time_ms = last_compute_ms_;
  observation.health.missed_ticks = static_cast<std::uint32_t>(ticks_skipped_.load());
  observation.health.stale_ticks = static_cast<std::uint32_t>(stale_ticks_.load());
  return observation;
}

LoopStats ControlLoopScheduler::run_for_ticks(const std::size_t total_ticks, const std::atomic<bool>* shutdown) {
  auto next_wakeup = std::chrono::steady_clock::now();

  for (std::size_t i = 0; total_ticks == 0 || i < total_ticks; ++i) {
    if ((shutdown != nullptr && shutdown->load()) || state_.load() != model::loop_state::RUNNING) {
      break;
    }

    tick();

    next_wakeup += config_.sample_interval;
    const auto now = std::chrono::steady_clock::now();
    if (now > next_wakeup) {
      const auto overrun = now - next_wakeup;
      const auto missed = static_cast<std::size_t>(overrun / config_.sample_interval) + 1;
      next_wakeup += config_.sample_interval * static_cast<long long>(missed);
      ticks_skipped_ += missed;
      std::cerr << "[loop] tick overran by "
                << std::chrono::duration_cast<std::chrono::milliseconds>(overrun).count() << " ms; skipping "
                << missed << " tick(s)\n";
    }
    std::this_thread::sleep_until(next_wakeup);
  }

  return stats();
}

LoopStats ControlLoopScheduler::stats() const noexcept {
  LoopStats stats{};
  stats.ticks_executed = ticks_executed_.load();
  stats.ticks_skipped = ticks_skipped_.load();
  stats.stale_ticks = stale_ticks_.load();
  stats.faults = faults_.load();
  return stats;
}

std::optional<control::ControllerState> ControlLoopScheduler::controller_state() const {
  const std::lock_guard<std::mutex> lock(tick_mutex_);
  if (!controller_.has_value()) {
    return std::nullopt;
  }
  return controller_->state();
}

double ControlLoopScheduler::clamp_setpoint(const double requested) const noexcept {
  if (!std::isfinite(requested)) {
    return last_setpoint_;
  }
  return std::clamp(requested, config_.flow_min, config_.flow_max);
}

double ControlLoopScheduler::output_to_command(const double output) const noexcept {
  return normalize(output, config_.output_min, config_.output_max);
}

double ControlLoopScheduler::command_to_output(const double command) const noexcept {
  return denormalize(command, config_.output_min, config_.output_max);
}

}  // namespace flow_control::core
