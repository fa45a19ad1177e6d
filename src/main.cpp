#include <atomic>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>

#include "core/config.hpp"
#include "core/loop_context.hpp"
#include "core/scheduler.hpp"
#include "io/backends.hpp"
#include "sinks/redis_ts.hpp"
#include "sinks/stdout_debug.hpp"

namespace {

std::atomic<bool> g_shutdown_requested{false};
flow_control::core::LoopContext* g_context = nullptr;

void handle_shutdown_signal(int /*signal*/) {
  g_shutdown_requested.store(true);
}

void handle_reset_signal(int /*signal*/) {
  if (g_context != nullptr) {
    g_context->request_controller_reset();
  }
}

std::string format_config_settings(const flow_control::core::AppConfig& config, const std::string& config_path) {
  const auto& loop = config.loop;
  std::ostringstream output;
  output << "[main] loaded config from " << config_path
         << " | sample_interval_ms=" << loop.sample_interval.count()
         << " | kp=" << loop.kp << " ki=" << loop.ki << " kd=" << loop.kd
         << " | output=[" << loop.output_min << ',' << loop.output_max << ']'
         << " | integral=[" << loop.integral_min << ',' << loop.integral_max << ']'
         << " | slew_per_s=" << loop.max_output_slew_per_s
         << " | flow=[" << loop.flow_min << ',' << loop.flow_max << ']'
         << " | fail_safe=" << loop.fail_safe_position
         << " | source=" << flow_control::core::to_string(config.source.kind)
         << " | valve=" << flow_control::core::to_string(config.valve.kind)
         << " | redis_address=";

  if (!config.redis.enabled) {
    output << "disabled";
  } else if (!config.redis.unix_socket.empty()) {
    output << "unix://" << config.redis.unix_socket;
  } else {
    output << config.redis.host << ':' << config.redis.port;
  }
  return output.str();
}

}  // namespace

int main(int argc, char** argv) {
  std::signal(SIGINT, handle_shutdown_signal);
  std::signal(SIGTERM, handle_shutdown_signal);
  std::signal(SIGPIPE, SIG_IGN);

  std::string config_path = "configs/flow_control.sim.yaml";
  std::string setpoint_override;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--setpoint" && i + 1 < argc) {
      setpoint_override = argv[++i];
    } else {
      config_path = arg;
    }
  }

  flow_control::core::AppConfig config{};
  try {
    config = flow_control::core::load_app_config(config_path);
    if (!setpoint_override.empty()) {
      config.initial_setpoint = std::stod(setpoint_override);
    }
  } catch (const std::exception& ex) {
    std::cerr << "config error: " << ex.what() << '\n';
    return 1;
  }

  std::cerr << format_config_settings(config, config_path) << '\n';

  flow_control::io::Backends backends{};
  try {
    backends = flow_control::io::make_backends(config);
  } catch (const std::exception& ex) {
    std::cerr << "[main] backend setup failed: " << ex.what() << '\n';
    return 1;
  }

  flow_control::core::LoopContext context{config.initial_setpoint};
  g_context = &context;
  std::signal(SIGHUP, handle_reset_signal);
  flow_control::core::ControlLoopScheduler scheduler{config.loop, context, *backends.source, *backends.valve};

  if (config.sinks.stdout_enabled) {
    const auto stdout_sink = std::make_shared<flow_control::sinks::StdoutDebugSink>(config.sinks.stdout_json);
    scheduler.add_observer("stdout", [stdout_sink](const flow_control::model::flow_observation& observation) {
      return stdout_sink->publish(observation);
    });
  }

  if (config.redis.enabled) {
    const auto redis_sink = std::make_shared<flow_control::sinks::RedisTsSink>(config.redis);
    if (redis_sink->connect()) {
      std::cerr << "[main] redis connected; " << redis_sink->series_keys().size() << " series under "
                << config.redis.key_prefix << '\n';
    } else {
      std::cerr << "[main] redis unavailable; will retry on publish\n";
    }
    scheduler.add_observer("redis", [redis_sink](const flow_control::model::flow_observation& observation) {
      return redis_sink->publish(observation);
    });
  }

  if (!scheduler.start()) {
    return 1;
  }

  std::cerr << "[main] running; SIGHUP resets the controller, SIGINT stops the loop\n";
  scheduler.run_for_ticks(0, &g_shutdown_requested);
  std::signal(SIGHUP, SIG_DFL);
  g_context = nullptr;

  if (scheduler.state() == flow_control::model::loop_state::FAULTED) {
    std::cerr << "[main] control loop faulted; valve left at fail-safe position\n";
    return 2;
  }

  std::cerr << "[main] shutdown signal received; stopping loop\n";
  scheduler.stop();
  const auto stats = scheduler.stats();
  std::cerr << "[main] ticks_executed=" << stats.ticks_executed << " ticks_skipped=" << stats.ticks_skipped
            << " stale_ticks=" << stats.stale_ticks << '\n';
  return 0;
}
