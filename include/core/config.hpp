#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace flow_control::core {

struct EstimatorConfig {
  double filter_tau_s{2.0};
  double min_dt_s{0.001};
  double max_staleness_s{5.0};
};

// Read-only for the duration of a run.
struct LoopConfig {
  std::chrono::milliseconds sample_interval{1000};
  double kp{2.0};
  double ki{1.0};
  double kd{2.0};
  double output_min{0.0};
  double output_max{400.0};
  double integral_min{-100.0};
  double integral_max{100.0};
  double max_output_slew_per_s{400.0};
  double flow_min{0.0};
  double flow_max{100.0};
  double fail_safe_position{0.0};
  double setpoint_reset_threshold{0.0};
  EstimatorConfig estimator{};
};

enum class SourceKind : std::uint8_t { simulated, file, serial };
enum class ValveKind : std::uint8_t { simulated, dry_run, serial };

struct SourceConfig {
  SourceKind kind{SourceKind::simulated};
  std::string path{};
  int baud{9600};
  std::chrono::milliseconds read_timeout{200};
};

struct ValveConfig {
  ValveKind kind{ValveKind::simulated};
  std::string port{"/dev/ttyUSB0"};
  int baud{9600};
  std::uint32_t steps{400};
  std::chrono::milliseconds command_timeout{200};
};

struct SimulationConfig {
  double max_flow_rate{400.0 / 9.0};
};

struct RedisConfig {
  bool enabled{false};
  std::string host{"127.0.0.1"};
  std::uint16_t port{6379};
  std::string unix_socket{};
  std::string password{};
  int db{0};
  std::string key_prefix{"flow:rig"};
  std::chrono::milliseconds connect_timeout{1000};
  std::chrono::milliseconds command_timeout{1000};
  bool publish_health{true};
};

struct SinkConfig {
  bool stdout_enabled{true};
  bool stdout_json{false};
};

struct AppConfig {
  LoopConfig loop{};
  double initial_setpoint{0.0};
  SourceConfig source{};
  ValveConfig valve{};
  SimulationConfig simulation{};
  SinkConfig sinks{};
  RedisConfig redis{};
};

// Returns a description of the first violated bound, or nullopt when the config is usable.
[[nodiscard]] std::optional<std::string> validate_loop_config(const LoopConfig& config);

AppConfig load_app_config(const std::string& path);

const char* to_string(SourceKind kind) noexcept;
const char* to_string(ValveKind kind) noexcept;

}  // namespace flow_control::core
