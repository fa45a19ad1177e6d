#include "core/config.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "core/math.hpp"

namespace flow_control::core {
namespace {

std::string trim(const std::string& value) {
  const auto begin = std::find_if_not(value.begin(), value.end(), [](unsigned char c) { return std::isspace(c) != 0; });
  const auto end = std::find_if_not(value.rbegin(), value.rend(), [](unsigned char c) { return std::isspace(c) != 0; }).base();
  if (begin >= end) {
    return {};
  }
  return std::string(begin, end);
}

std::string to_lower(const std::string& value) {
  std::string out;
  out.reserve(value.size());
  for (const char c : value) {
    out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  return out;
}

bool parse_bool(const std::string& value) {
  const std::string lower = to_lower(value);
  return lower == "true" || lower == "yes" || lower == "on" || lower == "1";
}

double parse_double(const std::string& key, const std::string& value) {
  std::size_t consumed = 0;
  double parsed = 0.0;
  try {
    parsed = std::stod(value, &consumed);
  } catch (const std::exception&) {
    throw std::runtime_error(key + " must be a number, got '" + value + "'");
  }
  if (consumed != value.size() || !std::isfinite(parsed)) {
    throw std::runtime_error(key + " must be a finite number, got '" + value + "'");
  }
  return parsed;
}

long long parse_integer(const std::string& key, const std::string& value) {
  std::size_t consumed = 0;
  long long parsed = 0;
  try {
    parsed = std::stoll(value, &consumed);
  } catch (const std::exception&) {
    throw std::runtime_error(key + " must be an integer, got '" + value + "'");
  }
  if (consumed != value.size()) {
    throw std::runtime_error(key + " must be an integer, got '" + value + "'");
  }
  return parsed;
}

std::chrono::milliseconds parse_timeout(const std::string& key, const std::string& value) {
  const auto ms = parse_integer(key, value);
  if (ms <= 0) {
    throw std::runtime_error(key + " must be greater than 0");
  }
  return std::chrono::milliseconds(ms);
}

void apply_redis_address(RedisConfig& redis, const std::string& value) {
  redis.enabled = !value.empty();
  if (value.rfind("unix://", 0) == 0) {
    redis.unix_socket = value.substr(std::string("unix://").size());
    redis.host.clear();
    redis.port = 0;
    return;
  }

  if (!value.empty() && value.front() == '/') {
    redis.unix_socket = value;
    redis.host.clear();
    redis.port = 0;
    return;
  }

  redis.unix_socket.clear();
  const auto split = value.find(':');
  if (split == std::string::npos) {
    redis.host = value;
    return;
  }

  redis.host = value.substr(0, split);
  const auto parsed_port = parse_integer("redis.address", value.substr(split + 1));
  if (parsed_port <= 0 || parsed_port > 65535) {
    throw std::runtime_error("redis.address port must be in range 1..65535");
  }
  redis.port = static_cast<std::uint16_t>(parsed_port);
}

void apply_key_value(AppConfig& config, const std::string& key, const std::string& value) {
  LoopConfig& loop = config.loop;

  if (key == "loop.rate_hz") {
    const auto hz = parse_integer(key, value);
    if (hz <= 0) {
      throw std::runtime_error("loop.rate_hz must be greater than 0");
    }
    if (hz > 1000) {
      throw std::runtime_error("loop.rate_hz must be less than or equal to 1000");
    }
    loop.sample_interval = std::chrono::milliseconds(1000 / hz);
    return;
  }

  if (key == "loop.sample_interval_ms") {
    loop.sample_interval = parse_timeout(key, value);
    return;
  }

  if (key == "pid.kp") {
    loop.kp = parse_double(key, value);
    return;
  }
  if (key == "pid.ki") {
    loop.ki = parse_double(key, value);
    return;
  }
  if (key == "pid.kd") {
    loop.kd = parse_double(key, value);
    return;
  }

  if (key == "output.min") {
    loop.output_min = parse_double(key, value);
    return;
  }
  if (key == "output.max") {
    loop.output_max = parse_double(key, value);
    return;
  }
  if (key == "output.max_slew_per_s") {
    loop.max_output_slew_per_s = parse_double(key, value);
    return;
  }

  if (key == "integral.min") {
    loop.integral_min = parse_double(key, value);
    return;
  }
  if (key == "integral.max") {
    loop.integral_max = parse_double(key, value);
    return;
  }

  if (key == "flow.min") {
    loop.flow_min = parse_double(key, value);
    return;
  }
  if (key == "flow.max") {
    loop.flow_max = parse_double(key, value);
    return;
  }

  if (key == "estimator.filter_tau_s") {
    loop.estimator.filter_tau_s = parse_double(key, value);
    return;
  }
  if (key == "estimator.min_dt_s") {
    loop.estimator.min_dt_s = parse_double(key, value);
    return;
  }
  if (key == "estimator.max_staleness_s") {
    loop.estimator.max_staleness_s = parse_double(key, value);
    return;
  }

  if (key == "safety.fail_safe_position") {
    loop.fail_safe_position = parse_double(key, value);
    return;
  }
  if (key == "safety.setpoint_reset_threshold") {
    loop.setpoint_reset_threshold = parse_double(key, value);
    return;
  }

  if (key == "setpoint.initial") {
    config.initial_setpoint = parse_double(key, value);
    return;
  }

  if (key == "io.source") {
    const std::string kind = to_lower(value);
    if (kind == "simulated") {
      config.source.kind = SourceKind::simulated;
    } else if (kind == "file") {
      config.source.kind = SourceKind::file;
    } else if (kind == "serial") {
      config.source.kind = SourceKind::serial;
    } else {
      throw std::runtime_error("io.source must be one of simulated, file, serial");
    }
    return;
  }
  if (key == "io.source_path") {
    config.source.path = value;
    return;
  }
  if (key == "io.source_baud") {
    config.source.baud = static_cast<int>(parse_integer(key, value));
    return;
  }
  if (key == "io.read_timeout_ms") {
    config.source.read_timeout = parse_timeout(key, value);
    return;
  }

  if (key == "io.valve") {
    const std::string kind = to_lower(value);
    if (kind == "simulated") {
      config.valve.kind = ValveKind::simulated;
    } else if (kind == "dry_run") {
      config.valve.kind = ValveKind::dry_run;
    } else if (kind == "serial") {
      config.valve.kind = ValveKind::serial;
    } else {
      throw std::runtime_error("io.valve must be one of simulated, dry_run, serial");
    }
    return;
  }
  if (key == "io.valve_port") {
    config.valve.port = value;
    return;
  }
  if (key == "io.valve_baud") {
    config.valve.baud = static_cast<int>(parse_integer(key, value));
    return;
  }
  if (key == "io.valve_steps") {
    const auto steps = parse_integer(key, value);
    if (steps <= 0) {
      throw std::runtime_error("io.valve_steps must be greater than 0");
    }
    config.valve.steps = static_cast<std::uint32_t>(steps);
    return;
  }
  if (key == "io.command_timeout_ms") {
    config.valve.command_timeout = parse_timeout(key, value);
    return;
  }

  if (key == "simulation.max_flow_rate") {
    config.simulation.max_flow_rate = parse_double(key, value);
    if (config.simulation.max_flow_rate <= 0.0) {
      throw std::runtime_error("simulation.max_flow_rate must be greater than 0");
    }
    return;
  }

  if (key == "sinks.stdout") {
    config.sinks.stdout_enabled = parse_bool(value);
    return;
  }
  if (key == "sinks.stdout_format") {
    const std::string format = to_lower(value);
    if (format != "text" && format != "json") {
      throw std::runtime_error("sinks.stdout_format must be text or json");
    }
    config.sinks.stdout_json = format == "json";
    return;
  }

  if (key == "redis.address") {
    apply_redis_address(config.redis, value);
    return;
  }
  if (key == "redis.key_prefix") {
    config.redis.key_prefix = value;
    return;
  }
  if (key == "redis.password") {
    config.redis.password = value;
    return;
  }
  if (key == "redis.db") {
    const auto db = parse_integer(key, value);
    if (db < 0) {
      throw std::runtime_error("redis.db must not be negative");
    }
    config.redis.db = static_cast<int>(db);
    return;
  }
  if (key == "redis.connect_timeout_ms") {
    config.redis.connect_timeout = parse_timeout(key, value);
    return;
  }
  if (key == "redis.command_timeout_ms") {
    config.redis.command_timeout = parse_timeout(key, value);
    return;
  }
  if (key == "redis.publish_health") {
    config.redis.publish_health = parse_bool(value);
  }
}

bool all_bounds_finite(const LoopConfig& config) {
  return all_finite(config.output_min, config.output_max) && all_finite(config.integral_min, config.integral_max) &&
         all_finite(config.flow_min, config.flow_max) && all_finite(config.max_output_slew_per_s, config.fail_safe_position) &&
         all_finite(config.estimator.filter_tau_s, config.estimator.min_dt_s) &&
         all_finite(config.estimator.max_staleness_s, config.setpoint_reset_threshold);
}

}  // namespace

std::optional<std::string> validate_loop_config(const LoopConfig& config) {
  if (config.sample_interval.count() <= 0) {
    return "sample interval must be greater than 0";
  }
  if (!std::isfinite(config.kp) || !std::isfinite(config.ki) || !std::isfinite(config.kd)) {
    return "PID gains must be finite";
  }
  if (!all_bounds_finite(config)) {
    return "bounds must be finite";
  }
  if (config.output_min >= config.output_max) {
    return "output.min must be less than output.max";
  }
  if (config.integral_min > config.integral_max) {
    return "integral.min must not exceed integral.max";
  }
  if (config.flow_min > config.flow_max) {
    return "flow.min must not exceed flow.max";
  }
  if (config.max_output_slew_per_s <= 0.0) {
    return "output.max_slew_per_s must be greater than 0";
  }
  if (config.fail_safe_position < 0.0 || config.fail_safe_position > 1.0) {
    return "safety.fail_safe_position must be within [0, 1]";
  }
  if (config.setpoint_reset_threshold < 0.0) {
    return "safety.setpoint_reset_threshold must not be negative";
  }
  if (config.estimator.filter_tau_s < 0.0) {
    return "estimator.filter_tau_s must not be negative";
  }
  if (config.estimator.min_dt_s <= 0.0) {
    return "estimator.min_dt_s must be greater than 0";
  }
  if (config.estimator.max_staleness_s <= config.estimator.min_dt_s) {
    return "estimator.max_staleness_s must exceed estimator.min_dt_s";
  }
  return std::nullopt;
}

AppConfig load_app_config(const std::string& path) {
  AppConfig config{};

  std::ifstream input(path);
  if (!input.is_open()) {
    throw std::runtime_error("unable to open config file: " + path);
  }

  std::vector<std::string> sections;
  std::string line;
  while (std::getline(input, line)) {
    const auto comment_pos = line.find('#');
    if (comment_pos != std::string::npos) {
      line.erase(comment_pos);
    }

    if (trim(line).empty()) {
      continue;
    }

    std::size_t indent_spaces = 0;
    while (indent_spaces < line.size() && line[indent_spaces] == ' ') {
      ++indent_spaces;
    }
    const std::size_t depth = indent_spaces / 2;

    const std::string stripped = trim(line);
    const auto colon_pos = stripped.find(':');
    if (colon_pos == std::string::npos) {
      continue;
    }

    const std::string key = trim(stripped.substr(0, colon_pos));
    const std::string value = trim(stripped.substr(colon_pos + 1));

    if (sections.size() > depth) {
      sections.resize(depth);
    }

    if (value.empty()) {
      if (sections.size() == depth) {
        sections.push_back(key);
      } else {
        sections[depth] = key;
      }
      continue;
    }

    std::ostringstream full_key;
    for (const auto& section : sections) {
      if (!section.empty()) {
        full_key << section << '.';
      }
    }
    full_key << key;

    apply_key_value(config, full_key.str(), value);
  }

  if (const auto error = validate_loop_config(config.loop)) {
    throw std::runtime_error("invalid loop configuration: " + *error);
  }
  if ((config.source.kind == SourceKind::file || config.source.kind == SourceKind::serial) && config.source.path.empty()) {
    throw std::runtime_error("io.source_path is required for file and serial sources");
  }

  return config;
}

const char* to_string(const SourceKind kind) noexcept {
  switch (kind) {
    case SourceKind::simulated:
      return "simulated";
    case SourceKind::file:
      return "file";
    case SourceKind::serial:
      return "serial";
  }
  return "unknown";
}

const char* to_string(const ValveKind kind) noexcept {
  switch (kind) {
    case ValveKind::simulated:
      return "simulated";
    case ValveKind::dry_run:
      return "dry_run";
    case ValveKind::serial:
      return "serial";
  }
  return "unknown";
}

}  // namespace flow_control::core
