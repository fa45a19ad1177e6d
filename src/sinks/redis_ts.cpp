#include "sinks/redis_ts.hpp"

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <iostream>
#include <utility>

#include <hiredis/hiredis.h>

#include "core/timestamp.hpp"

namespace flow_control::sinks {
namespace {

struct ReplyDeleter {
  void operator()(redisReply* reply) const {
    if (reply != nullptr) {
      freeReplyObject(reply);
    }
  }
};

using ReplyPtr = std::unique_ptr<redisReply, ReplyDeleter>;

// Order matches the values appended in madd_command().
constexpr const char* kSeries[] = {
    "flow:raw", "flow:estimate", "flow:valid", "flow:setpoint", "valve:output", "valve:command", "loop:state",
};
constexpr const char* kHealthSeries[] = {"loop:compute_time", "loop:missed_ticks", "loop:stale_ticks"};

double finite_or_zero(const double value) {
  return std::isfinite(value) ? value : 0.0;
}

bool error_contains(const redisReply& reply, const char* text) {
  return reply.str != nullptr && std::strstr(reply.str, text) != nullptr;
}

timeval to_timeval(const std::chrono::milliseconds timeout) {
  timeval tv{};
  tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
  tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
  return tv;
}

}  // namespace

void RedisTsSink::ConnectionCloser::operator()(redisContext* context) const {
  if (context != nullptr) {
    redisFree(context);
  }
}

RedisTsSink::RedisTsSink(core::RedisConfig config) : config_(std::move(config)) {
  for (const char* suffix : kSeries) {
    series_keys_.push_back(config_.key_prefix + ":" + suffix);
  }
  if (config_.publish_health) {
    for (const char* suffix : kHealthSeries) {
      series_keys_.push_back(config_.key_prefix + ":" + suffix);
    }
  }
}

RedisTsSink::~RedisTsSink() = default;

bool RedisTsSink::connect() {
  if (module_missing_) {
    return false;
  }
  if (connection_ != nullptr && connection_->err == REDIS_OK) {
    return true;
  }
  return reconnect();
}

bool RedisTsSink::reconnect() {
  connection_.reset();

  const timeval timeout = to_timeval(config_.connect_timeout);
  redisContext* raw = config_.unix_socket.empty()
                          ? redisConnectWithTimeout(config_.host.c_str(), static_cast<int>(config_.port), timeout)
                          : redisConnectUnixWithTimeout(config_.unix_socket.c_str(), timeout);
  if (raw == nullptr) {
    std::cerr << "[redis] unable to allocate connection\n";
    return false;
  }
  connection_.reset(raw);
  if (connection_->err != REDIS_OK) {
    std::cerr << "[redis] connect failed: " << connection_->errstr << '\n';
    connection_.reset();
    return false;
  }
  // Bounds every command; a half-open socket otherwise blocks forever.
  if (redisSetTimeout(connection_.get(), to_timeval(config_.command_timeout)) != REDIS_OK) {
    std::cerr << "[redis] unable to set command timeout\n";
    connection_.reset();
    return false;
  }

  const bool ready = (config_.password.empty() || run_command({"AUTH", config_.password})) &&
                     (config_.db == 0 || run_command({"SELECT", std::to_string(config_.db)})) && create_series();
  if (!ready) {
    connection_.reset();
  }
  return ready;
}

bool RedisTsSink::run_command(const std::vector<std::string>& args, const char* tolerated_error) {
  std::vector<const char*> argv;
  std::vector<std::size_t> lengths;
  argv.reserve(args.size());
  lengths.reserve(args.size());
  for (const auto& arg : args) {
    argv.push_back(arg.c_str());
    lengths.push_back(arg.size());
  }

  ReplyPtr reply(static_cast<redisReply*>(
      redisCommandArgv(connection_.get(), static_cast<int>(argv.size()), argv.data(), lengths.data())));
  if (reply == nullptr) {
    std::cerr << "[redis] " << args.front() << " failed: "
              << (connection_->errstr[0] != '\0' ? connection_->errstr : "no reply") << '\n';
    return false;
  }
  if (reply->type != REDIS_REPLY_ERROR) {
    return true;
  }
  if (error_contains(*reply, "unknown command")) {
    std::cerr << "[redis] " << args.front() << " unknown; is the RedisTimeSeries module loaded?\n";
    module_missing_ = true;
    return false;
  }
  if (tolerated_error != nullptr && error_contains(*reply, tolerated_error)) {
    return true;
  }
  std::cerr << "[redis] " << args.front() << " failed: " << (reply->str != nullptr ? reply->str : "error reply") << '\n';
  return false;
}

bool RedisTsSink::create_series() {
  for (const auto& key : series_keys_) {
    if (!run_command({"TS.CREATE", key, "DUPLICATE_POLICY", "LAST"}, "already exists")) {
      return false;
    }
  }
  return true;
}

std::vector<std::string> RedisTsSink::madd_command(const model::flow_observation& observation) const {
  std::vector<double> values = {
      finite_or_zero(observation.raw_rate),
      finite_or_zero(observation.estimated_flow),
      observation.valid ? 1.0 : 0.0,
      finite_or_zero(observation.setpoint),
      finite_or_zero(observation.controller_output),
      finite_or_zero(observation.commanded_position),
      static_cast<double>(static_cast<std::uint8_t>(observation.state)),
  };
  if (config_.publish_health) {
    values.push_back(finite_or_zero(observation.health.compute_time_ms));
    values.push_back(static_cast<double>(observation.health.missed_ticks));
    values.push_back(static_cast<double>(observation.health.stale_ticks));
  }

  const std::string timestamp_ms = std::to_string(core::unix_timestamp_now_ns() / 1'000'000ULL);
  std::vector<std::string> args;
  args.reserve(1 + (series_keys_.size() * 3));
  args.emplace_back("TS.MADD");
  for (std::size_t i = 0; i < series_keys_.size(); ++i) {
    args.push_back(series_keys_[i]);
    args.push_back(timestamp_ms);
    args.push_back(std::to_string(values[i]));
  }
  return args;
}

bool RedisTsSink::publish(const model::flow_observation& observation) {
  if (!connect()) {
    return false;
  }
  const std::vector<std::string> command = madd_command(observation);
  if (run_command(command)) {
    return true;
  }
  // One retry on a fresh connection; the next tick tries again otherwise.
  return reconnect() && run_command(command);
}

}  // namespace flow_control::sinks
