#pragma once

#include <memory>
#include <string>
#include <vector>

#include "core/config.hpp"
#include "model/flow_frame.hpp"

struct redisContext;

namespace flow_control::sinks {

// Appends every observation to RedisTimeSeries keys under <key_prefix>:.
// Keys are created on first connect; a lost connection is re-established on the next publish.
class RedisTsSink {
 public:
  explicit RedisTsSink(core::RedisConfig config);
  ~RedisTsSink();

  RedisTsSink(const RedisTsSink&) = delete;
  RedisTsSink& operator=(const RedisTsSink&) = delete;

  bool connect();
  bool publish(const model::flow_observation& observation);

  [[nodiscard]] const std::vector<std::string>& series_keys() const noexcept { return series_keys_; }

 private:
  struct ConnectionCloser {
    void operator()(redisContext* context) const;
  };

  bool reconnect();
  // False on transport failure or on an error reply that does not contain tolerated_error.
  bool run_command(const std::vector<std::string>& args, const char* tolerated_error = nullptr);
  bool create_series();
  std::vector<std::string> madd_command(const model::flow_observation& observation) const;

  core::RedisConfig config_;
  std::vector<std::string> series_keys_;
  std::unique_ptr<redisContext, ConnectionCloser> connection_;
  bool module_missing_{false};
};

}  // namespace flow_control::sinks
