#ifndef MSGMUX_TYPES_HPP
#define MSGMUX_TYPES_HPP

#include <cstddef>
#include <cstdint>
#include <vector>

namespace msgmux {

// Capacity of the shared message queues of the read and load-balance pools
constexpr size_t kDefaultQueueSize = 10;

// A single frame of a message
using Bytes = std::vector<uint8_t>;

// Process-unique identifier of an adapter
using AdapterID = uint64_t;

// Message kinds
enum class MsgType : uint8_t {
  User = 0,     // Application payload
  Command = 1,  // Protocol command
};

// Write-side distribution strategies
enum class WriteStrategy {
  Broadcast,    // Every message to every connection (fan-out)
  LoadBalance,  // Each message to one connection, retried on failure
};

inline const char* MsgTypeString(MsgType type) {
  switch (type) {
  case MsgType::User:
    return "User";
  case MsgType::Command:
    return "Command";
  default:
    return "Unknown";
  }
}

inline const char* WriteStrategyString(WriteStrategy strategy) {
  switch (strategy) {
  case WriteStrategy::Broadcast:
    return "Broadcast";
  case WriteStrategy::LoadBalance:
    return "LoadBalance";
  default:
    return "Unknown";
  }
}

// Pool configuration
struct PoolConfig {
  size_t queue_size = kDefaultQueueSize;

  // Load-balance retry policy. Zero disables the corresponding limit, so
  // the defaults retry a failed message forever and never evict.
  uint32_t max_retries = 0;
  uint32_t evict_after_failures = 0;
  uint32_t retry_backoff_ms = 0;
};

} // namespace msgmux

#endif // MSGMUX_TYPES_HPP
