#include "msgmux/pool.hpp"

#include "msgmux/broadcast_writer.hpp"
#include "msgmux/lb_writer.hpp"
#include "msgmux/queued_reader.hpp"

namespace msgmux {

std::unique_ptr<ReadPool> NewReadPool(const Context &ctx,
                                      const PoolConfig &config) {
  return std::make_unique<QueuedReader>(ctx, config);
}

std::unique_ptr<WritePool> NewWritePool(WriteStrategy strategy,
                                        const Context &ctx,
                                        const PoolConfig &config) {
  switch (strategy) {
  case WriteStrategy::Broadcast:
    return std::make_unique<BroadcastWriter>(ctx, config);
  case WriteStrategy::LoadBalance:
    return std::make_unique<LoadBalancedWriter>(ctx, config);
  default:
    return nullptr;
  }
}

} // namespace msgmux
