#include "test_framework.hpp"

#include <atomic>
#include <set>

#include "mock_connection.hpp"

using namespace std::chrono_literals;

namespace {

const msgmux::Context kBackground = msgmux::Context::Background();

size_t TotalWritten(const std::vector<std::shared_ptr<mock::Peer>>& peers) {
  size_t n = 0;
  for (const auto& peer : peers) {
    n += peer->Written().size();
  }
  return n;
}

}  // namespace

TEST(LoadBalanceBlocksUntilFirstConnection) {
  msgmux::LoadBalancedWriter pool(kBackground);
  std::atomic<bool> returned{false};

  std::thread producer([&]() {
    pool.Write(kBackground, msgmux::NewMsgString("x"));
    returned.store(true);
  });

  std::this_thread::sleep_for(50ms);
  ASSERT_FALSE(returned.load());

  auto a = std::make_shared<mock::Peer>("a");
  pool.AddConn(mock::MakeWriter(a));
  producer.join();

  ASSERT_TRUE(mock::WaitUntil([&]() { return a->Written().size() == 1; }));
  pool.Close();
}

TEST(LoadBalanceDeliversExactlyOnce) {
  msgmux::LoadBalancedWriter pool(kBackground);
  auto a = std::make_shared<mock::Peer>("a");
  pool.AddConn(mock::MakeWriter(a));

  ASSERT_EQ(pool.Write(kBackground, msgmux::NewMsgString("m")),
            msgmux::Error::OK);

  ASSERT_TRUE(
      mock::WaitUntil([&]() { return pool.GetStats().delivered == 1; }));
  std::this_thread::sleep_for(30ms);

  ASSERT_EQ(a->WrittenStrings(), std::vector<std::string>{"m"});
  ASSERT_EQ(pool.Pending(), 0u);
  auto stats = pool.GetStats();
  ASSERT_EQ(stats.delivered, 1u);
  ASSERT_EQ(stats.failed_attempts, 0u);
  ASSERT_EQ(stats.dropped, 0u);
  pool.Close();
}

TEST(LoadBalanceEachMessageGoesToOneConnection) {
  msgmux::LoadBalancedWriter pool(kBackground);
  std::vector<std::shared_ptr<mock::Peer>> peers;
  for (int i = 0; i < 3; ++i) {
    peers.push_back(std::make_shared<mock::Peer>("p" + std::to_string(i)));
    pool.AddConn(mock::MakeWriter(peers.back()));
  }
  ASSERT_EQ(pool.NumConns(), 3u);

  for (int i = 0; i < 30; ++i) {
    ASSERT_EQ(pool.Write(kBackground, msgmux::NewMsgString(std::to_string(i))),
              msgmux::Error::OK);
  }

  ASSERT_TRUE(mock::WaitUntil([&]() { return TotalWritten(peers) == 30; }));
  std::this_thread::sleep_for(20ms);
  ASSERT_EQ(TotalWritten(peers), 30u);

  std::set<std::string> seen;
  for (const auto& peer : peers) {
    for (const auto& s : peer->WrittenStrings()) {
      seen.insert(s);
    }
  }
  ASSERT_EQ(seen.size(), 30u);
  pool.Close();
}

TEST(LoadBalanceRetriesOnAnotherConnection) {
  msgmux::LoadBalancedWriter pool(kBackground);
  auto bad = std::make_shared<mock::Peer>("bad");
  auto good = std::make_shared<mock::Peer>("good");
  bad->FailWrites(msgmux::Error::WriteError);
  pool.AddConn(mock::MakeWriter(bad));
  pool.AddConn(mock::MakeWriter(good));

  for (int i = 0; i < 5; ++i) {
    pool.Write(kBackground, msgmux::NewMsgString("m" + std::to_string(i)));
  }

  ASSERT_TRUE(mock::WaitUntil([&]() { return good->Written().size() == 5; }));
  auto got = good->WrittenStrings();
  std::set<std::string> seen(got.begin(), got.end());
  ASSERT_EQ(seen.size(), 5u);
  ASSERT_TRUE(bad->Written().empty());
  ASSERT_EQ(pool.GetStats().dropped, 0u);
  pool.Close();
}

TEST(LoadBalanceFailingOnlyConnectionNeverDrops) {
  msgmux::LoadBalancedWriter pool(kBackground);
  auto bad = std::make_shared<mock::Peer>("bad");
  bad->FailWrites(msgmux::Error::WriteError);
  pool.AddConn(mock::MakeWriter(bad));

  ASSERT_EQ(pool.Write(kBackground, msgmux::NewMsgString("m")),
            msgmux::Error::OK);

  // Retried over and over, never delivered, never dropped
  ASSERT_TRUE(mock::WaitUntil([&]() { return bad->WriteAttempts() >= 100; }));
  auto stats = pool.GetStats();
  ASSERT_EQ(stats.delivered, 0u);
  ASSERT_EQ(stats.dropped, 0u);
  ASSERT_GE(stats.failed_attempts, 100u);
  ASSERT_EQ(pool.NumConns(), 1u);

  // The message is still in circulation: a healthy connection gets it
  auto good = std::make_shared<mock::Peer>("good");
  pool.AddConn(mock::MakeWriter(good));
  ASSERT_TRUE(mock::WaitUntil([&]() { return good->Written().size() == 1; }));
  std::this_thread::sleep_for(20ms);

  ASSERT_EQ(good->WrittenStrings(), std::vector<std::string>{"m"});
  ASSERT_EQ(pool.GetStats().delivered, 1u);
  ASSERT_EQ(pool.GetStats().dropped, 0u);
  pool.Close();
}

TEST(LoadBalanceMaxRetriesDrops) {
  msgmux::PoolConfig config;
  config.max_retries = 3;
  msgmux::LoadBalancedWriter pool(kBackground, config);
  auto bad = std::make_shared<mock::Peer>("bad");
  bad->FailWrites(msgmux::Error::WriteError);
  pool.AddConn(mock::MakeWriter(bad));

  pool.Write(kBackground, msgmux::NewMsgString("m"));

  ASSERT_TRUE(mock::WaitUntil([&]() { return pool.GetStats().dropped == 1; }));
  std::this_thread::sleep_for(20ms);

  // One attempt plus three retries
  ASSERT_EQ(bad->WriteAttempts(), 4u);
  ASSERT_EQ(pool.GetStats().failed_attempts, 4u);
  ASSERT_EQ(pool.Pending(), 0u);

  // The connection stays registered
  ASSERT_EQ(pool.NumConns(), 1u);
  pool.Close();
}

TEST(LoadBalanceEvictsFailingConnection) {
  msgmux::PoolConfig config;
  config.evict_after_failures = 2;
  msgmux::LoadBalancedWriter pool(kBackground, config);
  auto bad = std::make_shared<mock::Peer>("bad");
  bad->FailWrites(msgmux::Error::WriteError);
  pool.AddConn(mock::MakeWriter(bad));

  pool.Write(kBackground, msgmux::NewMsgString("m"));

  ASSERT_TRUE(mock::WaitUntil([&]() { return pool.NumWorkers() == 0; }));
  ASSERT_EQ(pool.NumConns(), 0u);
  ASSERT_EQ(pool.GetStats().evicted, 1u);
  ASSERT_EQ(bad->WriteAttempts(), 2u);
  ASSERT_TRUE(bad->IsClosed());

  // The message waits for the next connection
  ASSERT_EQ(pool.Pending(), 1u);
  auto good = std::make_shared<mock::Peer>("good");
  pool.AddConn(mock::MakeWriter(good));
  ASSERT_TRUE(mock::WaitUntil([&]() { return good->Written().size() == 1; }));
  ASSERT_EQ(pool.GetStats().dropped, 0u);
  pool.Close();
}

TEST(LoadBalanceRmConnStopsWorker) {
  msgmux::LoadBalancedWriter pool(kBackground);
  auto a = std::make_shared<mock::Peer>("a");
  auto wa = mock::MakeWriter(a);
  pool.AddConn(wa);
  ASSERT_EQ(pool.NumConns(), 1u);

  pool.RmConn(wa);
  ASSERT_EQ(pool.NumConns(), 0u);
  ASSERT_TRUE(mock::WaitUntil([&]() { return pool.NumWorkers() == 0; }));
  ASSERT_TRUE(a->IsClosed());

  // Removing twice is harmless
  pool.RmConn(wa);

  // Messages queue up until another connection arrives
  pool.Write(kBackground, msgmux::NewMsgString("m"));
  ASSERT_EQ(pool.Pending(), 1u);

  auto b = std::make_shared<mock::Peer>("b");
  pool.AddConn(mock::MakeWriter(b));
  ASSERT_TRUE(mock::WaitUntil([&]() { return b->Written().size() == 1; }));
  ASSERT_TRUE(a->Written().empty());
  pool.Close();
}

TEST(LoadBalanceWriteObservesCancelWhenQueueFull) {
  msgmux::PoolConfig config;
  config.queue_size = 1;
  config.retry_backoff_ms = 10000;
  msgmux::LoadBalancedWriter pool(kBackground, config);
  auto bad = std::make_shared<mock::Peer>("bad");
  bad->FailWrites(msgmux::Error::WriteError);
  pool.AddConn(mock::MakeWriter(bad));

  // The worker fails once, requeues and backs off, leaving the queue full
  ASSERT_EQ(pool.Write(kBackground, msgmux::NewMsgString("m1")),
            msgmux::Error::OK);
  ASSERT_TRUE(mock::WaitUntil([&]() { return bad->WriteAttempts() == 1; }));
  ASSERT_TRUE(mock::WaitUntil([&]() { return pool.Pending() == 1; }));

  auto [ctx, cancel] = mock::Timeout(30ms);
  ASSERT_EQ(pool.Write(ctx, msgmux::NewMsgString("m2")),
            msgmux::Error::DeadlineExceeded);

  // Close interrupts the backoff
  auto start = std::chrono::steady_clock::now();
  pool.Close();
  ASSERT_TRUE(std::chrono::steady_clock::now() - start < 5s);
  ASSERT_EQ(pool.NumWorkers(), 0u);
  ASSERT_EQ(pool.GetStats().dropped, 1u);
}

TEST(LoadBalanceWriteWithoutConnectionsObservesCancel) {
  msgmux::LoadBalancedWriter pool(kBackground);
  auto [ctx, cancel] = mock::Timeout(30ms);
  ASSERT_EQ(pool.Write(ctx, msgmux::NewMsgString("x")),
            msgmux::Error::DeadlineExceeded);
}

TEST(LoadBalanceCloseIsIdempotentAndStopsWorkers) {
  msgmux::LoadBalancedWriter pool(kBackground);
  auto a = std::make_shared<mock::Peer>("a");
  auto b = std::make_shared<mock::Peer>("b");
  pool.AddConn(mock::MakeWriter(a));
  pool.AddConn(mock::MakeWriter(b));
  ASSERT_EQ(pool.NumWorkers(), 2u);

  ASSERT_EQ(pool.Close(), msgmux::Error::OK);
  ASSERT_EQ(pool.NumWorkers(), 0u);
  ASSERT_EQ(pool.NumConns(), 0u);
  ASSERT_EQ(a->CloseCount(), 1);
  ASSERT_EQ(b->CloseCount(), 1);

  ASSERT_EQ(pool.Close(), msgmux::Error::OK);
  ASSERT_EQ(pool.Write(kBackground, msgmux::NewMsgString("x")),
            msgmux::Error::PoolClosed);

  auto late = std::make_shared<mock::Peer>("late");
  ASSERT_EQ(pool.AddConn(mock::MakeWriter(late)), msgmux::Error::PoolClosed);
  ASSERT_TRUE(late->IsClosed());
}

TEST(LoadBalanceClosedReleasesWaiterWithoutConnections) {
  msgmux::LoadBalancedWriter pool(kBackground);
  msgmux::Error result = msgmux::Error::OK;

  std::thread producer([&]() {
    result = pool.Write(kBackground, msgmux::NewMsgString("x"));
  });
  std::this_thread::sleep_for(20ms);
  pool.Close();
  producer.join();

  ASSERT_EQ(result, msgmux::Error::PoolClosed);
}

TEST(LoadBalanceReleasesRemovedConnections) {
  msgmux::LoadBalancedWriter pool(kBackground);
  const int n = 100;
  std::vector<std::shared_ptr<mock::Peer>> peers;

  for (int i = 0; i < n; ++i) {
    auto peer = std::make_shared<mock::Peer>("churn" + std::to_string(i));
    peers.push_back(peer);
    auto w = mock::MakeWriter(peer);
    ASSERT_EQ(pool.AddConn(w), msgmux::Error::OK);
    pool.RmConn(w);
  }

  ASSERT_TRUE(mock::WaitUntil([&]() { return pool.NumWorkers() == 0; }));
  for (const auto& peer : peers) {
    ASSERT_TRUE(peer->Released());
    ASSERT_EQ(peer->CloseCount(), 1);
  }

  // Still usable after the churn
  auto good = std::make_shared<mock::Peer>("good");
  pool.AddConn(mock::MakeWriter(good));
  ASSERT_EQ(pool.Write(kBackground, msgmux::NewMsgString("after")),
            msgmux::Error::OK);
  ASSERT_TRUE(mock::WaitUntil([&]() { return good->Written().size() == 1; }));

  ASSERT_EQ(pool.Close(), msgmux::Error::OK);
  ASSERT_TRUE(good->Released());
}
