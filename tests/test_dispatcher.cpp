/**
 * @file test_dispatcher.cpp
 * @brief Tests for dispatcher.hpp: send, timeout, cancel and broadcast.
 */

#include "test_support.hpp"

#include "ngw/dispatcher.hpp"

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <thread>

using ngw_test::FakeNode;

namespace {

class CountingSink final : public ngw::AuditSink {
 public:
  bool Record(const ngw::AuditEvent& event) override {
    if (event.kind == ngw::AuditKind::kDispatched) dispatched_.fetch_add(1);
    return true;
  }
  int Dispatched() const { return dispatched_.load(); }

 private:
  std::atomic<int> dispatched_{0};
};

}  // namespace

// ============================================================================
// Send
// ============================================================================

TEST_CASE("dispatcher - unknown node fails immediately", "[dispatcher]") {
  ngw::ConnectionRegistry registry(ngw_test::FastSession(), 8);
  ngw::CommandDispatcher dispatcher(registry, 5000);

  const uint64_t start = ngw::SteadyNowMs();
  auto r = dispatcher.Send("nobody", "uptime", 5000);
  REQUIRE(!r.has_value());
  CHECK(r.get_error() == ngw::NodeError::kNodeNotConnected);
  CHECK(ngw::SteadyNowMs() - start < 100U);
  CHECK(dispatcher.InFlightCount() == 0U);
}

TEST_CASE("dispatcher - echo round trip", "[dispatcher]") {
  CountingSink sink;
  ngw::ConnectionRegistry registry(ngw_test::FastSession(), 8);
  ngw::CommandDispatcher dispatcher(registry, 2000, &sink);
  auto node = ngw_test::AttachNode(registry, ngw_test::FastSession(), "alpha");

  auto r = dispatcher.Send("alpha", "hostname");
  REQUIRE(r.has_value());
  REQUIRE(r.value().ok());
  CHECK(r.value().result == "echo:hostname");
  CHECK(dispatcher.InFlightCount() == 0U);
  CHECK(sink.Dispatched() == 1);
}

TEST_CASE("dispatcher - command ids are unique per dispatcher", "[dispatcher]") {
  ngw::ConnectionRegistry registry(ngw_test::FastSession(), 8);
  ngw::CommandDispatcher dispatcher(registry, 2000);
  auto node = ngw_test::AttachNode(registry, ngw_test::FastSession(), "alpha");

  auto a = dispatcher.SendAsync("alpha", "one");
  auto b = dispatcher.SendAsync("alpha", "two");
  REQUIRE(a.has_value());
  REQUIRE(b.has_value());
  CHECK(a.value().command_id != b.value().command_id);
  CHECK(dispatcher.Await(b.value()).result == "echo:two");
  CHECK(dispatcher.Await(a.value()).result == "echo:one");
}

TEST_CASE("dispatcher - zero timeout selects the default", "[dispatcher]") {
  ngw::ConnectionRegistry registry(ngw_test::FastSession(), 8);
  ngw::CommandDispatcher dispatcher(registry, 200);
  CHECK(dispatcher.DefaultTimeoutMs() == 200U);
  auto node =
      ngw_test::AttachNode(registry, ngw_test::FastSession(), "mute", FakeNode::Mode::kSilent);

  const uint64_t start = ngw::SteadyNowMs();
  auto r = dispatcher.Send("mute", "hang", 0);
  const uint64_t elapsed = ngw::SteadyNowMs() - start;
  REQUIRE(r.has_value());
  CHECK(r.value().status == ngw::ResponseStatus::kTimeout);
  CHECK(elapsed >= 190U);
  CHECK(elapsed < 200U + ngw::kCommandWaitSlackMs);
}

TEST_CASE("dispatcher - node failure is passed through", "[dispatcher]") {
  ngw::ConnectionRegistry registry(ngw_test::FastSession(), 8);
  ngw::CommandDispatcher dispatcher(registry, 2000);
  auto node =
      ngw_test::AttachNode(registry, ngw_test::FastSession(), "grumpy", FakeNode::Mode::kFail);

  auto r = dispatcher.Send("grumpy", "reboot");
  REQUIRE(r.has_value());
  CHECK(r.value().status == ngw::ResponseStatus::kFailure);
  CHECK(r.value().failure == ngw::NodeError::kCommandFailed);
  CHECK(r.value().message == "refused reboot");
}

TEST_CASE("dispatcher - disconnect mid-command is connection lost", "[dispatcher]") {
  ngw::ConnectionRegistry registry(ngw_test::FastSession(), 8);
  ngw::CommandDispatcher dispatcher(registry, 5000);
  auto node =
      ngw_test::AttachNode(registry, ngw_test::FastSession(), "flaky", FakeNode::Mode::kSilent);

  auto pc = dispatcher.SendAsync("flaky", "wait");
  REQUIRE(pc.has_value());
  REQUIRE(ngw_test::WaitFor([&node]() { return node->CommandsSeen() == 1; }, 1000));
  node->Disconnect();

  auto r = dispatcher.Await(pc.value());
  CHECK(r.status == ngw::ResponseStatus::kFailure);
  CHECK(r.failure == ngw::NodeError::kConnectionLost);

  REQUIRE(ngw_test::WaitFor([&registry]() { return !registry.IsConnected("flaky"); }, 1000));
  auto again = dispatcher.Send("flaky", "wait");
  REQUIRE(!again.has_value());
  CHECK(again.get_error() == ngw::NodeError::kNodeNotConnected);
}

// ============================================================================
// Cancel
// ============================================================================

TEST_CASE("dispatcher - cancel resolves once and drops the late reply", "[dispatcher]") {
  ngw::ConnectionRegistry registry(ngw_test::FastSession(), 8);
  ngw::CommandDispatcher dispatcher(registry, 5000);
  auto node = ngw_test::AttachNode(registry, ngw_test::FastSession(), "slow",
                                   FakeNode::Mode::kEcho, 200);

  auto pc = dispatcher.SendAsync("slow", "long-job");
  REQUIRE(pc.has_value());
  REQUIRE(ngw_test::WaitFor([&node]() { return node->CommandsSeen() == 1; }, 1000));
  CHECK(dispatcher.InFlightCount() == 1U);

  CHECK(dispatcher.Cancel(pc.value().command_id));
  CHECK(!dispatcher.Cancel(pc.value().command_id));

  auto r = dispatcher.Await(pc.value());
  CHECK(r.status == ngw::ResponseStatus::kFailure);
  CHECK(r.failure == ngw::NodeError::kCancelled);
  CHECK(dispatcher.InFlightCount() == 0U);

  // The node still answers; the session must drop it and stay up.
  std::this_thread::sleep_for(std::chrono::milliseconds(300));
  CHECK(registry.IsConnected("slow"));
  auto next = dispatcher.Send("slow", "after");
  REQUIRE(next.has_value());
  CHECK(next.value().result == "echo:after");
}

TEST_CASE("dispatcher - cancel of an unknown id is false", "[dispatcher]") {
  ngw::ConnectionRegistry registry(ngw_test::FastSession(), 8);
  ngw::CommandDispatcher dispatcher(registry, 1000);
  CHECK(!dispatcher.Cancel(424242));
}

TEST_CASE("dispatcher - cancel after completion is false", "[dispatcher]") {
  ngw::ConnectionRegistry registry(ngw_test::FastSession(), 8);
  ngw::CommandDispatcher dispatcher(registry, 2000);
  auto node = ngw_test::AttachNode(registry, ngw_test::FastSession(), "quick");

  auto pc = dispatcher.SendAsync("quick", "ls");
  REQUIRE(pc.has_value());
  REQUIRE(ngw_test::WaitFor([&pc]() { return pc.value().slot->IsResolved(); }, 1000));
  CHECK(!dispatcher.Cancel(pc.value().command_id));
  CHECK(dispatcher.Await(pc.value()).ok());
}

TEST_CASE("dispatcher - unawaited commands leave nothing behind", "[dispatcher]") {
  ngw::ConnectionRegistry registry(ngw_test::FastSession(), 8);
  ngw::CommandDispatcher dispatcher(registry, 2000);
  auto node =
      ngw_test::AttachNode(registry, ngw_test::FastSession(), "mute", FakeNode::Mode::kSilent);

  for (int i = 0; i < 4; ++i) {
    auto pc = dispatcher.SendAsync("mute", "fire-and-forget", 100);
    REQUIRE(pc.has_value());
  }
  auto cancelled = dispatcher.SendAsync("mute", "dropped", 5000);
  REQUIRE(cancelled.has_value());
  CHECK(dispatcher.InFlightCount() == 5U);
  CHECK(dispatcher.Cancel(cancelled.value().command_id));
  CHECK(dispatcher.InFlightCount() == 4U);

  REQUIRE(ngw_test::WaitFor([&dispatcher]() { return dispatcher.InFlightCount() == 0U; },
                            1000));
  CHECK(!dispatcher.Cancel(cancelled.value().command_id));
}

// ============================================================================
// Broadcast
// ============================================================================

TEST_CASE("dispatcher - broadcast with no nodes is empty", "[dispatcher]") {
  ngw::ConnectionRegistry registry(ngw_test::FastSession(), 8);
  ngw::CommandDispatcher dispatcher(registry, 1000);
  CHECK(dispatcher.Broadcast("ping").empty());
}

TEST_CASE("dispatcher - broadcast joins fast and silent nodes", "[dispatcher]") {
  CountingSink sink;
  ngw::ConnectionRegistry registry(ngw_test::FastSession(), 8);
  ngw::CommandDispatcher dispatcher(registry, 5000, &sink);
  auto a = ngw_test::AttachNode(registry, ngw_test::FastSession(), "a",
                                FakeNode::Mode::kEcho, 100);
  auto b = ngw_test::AttachNode(registry, ngw_test::FastSession(), "b",
                                FakeNode::Mode::kSilent);

  const uint64_t start = ngw::SteadyNowMs();
  auto results = dispatcher.Broadcast("status", 2000);
  const uint64_t elapsed = ngw::SteadyNowMs() - start;

  REQUIRE(results.size() == 2U);
  REQUIRE(results.count("a") == 1U);
  REQUIRE(results.count("b") == 1U);
  CHECK(results["a"].ok());
  CHECK(results["a"].result == "echo:status");
  CHECK(results["b"].status == ngw::ResponseStatus::kTimeout);
  // Both commands run concurrently: the total is one timeout, not two.
  CHECK(elapsed >= 1990U);
  CHECK(elapsed < 2000U + ngw::kCommandWaitSlackMs);
  CHECK(sink.Dispatched() == 2);
  CHECK(dispatcher.InFlightCount() == 0U);
}

TEST_CASE("dispatcher - broadcast skips disconnected nodes", "[dispatcher]") {
  ngw::ConnectionRegistry registry(ngw_test::FastSession(), 8);
  ngw::CommandDispatcher dispatcher(registry, 2000);
  auto up = ngw_test::AttachNode(registry, ngw_test::FastSession(), "up");
  auto down = ngw_test::AttachNode(registry, ngw_test::FastSession(), "down");
  down->Disconnect();
  REQUIRE(ngw_test::WaitFor([&registry]() { return !registry.IsConnected("down"); }, 1000));

  auto results = dispatcher.Broadcast("uname");
  REQUIRE(results.size() == 1U);
  CHECK(results.count("up") == 1U);
  CHECK(results["up"].result == "echo:uname");
}
