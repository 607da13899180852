/**
 * @file test_shutdown.cpp
 * @brief Tests for shutdown.hpp
 */

#include "ngw/shutdown.hpp"

#include <catch2/catch_test_macros.hpp>

#include <csignal>
#include <thread>

TEST_CASE("ShutdownSignal Trigger releases Wait", "[shutdown]") {
  ngw::ShutdownSignal sig;
  REQUIRE(sig.IsValid());
  CHECK(!sig.IsRequested());

  std::thread t([&sig]() {
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    sig.Trigger(7);
  });
  CHECK(sig.Wait() == 7);
  t.join();
  CHECK(sig.IsRequested());
}

TEST_CASE("ShutdownSignal first trigger wins", "[shutdown]") {
  ngw::ShutdownSignal sig;
  sig.Trigger(1);
  sig.Trigger(2);
  CHECK(sig.Wait() == 1);
  // Wait after the request returns at once.
  CHECK(sig.Wait() == 1);
}

TEST_CASE("ShutdownSignal second instance is inert", "[shutdown]") {
  ngw::ShutdownSignal first;
  ngw::ShutdownSignal second;
  CHECK(first.IsValid());
  CHECK(!second.IsValid());
  auto r = second.Install();
  REQUIRE(!r.has_value());
  CHECK(r.get_error() == ngw::ShutdownError::kAlreadyInstantiated);
}

TEST_CASE("ShutdownSignal slot frees on destruction", "[shutdown]") {
  { ngw::ShutdownSignal a; }
  ngw::ShutdownSignal b;
  CHECK(b.IsValid());
}

TEST_CASE("ShutdownSignal SIGTERM is delivered through the handler", "[shutdown]") {
  ngw::ShutdownSignal sig;
  REQUIRE(sig.Install().has_value());
  REQUIRE(::raise(SIGTERM) == 0);
  CHECK(sig.Wait() == SIGTERM);
  CHECK(sig.IsRequested());
}
