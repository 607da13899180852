/**
 * @file test_log.cpp
 * @brief Tests for log.hpp
 */

#include "ngw/log.hpp"

#include <catch2/catch_test_macros.hpp>

#include <thread>
#include <vector>

// ============================================================================
// Level control
// ============================================================================

TEST_CASE("log - SetLevel and GetLevel round trip", "[log]") {
  const ngw::log::Level saved = ngw::log::GetLevel();

  ngw::log::SetLevel(ngw::log::Level::kWarn);
  CHECK(ngw::log::GetLevel() == ngw::log::Level::kWarn);

  ngw::log::SetLevel(ngw::log::Level::kOff);
  CHECK(ngw::log::GetLevel() == ngw::log::Level::kOff);

  ngw::log::SetLevel(saved);
}

TEST_CASE("log - Init and Shutdown toggle the initialized flag", "[log]") {
  ngw::log::Init();
  CHECK(ngw::log::IsInitialized());
  ngw::log::Shutdown();
  CHECK(!ngw::log::IsInitialized());
}

// ============================================================================
// Writers
// ============================================================================

TEST_CASE("log - macros accept format arguments and none", "[log]") {
  const ngw::log::Level saved = ngw::log::GetLevel();
  ngw::log::SetLevel(ngw::log::Level::kDebug);

  NGW_LOG_DEBUG("Test", "plain message");
  NGW_LOG_INFO("Test", "node %s has %d pending", "abc", 3);
  NGW_LOG_WARN("Test", "code %s", "482***");
  NGW_LOG_ERROR("Test", "value %llu", 18446744073709551615ULL);

  ngw::log::SetLevel(saved);
  SUCCEED();
}

TEST_CASE("log - messages below the level are dropped", "[log]") {
  const ngw::log::Level saved = ngw::log::GetLevel();
  ngw::log::SetLevel(ngw::log::Level::kOff);
  NGW_LOG_ERROR("Test", "this line must not appear");
  ngw::log::SetLevel(saved);
  SUCCEED();
}

TEST_CASE("log - concurrent writers do not interleave lines", "[log]") {
  const ngw::log::Level saved = ngw::log::GetLevel();
  ngw::log::SetLevel(ngw::log::Level::kInfo);

  std::vector<std::thread> writers;
  for (int t = 0; t < 4; ++t) {
    writers.emplace_back([t]() {
      for (int i = 0; i < 25; ++i) {
        NGW_LOG_INFO("Concurrent", "writer %d line %d", t, i);
      }
    });
  }
  for (auto& w : writers) w.join();

  ngw::log::SetLevel(saved);
  SUCCEED();
}
