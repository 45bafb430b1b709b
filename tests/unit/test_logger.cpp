#include <catch2/catch.hpp>

#include "server/logging/logger.h"

// ---------------------------------------------------------------------------
// Structured JSON / plain-text application logger
// ---------------------------------------------------------------------------

TEST_CASE("Logger defaults to plain-text mode", "[logger]") {
  enginectl::log::SetJsonMode(false);
  REQUIRE_FALSE(enginectl::log::IsJsonMode());
}

TEST_CASE("Logger can be switched to JSON mode", "[logger]") {
  enginectl::log::SetJsonMode(true);
  REQUIRE(enginectl::log::IsJsonMode());
  enginectl::log::SetJsonMode(false);
}

TEST_CASE("Logger::Log does not throw in either mode", "[logger]") {
  enginectl::log::SetJsonMode(false);
  REQUIRE_NOTHROW(enginectl::log::Info("test", "hello from text mode"));
  REQUIRE_NOTHROW(
      enginectl::log::Warn("test", "warn in text mode", "detail=foo"));

  enginectl::log::SetJsonMode(true);
  REQUIRE_NOTHROW(enginectl::log::Info("test", "hello from json mode"));
  REQUIRE_NOTHROW(enginectl::log::Error("test", "error \"quoted\"", "a=b"));
  enginectl::log::SetJsonMode(false);
}

TEST_CASE("Logger parses level names", "[logger]") {
  using enginectl::log::Level;
  REQUIRE(enginectl::log::ParseLevel("debug") == Level::DEBUG);
  REQUIRE(enginectl::log::ParseLevel("WARN") == Level::WARN);
  REQUIRE(enginectl::log::ParseLevel("warning") == Level::WARN);
  REQUIRE(enginectl::log::ParseLevel("Error") == Level::ERROR);
  REQUIRE(enginectl::log::ParseLevel("verbose") == Level::INFO);
}

TEST_CASE("Logger minimum level round-trips", "[logger]") {
  auto previous = enginectl::log::MinLevel();
  enginectl::log::SetMinLevel(enginectl::log::Level::ERROR);
  REQUIRE(enginectl::log::MinLevel() == enginectl::log::Level::ERROR);
  // Below the threshold: dropped without side effects.
  REQUIRE_NOTHROW(enginectl::log::Debug("test", "dropped"));
  enginectl::log::SetMinLevel(previous);
}
