#include "catch2/catch_test_macros.hpp"

#include "hotset/system/logger.hpp"

#include <sstream>
#include <stdexcept>
#include <string>

namespace hotset {

namespace {

// Points the logger at a buffer for one test and restores it afterwards.
struct CapturedLog {
  CapturedLog() {
    previous_level = Logger::getInstance().logLevel();
    Logger::getInstance().setOutput(buffer);
  }
  ~CapturedLog() {
    Logger::getInstance().resetOutput();
    Logger::getInstance().setLogLevel(previous_level);
  }

  std::ostringstream buffer;
  LogLevel previous_level;
};

}

TEST_CASE("ParseLogLevel", "[logger]") {
  REQUIRE(ParseLogLevel("debug") == LogLevel::DEBUG);
  REQUIRE(ParseLogLevel("INFO") == LogLevel::INFO);
  REQUIRE(ParseLogLevel("warn") == LogLevel::WARN);
  REQUIRE(ParseLogLevel("error") == LogLevel::ERROR);
  REQUIRE_THROWS_AS(ParseLogLevel("verbose"), std::invalid_argument);
}

TEST_CASE("Logger writes header and message", "[logger]") {
  CapturedLog log;
  Logger::getInstance().setLogLevel(LogLevel::INFO);

  LOG_INFO("evicted ", 3, " entries");
  auto line = log.buffer.str();
  REQUIRE(line.find("[INFO ]") != std::string::npos);
  REQUIRE(line.find("[logger_test.cpp:") != std::string::npos);
  REQUIRE(line.find("evicted 3 entries") != std::string::npos);
}

TEST_CASE("Logger formats with fmt", "[logger]") {
  CapturedLog log;
  Logger::getInstance().setLogLevel(LogLevel::DEBUG);

  LOG_DEBUGF("{}:{}", "adam", 29);
  REQUIRE(log.buffer.str().find("[DEBUG] ") != std::string::npos);
  REQUIRE(log.buffer.str().find("adam:29") != std::string::npos);
}

TEST_CASE("Logger drops lines below the level", "[logger]") {
  CapturedLog log;
  Logger::getInstance().setLogLevel(LogLevel::WARN);

  LOG_DEBUG("hidden");
  LOG_INFOF("hidden {}", 1);
  REQUIRE(log.buffer.str().empty());

  LOG_WARN("shown");
  LOG_ERRORF("also {}", "shown");
  auto out = log.buffer.str();
  REQUIRE(out.find("[WARN ]") != std::string::npos);
  REQUIRE(out.find("[ERROR]") != std::string::npos);
  REQUIRE(out.find("hidden") == std::string::npos);
}

} // namespace hotset
