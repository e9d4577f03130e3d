#include "tchat/log.hpp"

#include <catch2/catch_test_macros.hpp>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace tchat;

namespace {

// Captures std::cerr for the lifetime of the object
class CerrCapture {
 public:
  CerrCapture() : old_(std::cerr.rdbuf(buffer_.rdbuf())) {}
  ~CerrCapture() { std::cerr.rdbuf(old_); }

  std::string str() const { return buffer_.str(); }

 private:
  std::ostringstream buffer_;
  std::streambuf* old_;
};

// Restores the global threshold after each test
struct LevelGuard {
  Logger::Level saved = Logger::level();
  ~LevelGuard() { Logger::set_level(saved); }
};

size_t count_lines(const std::string& text) {
  size_t n = 0;
  for (char c : text) {
    if (c == '\n') {
      ++n;
    }
  }
  return n;
}

}  // namespace

TEST_CASE("Log - threshold filters lower levels", "[log]") {
  LevelGuard guard;
  Logger::set_level(Logger::Level::kWarn);

  CerrCapture capture;
  TCHAT_LOG_DEBUG("debug line");
  TCHAT_LOG_INFO("info line");
  TCHAT_LOG_WARN("warn line");
  TCHAT_LOG_ERROR("error line");

  const std::string out = capture.str();
  REQUIRE(out.find("debug line") == std::string::npos);
  REQUIRE(out.find("info line") == std::string::npos);
  REQUIRE(out.find("[WARN] warn line") != std::string::npos);
  REQUIRE(out.find("[ERROR] error line") != std::string::npos);
}

TEST_CASE("Log - off silences everything", "[log]") {
  LevelGuard guard;
  Logger::set_level(Logger::Level::kOff);

  CerrCapture capture;
  TCHAT_LOG_ERROR("nothing");
  REQUIRE(capture.str().empty());
}

TEST_CASE("Log - line format", "[log]") {
  LevelGuard guard;
  Logger::set_level(Logger::Level::kDebug);

  CerrCapture capture;
  TCHAT_LOG_DEBUG("hello");
  const std::string out = capture.str();

  // "[HH:MM:SS] [DEBUG] hello\n"
  REQUIRE(out.size() == 25);
  REQUIRE(out[0] == '[');
  REQUIRE(out[3] == ':');
  REQUIRE(out[6] == ':');
  REQUIRE(out.substr(9) == "] [DEBUG] hello\n");
}

TEST_CASE("Log - concurrent lines stay whole", "[log]") {
  LevelGuard guard;
  Logger::set_level(Logger::Level::kInfo);

  CerrCapture capture;
  constexpr int kThreads = 4;
  constexpr int kLines = 100;
  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([t]() {
      for (int i = 0; i < kLines; ++i) {
        TCHAT_LOG_INFO("thread " + std::to_string(t) + " line " + std::to_string(i));
      }
    });
  }
  for (auto& th : threads) {
    th.join();
  }

  const std::string out = capture.str();
  REQUIRE(count_lines(out) == static_cast<size_t>(kThreads * kLines));

  std::istringstream lines(out);
  std::string line;
  while (std::getline(lines, line)) {
    REQUIRE(line.find("[INFO] thread ") == 11);
  }
}
