#include "srvfront/log.hpp"

#include <catch2/catch_test_macros.hpp>
#include <string>
#include <utility>
#include <vector>

using namespace srvfront;

namespace {

class CaptureSink : public LogSink {
 public:
  void write(LogLevel level, std::string_view msg) override { lines.emplace_back(level, std::string(msg)); }

  std::vector<std::pair<LogLevel, std::string>> lines;
};

int g_formatted = 0;

int counted(int value) {
  ++g_formatted;
  return value;
}

}  // namespace

TEST_CASE("Logger - default handle discards", "[log]") {
  Logger logger;
  REQUIRE(logger.min_level() == LogLevel::kInfo);
  SRVFRONT_LOG_ERROR(logger, "nobody hears this");
}

TEST_CASE("Logger - macros format and forward", "[log]") {
  CaptureSink sink;
  Logger logger(sink, LogLevel::kDebug);

  SRVFRONT_LOG_INFO(logger, ">>> starting server on " << "127.0.0.1" << ":" << 2121 << " <<<");
  SRVFRONT_LOG_WARN(logger, "child " << 3 << " exited with status " << 1);

  REQUIRE(sink.lines.size() == 2);
  REQUIRE(sink.lines[0].first == LogLevel::kInfo);
  REQUIRE(sink.lines[0].second == ">>> starting server on 127.0.0.1:2121 <<<");
  REQUIRE(sink.lines[1].first == LogLevel::kWarn);
  REQUIRE(sink.lines[1].second == "child 3 exited with status 1");
}

TEST_CASE("Logger - below min level is not formatted", "[log]") {
  CaptureSink sink;
  Logger logger(sink, LogLevel::kWarn);
  g_formatted = 0;

  SRVFRONT_LOG_DEBUG(logger, "value " << counted(1));
  SRVFRONT_LOG_INFO(logger, "value " << counted(2));
  REQUIRE(g_formatted == 0);
  REQUIRE(sink.lines.empty());

  SRVFRONT_LOG_ERROR(logger, "value " << counted(3));
  REQUIRE(g_formatted == 1);
  REQUIRE(sink.lines.size() == 1);
}

TEST_CASE("Logger - copies share the sink", "[log]") {
  CaptureSink sink;
  Logger original(sink);
  Logger copy = original;
  SRVFRONT_LOG_INFO(copy, "from copy");
  REQUIRE(sink.lines.size() == 1);
}

TEST_CASE("Logger - level prefixes", "[log]") {
  REQUIRE(std::string(level_prefix(LogLevel::kDebug)) == "[DEBUG]");
  REQUIRE(std::string(level_prefix(LogLevel::kInfo)) == "[INFO]");
  REQUIRE(std::string(level_prefix(LogLevel::kWarn)) == "[WARN]");
  REQUIRE(std::string(level_prefix(LogLevel::kError)) == "[ERROR]");
}
