#include <catch2/catch_test_macros.hpp>

#include <cayley_client/core/log.hpp>

#include <nlohmann/json.hpp>

#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace cayley_client;

// ===========================================================================
// Helper: a sink that captures messages into a vector.
// ===========================================================================

struct CapturedMessage {
    LogLevel level;
    std::string component;
    std::string message;
};

class CaptureSink : public ILogSink {
public:
    explicit CaptureSink(std::vector<CapturedMessage>& out) : out_(out) {}

    void Write(LogLevel level, std::string_view component,
               std::string_view message) override {
        out_.push_back({level, std::string(component), std::string(message)});
    }

private:
    std::vector<CapturedMessage>& out_;
};

// ===========================================================================
// ParseLogLevel
// ===========================================================================

TEST_CASE("ParseLogLevel: accepts known names in any case", "[log]") {
    CHECK(ParseLogLevel("debug").Value() == LogLevel::Debug);
    CHECK(ParseLogLevel("INFO").Value() == LogLevel::Info);
    CHECK(ParseLogLevel("warn").Value() == LogLevel::Warn);
    CHECK(ParseLogLevel("Warning").Value() == LogLevel::Warn);
    CHECK(ParseLogLevel("error").Value() == LogLevel::Error);
}

TEST_CASE("ParseLogLevel: unknown name is a config error", "[log]") {
    auto r = ParseLogLevel("chatty");
    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::Config);
    CHECK(r.Error().message.find("chatty") != std::string::npos);
}

// ===========================================================================
// Sinks
// ===========================================================================

TEST_CASE("StreamSink: writes level, component and message", "[log]") {
    std::ostringstream oss;
    StreamSink sink(oss);
    sink.Write(LogLevel::Warn, "http", "slow response");

    auto line = oss.str();
    CHECK(line.find("[WARN]") != std::string::npos);
    CHECK(line.find("[http]") != std::string::npos);
    CHECK(line.find("slow response") != std::string::npos);
    CHECK(line.back() == '\n');
}

TEST_CASE("JsonSink: writes one JSON object per line", "[log]") {
    std::ostringstream oss;
    JsonSink sink(oss);
    sink.Write(LogLevel::Info, "client", "query: g.V().All()");

    auto j = nlohmann::json::parse(oss.str());
    CHECK(j["level"] == "INFO");
    CHECK(j["component"] == "client");
    CHECK(j["message"] == "query: g.V().All()");
    CHECK(j.contains("ts"));
}

TEST_CASE("JsonSink: invalid UTF-8 does not throw", "[log]") {
    std::ostringstream oss;
    JsonSink sink(oss);
    CHECK_NOTHROW(sink.Write(LogLevel::Error, "quad", std::string("bad \xff byte")));
    CHECK_FALSE(oss.str().empty());
}

TEST_CASE("FileSink: owns its stream and selects the format", "[log]") {
    auto stream = std::make_unique<std::ostringstream>();
    auto* raw = stream.get();
    FileSink sink(std::move(stream), /*json=*/true);
    sink.Write(LogLevel::Debug, "main", "hello");

    auto j = nlohmann::json::parse(raw->str());
    CHECK(j["level"] == "DEBUG");
    CHECK(j["message"] == "hello");
}

// ===========================================================================
// Logger
// ===========================================================================

TEST_CASE("Logger: filters below the minimum level", "[log]") {
    std::vector<CapturedMessage> captured;
    Logger logger(std::make_unique<CaptureSink>(captured), LogLevel::Warn);

    logger.Debug("t", "debug");
    logger.Info("t", "info");
    logger.Warn("t", "warn");
    logger.Error("t", "error");

    REQUIRE(captured.size() == 2);
    CHECK(captured[0].level == LogLevel::Warn);
    CHECK(captured[1].level == LogLevel::Error);
    CHECK(captured[1].message == "error");
}

TEST_CASE("Logger: SetLevel changes filtering", "[log]") {
    std::vector<CapturedMessage> captured;
    Logger logger(std::make_unique<CaptureSink>(captured), LogLevel::Error);

    CHECK_FALSE(logger.Enabled(LogLevel::Debug));
    logger.SetLevel(LogLevel::Debug);
    CHECK(logger.Enabled(LogLevel::Debug));

    logger.Debug("query", "visible now");
    REQUIRE(captured.size() == 1);
    CHECK(captured[0].component == "query");
}

TEST_CASE("Logger: concurrent writes are all delivered", "[log]") {
    std::vector<CapturedMessage> captured;
    Logger logger(std::make_unique<CaptureSink>(captured), LogLevel::Debug);

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&logger]() {
            for (int i = 0; i < 100; ++i) {
                logger.Info("worker", "tick");
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }
    CHECK(captured.size() == 400);
}

// ===========================================================================
// Global logger
// ===========================================================================

TEST_CASE("Global logger: routes free functions to the installed sink", "[log]") {
    std::vector<CapturedMessage> captured;
    InitGlobalLogger(std::make_unique<CaptureSink>(captured), LogLevel::Info);

    LogDebug("g", "dropped");
    LogInfo("g", "kept");
    LogError("g", "also kept");

    // Detach before `captured` goes out of scope.
    InitGlobalLogger(std::make_unique<StreamSink>(), LogLevel::Error);

    REQUIRE(captured.size() == 2);
    CHECK(captured[0].message == "kept");
    CHECK(captured[1].level == LogLevel::Error);
}
