#include <catch2/catch_test_macros.hpp>

#include <cayley_client/core/log.hpp>
#include <cayley_client/query/query_step.hpp>

#include <memory>
#include <string>
#include <vector>

using namespace cayley_client;

namespace {

struct LoggedLine {
    LogLevel level;
    std::string component;
    std::string message;
};

class CaptureSink : public ILogSink {
public:
    explicit CaptureSink(std::vector<LoggedLine>& out) : out_(out) {}

    void Write(LogLevel level, std::string_view component,
               std::string_view message) override {
        out_.push_back({level, std::string(component), std::string(message)});
    }

private:
    std::vector<LoggedLine>& out_;
};

} // anonymous namespace

TEST_CASE("QueryStep: no parameters yields the raw token", "[query][step]") {
    CHECK(QueryStep("All()").Serialize() == "All()");
    CHECK(QueryStep("Out(%s)").Serialize() == "Out(%s)");
}

TEST_CASE("QueryStep: placeholders are filled in order", "[query][step]") {
    CHECK(QueryStep("Out(%s, %s)", {"'follows'", "null"}).Serialize() ==
          "Out('follows', null)");
    CHECK(QueryStep("GetLimit(%d)", {"5"}).Serialize() == "GetLimit(5)");
}

TEST_CASE("QueryStep: %% is a literal percent sign", "[query][step]") {
    CHECK(QueryStep("Is('%s%%')", {"50"}).Serialize() == "Is('50%')");
}

TEST_CASE("QueryStep: parameters are inserted verbatim", "[query][step]") {
    CHECK(QueryStep("Is('%s')", {"a%sb"}).Serialize() == "Is('a%sb')");
}

TEST_CASE("QueryStep: surplus placeholders stay, surplus parameters drop", "[query][step]") {
    CHECK(QueryStep("Save('%s', '%s')", {"p"}).Serialize() == "Save('p', '%s')");
    CHECK(QueryStep("Back('%s')", {"t", "extra"}).Serialize() == "Back('t')");
}

TEST_CASE("QueryStep: accessors", "[query][step]") {
    QueryStep step("Has('%s', '%s')", {"p", "o"});
    CHECK(step.Token() == "Has('%s', '%s')");
    REQUIRE(step.Parameters().size() == 2);
    CHECK(step.Parameters()[1] == "o");
}

TEST_CASE("QueryStep: placeholder count mismatch is logged", "[query][step]") {
    std::vector<LoggedLine> lines;
    InitGlobalLogger(std::make_unique<CaptureSink>(lines), LogLevel::Debug);

    auto fewer = QueryStep("Save('%s', '%s')", {"p"}).Serialize();
    auto more = QueryStep("Back('%s')", {"t", "extra"}).Serialize();
    auto exact = QueryStep("Out(%s)", {"'x'"}).Serialize();

    InitGlobalLogger(std::make_unique<StreamSink>(), LogLevel::Error);

    CHECK(fewer == "Save('p', '%s')");
    CHECK(more == "Back('t')");
    CHECK(exact == "Out('x')");
    REQUIRE(lines.size() == 2);
    CHECK(lines[0].level == LogLevel::Debug);
    CHECK(lines[0].component == "query");
    CHECK(lines[0].message == "Step 'Save('%s', '%s')' has 2 placeholder(s) for 1 parameter(s)");
    CHECK(lines[1].message == "Step 'Back('%s')' has 1 placeholder(s) for 2 parameter(s)");
}
