/**
 * @file TestError.cpp
 * @brief Unit tests for core::Error, Expected and the ERP_TRY macros.
 */

#include <catch2/catch.hpp>

#include "erp/core/Expected.hpp"
#include "erp/core/Log.hpp"

#include <string>
#include <vector>

namespace erp::core {

namespace {

Expected<int> parsePositive(int value)
{
    if (value <= 0)
        return makeError(ErrorCode::kInvalidArgument, "value must be positive");
    return value;
}

Expected<int> doubled(int value)
{
    const int parsed = ERP_TRY(parsePositive(value));
    return parsed * 2;
}

ExpectedVoid requireNonZero(int value)
{
    if (value == 0)
        return makeError(ErrorCode::kInvalidArgument, "value must be non-zero");
    return {};
}

ExpectedVoid checkBoth(int a, int b)
{
    ERP_TRY_VOID(requireNonZero(a));
    ERP_TRY_VOID(requireNonZero(b));
    return {};
}

class CapturingLogger final : public ILogger {
public:
    void write(LogLevel level, std::string_view tag, std::string_view message) override
    {
        entries.push_back({level, std::string(tag), std::string(message)});
    }

    struct Entry {
        LogLevel level;
        std::string tag;
        std::string message;
    };

    std::vector<Entry> entries;
};

} // namespace

TEST_CASE("Error carries code, message and location", "[core][error]")
{
    const Error err{ErrorCode::kEpochTimeout, "window never covered"};

    REQUIRE(err.code() == ErrorCode::kEpochTimeout);
    REQUIRE(err.message() == "window never covered");
    REQUIRE(err.location().line() > 0);

    const std::string text = err.format();
    REQUIRE(text.starts_with("[EpochTimeout] window never covered ("));
    REQUIRE(text.find("TestError.cpp") != std::string::npos);
}

TEST_CASE("errorCodeName covers the pipeline taxonomy", "[core][error]")
{
    REQUIRE(errorCodeName(ErrorCode::kStaleSample) == "StaleSample");
    REQUIRE(errorCodeName(ErrorCode::kRangeUnavailable) == "RangeUnavailable");
    REQUIRE(errorCodeName(ErrorCode::kJitterExceeded) == "JitterExceeded");
    REQUIRE(errorCodeName(ErrorCode::kUncalibrated) == "Uncalibrated");
}

TEST_CASE("ERP_TRY propagates the first error", "[core][expected]")
{
    SECTION("success path yields the value")
    {
        auto result = doubled(21);
        REQUIRE(result.has_value());
        REQUIRE(*result == 42);
    }

    SECTION("error path returns early")
    {
        auto result = doubled(-1);
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().code() == ErrorCode::kInvalidArgument);
    }

    SECTION("void variant")
    {
        REQUIRE(checkBoth(1, 2).has_value());
        REQUIRE_FALSE(checkBoth(1, 0).has_value());
    }
}

TEST_CASE("failedWith matches only the reported code", "[core][expected]")
{
    REQUIRE_FALSE(failedWith(parsePositive(3), ErrorCode::kInvalidArgument));
    REQUIRE(failedWith(parsePositive(0), ErrorCode::kInvalidArgument));
    REQUIRE_FALSE(failedWith(parsePositive(0), ErrorCode::kRangeUnavailable));
    REQUIRE(failedWith(requireNonZero(0), ErrorCode::kInvalidArgument));
    REQUIRE_FALSE(failedWith(requireNonZero(1), ErrorCode::kInvalidArgument));
}

TEST_CASE("Only missing data and missing calibration are pending", "[core][expected]")
{
    REQUIRE(isPending(ErrorCode::kRangeUnavailable));
    REQUIRE(isPending(ErrorCode::kUncalibrated));
    REQUIRE_FALSE(isPending(ErrorCode::kRangeEvicted));
    REQUIRE_FALSE(isPending(ErrorCode::kEpochTimeout));
    REQUIRE_FALSE(isPending(ErrorCode::kStaleSample));
}

TEST_CASE("Log routes through the installed logger and honours the level", "[core][log]")
{
    CapturingLogger logger;
    Log::setLogger(&logger);
    Log::setMinLevel(LogLevel::kWarn);

    Log::info("Test", "dropped");
    Log::warn("Test", "kept");
    Log::error("escalated");

    Log::setLogger(nullptr);
    Log::setMinLevel(LogLevel::kInfo);

    REQUIRE(logger.entries.size() == 2);
    REQUIRE(logger.entries[0].level == LogLevel::kWarn);
    REQUIRE(logger.entries[0].tag == "Test");
    REQUIRE(logger.entries[0].message == "kept");
    REQUIRE(logger.entries[1].tag == "erp");
}

} // namespace erp::core
