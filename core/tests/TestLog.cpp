/**
 * @file TestLog.cpp
 * @brief Unit tests for the logging façade and error helpers.
 */

#include <catch2/catch_test_macros.hpp>

#include "tpo/core/Error.hpp"
#include "tpo/core/Expected.hpp"
#include "tpo/core/Log.hpp"

#include <string>
#include <vector>

namespace tpo::core {

namespace {

class CaptureLogger final : public ILogger {
public:
    void write(LogLevel level, std::string_view tag, std::string_view message) override
    {
        entries.push_back({level, std::string(tag), std::string(message)});
    }

    struct Entry {
        LogLevel    level;
        std::string tag;
        std::string message;
    };
    std::vector<Entry> entries;
};

Expected<int> half(int v)
{
    if (v % 2 != 0)
        return makeError(ErrorCode::kInvalidArgument, "odd");
    return v / 2;
}

Expected<int> quarter(int v)
{
    const int h = TPO_TRY(half(v));
    return TPO_TRY(half(h));
}

} // namespace

TEST_CASE("Log filters below the minimum level", "[core][log]")
{
    CaptureLogger capture;
    Log::setLogger(&capture);
    Log::setMinLevel(LogLevel::kWarn);

    Log::info("Test", "dropped");
    Log::warn("Test", "kept");
    Log::error("kept too");

    REQUIRE(capture.entries.size() == 2);
    REQUIRE(capture.entries[0].tag == "Test");
    REQUIRE(capture.entries[0].message == "kept");
    REQUIRE(capture.entries[1].tag == "tpo");
    REQUIRE(capture.entries[1].level == LogLevel::kError);

    Log::setLogger(nullptr);
    Log::setMinLevel(LogLevel::kInfo);
}

TEST_CASE("TPO_TRY propagates the first error", "[core][error]")
{
    REQUIRE(quarter(8).value() == 2);

    auto r = quarter(6);
    REQUIRE_FALSE(r.has_value());
    REQUIRE(r.error().code() == ErrorCode::kInvalidArgument);
    REQUIRE(errorCodeName(r.error().code()) == "invalid_argument");
}

TEST_CASE("hasDiagnostic looks up codes", "[core][error]")
{
    const Diagnostics list{{ErrorCode::kDataGap, "gap"}};
    REQUIRE(hasDiagnostic(list, ErrorCode::kDataGap));
    REQUIRE_FALSE(hasDiagnostic(list, ErrorCode::kPoorFit));
}

} // namespace tpo::core
