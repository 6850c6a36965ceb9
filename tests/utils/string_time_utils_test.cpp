#include <catch2/catch.hpp>

#include "utils/StringUtils.hpp"
#include "utils/TimeUtils.hpp"

using namespace GcTriage::Utils;

TEST_CASE("formatFixed renders fixed decimals without negative zero", "[utils][string]")
{
    CHECK(formatFixed(7.4803, 2) == "7.48");
    CHECK(formatFixed(1000.0, 0) == "1000");
    CHECK(formatFixed(-0.01, 1) == "0.0");
    CHECK(formatFixed(-1.26, 1) == "-1.3");
}

TEST_CASE("trim and prefix helpers", "[utils][string]")
{
    CHECK(trim("  key = value \r\n") == "key = value");
    CHECK(trim("") == "");
    CHECK(startsWith("GC(12) Pause Young", "GC("));
    CHECK_FALSE(startsWith("GC", "GC("));
    CHECK(endsWith("8.657ms", "ms"));
    CHECK(toLower("Markdown") == "markdown");
}

TEST_CASE("Numeric parsing rejects trailing garbage", "[utils][string]")
{
    CHECK(parseInteger<int>(" 42 ") == 42);
    CHECK_FALSE(parseInteger<int>("42M").has_value());
    CHECK(parseFloat<double>("8.657") == Approx(8.657));
    CHECK_FALSE(parseFloat<double>("").has_value());
    CHECK_FALSE(parseFloat<double>("1.5x").has_value());
}

TEST_CASE("join and escapeJson", "[utils][string]")
{
    CHECK(join({}, ", ").empty());
    CHECK(join({"Allocation Pressure", "Retention / Leak Pattern"}, ", ") ==
          "Allocation Pressure, Retention / Leak Pattern");

    CHECK(escapeJson("say \"hi\"\n") == "say \\\"hi\\\"\\n");
    CHECK(escapeJson("C:\\gc.log") == "C:\\\\gc.log");
    CHECK(escapeJson(std::string("\x01", 1)) == "\\u0001");
}

TEST_CASE("Uptime decorations in seconds, millis and nanos", "[utils][time]")
{
    CHECK(parseUptimeDecoration("22.113s") == Approx(22.113));
    CHECK(parseUptimeDecoration("22113ms") == Approx(22.113));
    CHECK(parseUptimeDecoration("22113000000ns") == Approx(22.113));

    CHECK_FALSE(parseUptimeDecoration("info").has_value());
    CHECK_FALSE(parseUptimeDecoration("gc,start").has_value());
    CHECK_FALSE(parseUptimeDecoration("2026-02-05T05:43:52.074+0200").has_value());
    CHECK_FALSE(parseUptimeDecoration("s").has_value());
    CHECK_FALSE(parseUptimeDecoration("1.2.3s").has_value());
}

TEST_CASE("Uptime and duration rendering", "[utils][time]")
{
    CHECK(formatUptime(12.3456) == "12.346s");
    CHECK(formatMinutes(1684.41) == "28.1 min");
    CHECK(formatMinutes(0.0) == "0.0 min");
    CHECK(toMinutes(90.0) == Approx(1.5));
}
