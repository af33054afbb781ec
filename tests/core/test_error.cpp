#include <catch2/catch_test_macros.hpp>

#include "buildprobe/core/error.hpp"

TEST_CASE("Error creation and accessors", "[error]") {
    SECTION("basic error") {
        buildprobe::Error err(buildprobe::ErrorCode::NotFound, "source not found");
        CHECK(err.code() == buildprobe::ErrorCode::NotFound);
        CHECK(err.message() == "source not found");
        CHECK(err.detail() == "");
        CHECK(err.what() == "source not found");
    }

    SECTION("error with detail") {
        buildprobe::Error err(buildprobe::ErrorCode::SandboxError,
                              "copy failed", "permission denied");
        CHECK(err.code() == buildprobe::ErrorCode::SandboxError);
        CHECK(err.message() == "copy failed");
        CHECK(err.detail() == "permission denied");
        CHECK(err.what() == "copy failed: permission denied");
    }
}

TEST_CASE("make_error helpers", "[error]") {
    SECTION("two-argument form") {
        auto err = buildprobe::make_error(buildprobe::ErrorCode::Forbidden, "refusing to run as root");
        CHECK(err.code() == buildprobe::ErrorCode::Forbidden);
        CHECK(err.message() == "refusing to run as root");
        CHECK(err.detail() == "");
    }

    SECTION("three-argument form") {
        auto err = buildprobe::make_error(buildprobe::ErrorCode::Timeout,
                                          "unpacking timed out", "after 30s");
        CHECK(err.code() == buildprobe::ErrorCode::Timeout);
        CHECK(err.what() == "unpacking timed out: after 30s");
    }
}

TEST_CASE("Result type success case", "[error]") {
    buildprobe::Result<int> result = 42;

    REQUIRE(result.has_value());
    CHECK(*result == 42);
}

TEST_CASE("Result type error case", "[error]") {
    buildprobe::Result<int> result = std::unexpected(
        buildprobe::make_error(buildprobe::ErrorCode::InvalidArgument, "bad value"));

    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code() == buildprobe::ErrorCode::InvalidArgument);
    CHECK(result.error().message() == "bad value");
}

TEST_CASE("VoidResult success and error", "[error]") {
    SECTION("success") {
        buildprobe::VoidResult result{};
        REQUIRE(result.has_value());
    }

    SECTION("error") {
        buildprobe::VoidResult result = std::unexpected(
            buildprobe::make_error(buildprobe::ErrorCode::IoError, "disk full"));
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code() == buildprobe::ErrorCode::IoError);
    }
}

TEST_CASE("ErrorCode values and names", "[error]") {
    auto to_int = [](buildprobe::ErrorCode c) { return static_cast<int>(c); };

    CHECK(to_int(buildprobe::ErrorCode::Unknown) == 1);
    CHECK(to_int(buildprobe::ErrorCode::InvalidConfig) == 2);
    CHECK(to_int(buildprobe::ErrorCode::NotFound) == 4);
    CHECK(to_int(buildprobe::ErrorCode::InternalError) == 14);

    CHECK(buildprobe::error_code_to_string(buildprobe::ErrorCode::ArchiveError) == "ARCHIVE_ERROR");
    CHECK(buildprobe::error_code_to_string(buildprobe::ErrorCode::SandboxError) == "SANDBOX_ERROR");
    CHECK(buildprobe::error_code_to_string(buildprobe::ErrorCode::InvalidConfig) == "INVALID_CONFIG");
}
