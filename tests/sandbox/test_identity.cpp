#include <catch2/catch_test_macros.hpp>

#include "buildprobe/sandbox/identity.hpp"

#include <unistd.h>

using namespace buildprobe;
using namespace buildprobe::sandbox;

TEST_CASE("Unprivileged callers keep their own identity", "[sandbox][identity]") {
    if (::geteuid() == 0) SKIP("running as root");

    auto identity = resolve_identity("nobody");
    REQUIRE(identity.has_value());
    CHECK(identity->uid == ::geteuid());
    CHECK(identity->gid == ::getegid());
    CHECK_FALSE(identity->switch_user);
    CHECK_FALSE(identity->name.empty());

    // The configured user does not matter when not root
    auto any = resolve_identity("no-such-user-buildprobe");
    REQUIRE(any.has_value());
    CHECK(any->uid == ::geteuid());
}

TEST_CASE("Root must name an existing unprivileged user", "[sandbox][identity]") {
    if (::geteuid() != 0) SKIP("requires root");

    SECTION("empty user is refused") {
        auto r = resolve_identity("");
        REQUIRE_FALSE(r.has_value());
        CHECK(r.error().code() == ErrorCode::Forbidden);
    }

    SECTION("unknown user") {
        auto r = resolve_identity("no-such-user-buildprobe");
        REQUIRE_FALSE(r.has_value());
        CHECK(r.error().code() == ErrorCode::NotFound);
    }

    SECTION("root itself is refused") {
        auto r = resolve_identity("root");
        REQUIRE_FALSE(r.has_value());
        CHECK(r.error().code() == ErrorCode::Forbidden);
    }

    SECTION("nobody switches users") {
        auto r = resolve_identity("nobody");
        if (!r) SKIP("no usable 'nobody' account");
        CHECK(r->uid != 0);
        CHECK(r->switch_user);
        CHECK(r->name == "nobody");
    }
}

TEST_CASE("limits_from_config converts megabytes", "[sandbox][identity]") {
    ResourceLimitsConfig config;
    config.address_space_mb = 512;
    config.cpu_seconds = 10;
    config.file_size_mb = 0;
    config.open_files = 64;

    auto limits = limits_from_config(config);
    CHECK(limits.address_space_bytes == 512ull * 1024 * 1024);
    CHECK(limits.cpu_seconds == 10);
    CHECK(limits.file_size_bytes == 0);
    CHECK(limits.open_files == 64);
}
