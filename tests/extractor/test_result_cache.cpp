#include <catch2/catch_test_macros.hpp>

#include "buildprobe/extractor/result_cache.hpp"

#include <filesystem>
#include <fstream>
#include <string>

using namespace buildprobe;
using namespace buildprobe::extractor;
namespace fs = std::filesystem;

namespace {

struct TempDir {
    fs::path path;
    TempDir() {
        std::string templ = (fs::temp_directory_path() / "bp-cache-XXXXXX").string();
        path = ::mkdtemp(templ.data());
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }
};

void write_file(const fs::path& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary);
    out << content;
}

auto extracted(const std::string& artifact) -> ExtractionResult {
    ExtractionResult result;
    result.outcome = Outcome::Extracted;
    result.interpreter = "python3";
    result.artifact = artifact;
    return result;
}

auto tree_request(const fs::path& source) -> ExtractionRequest {
    ExtractionRequest request;
    request.source = source;
    return request;
}

} // namespace

// ---------------------------------------------------------------------------
// compute_key
// ---------------------------------------------------------------------------

TEST_CASE("Cache keys depend on tree contents", "[extractor][result_cache]") {
    TempDir dir;
    write_file(dir.path / "setup.py", "setup(name='a')\n");
    fs::create_directory(dir.path / "pkg");

    auto first = ResultCache::compute_key(tree_request(dir.path));
    REQUIRE(first.has_value());
    CHECK(first->size() == 64);

    auto again = ResultCache::compute_key(tree_request(dir.path));
    REQUIRE(again.has_value());
    CHECK(*again == *first);

    SECTION("file contents") {
        write_file(dir.path / "setup.py", "setup(name='b')\n");
        CHECK(*ResultCache::compute_key(tree_request(dir.path)) != *first);
    }

    SECTION("new files") {
        write_file(dir.path / "pkg" / "__init__.py", "");
        CHECK(*ResultCache::compute_key(tree_request(dir.path)) != *first);
    }

    SECTION("symlink targets") {
        fs::create_symlink("a", dir.path / "link");
        auto with_a = *ResultCache::compute_key(tree_request(dir.path));
        fs::remove(dir.path / "link");
        fs::create_symlink("b", dir.path / "link");
        CHECK(*ResultCache::compute_key(tree_request(dir.path)) != with_a);
    }
}

TEST_CASE("Cache keys depend on request parameters", "[extractor][result_cache]") {
    TempDir dir;
    write_file(dir.path / "setup.py", "setup()\n");
    auto base = tree_request(dir.path);
    auto key = *ResultCache::compute_key(base);

    auto other_script = base;
    other_script.build_script = "build.py";
    CHECK(*ResultCache::compute_key(other_script) != key);

    auto other_order = base;
    other_order.interpreters = {"python", "python3"};
    CHECK(*ResultCache::compute_key(other_order) != key);

    // Timeouts do not change what a successful run produces
    auto other_timeout = base;
    other_timeout.timeout = std::chrono::seconds(5);
    CHECK(*ResultCache::compute_key(other_timeout) == key);
}

TEST_CASE("Cache keys for archives hash the file", "[extractor][result_cache]") {
    TempDir dir;
    write_file(dir.path / "pkg.tar.gz", "bytes-1");
    auto key = ResultCache::compute_key(tree_request(dir.path / "pkg.tar.gz"));
    REQUIRE(key.has_value());

    write_file(dir.path / "pkg.tar.gz", "bytes-2");
    CHECK(*ResultCache::compute_key(tree_request(dir.path / "pkg.tar.gz")) != *key);
}

TEST_CASE("Cache keys for missing sources fail", "[extractor][result_cache]") {
    TempDir dir;
    auto key = ResultCache::compute_key(tree_request(dir.path / "missing"));
    REQUIRE_FALSE(key.has_value());
    CHECK(key.error().code() == ErrorCode::NotFound);
}

// ---------------------------------------------------------------------------
// store / lookup
// ---------------------------------------------------------------------------

TEST_CASE("Stored extractions can be looked up", "[extractor][result_cache]") {
    ResultCache cache(":memory:");

    auto empty = cache.lookup("k1");
    REQUIRE(empty.has_value());
    CHECK_FALSE(empty->has_value());

    REQUIRE(cache.store("k1", extracted("{\"name\": \"pkg\"}")).has_value());
    auto hit = cache.lookup("k1");
    REQUIRE(hit.has_value());
    REQUIRE(hit->has_value());
    CHECK((*hit)->interpreter == "python3");
    CHECK((*hit)->artifact == "{\"name\": \"pkg\"}");
    CHECK((*hit)->created_at > 0);
    CHECK(*cache.size() == 1);

    REQUIRE(cache.store("k1", extracted("{}")).has_value());
    CHECK((*cache.lookup("k1"))->artifact == "{}");
    CHECK(*cache.size() == 1);

    auto removed = cache.remove("k1");
    REQUIRE(removed.has_value());
    CHECK(*removed);
    CHECK_FALSE(cache.lookup("k1")->has_value());
    CHECK(*cache.size() == 0);

    auto again = cache.remove("k1");
    REQUIRE(again.has_value());
    CHECK_FALSE(*again);
}

TEST_CASE("Artifacts with embedded NUL bytes survive the cache", "[extractor][result_cache]") {
    ResultCache cache(":memory:");
    std::string artifact("{\"a\":\0\"b\"}", 10);
    REQUIRE(cache.store("k", extracted(artifact)).has_value());
    CHECK((*cache.lookup("k"))->artifact == artifact);
}

TEST_CASE("Only extracted results are cached", "[extractor][result_cache]") {
    ResultCache cache(":memory:");
    ExtractionResult result;
    result.outcome = Outcome::Exhausted;
    auto r = cache.store("k", result);
    REQUIRE_FALSE(r.has_value());
    CHECK(r.error().code() == ErrorCode::InvalidArgument);
    CHECK(*cache.size() == 0);
}

TEST_CASE("The cache persists across openings", "[extractor][result_cache]") {
    TempDir dir;
    auto db = (dir.path / "results.db").string();
    {
        ResultCache cache(db);
        REQUIRE(cache.store("k", extracted("{}")).has_value());
    }
    ResultCache reopened(db);
    CHECK(reopened.lookup("k")->has_value());
}
