#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include <SQLiteCpp/SQLiteCpp.h>

#include "buildprobe/core/error.hpp"
#include "buildprobe/extractor/request.hpp"

namespace buildprobe::extractor {

struct CachedExtraction {
    std::string interpreter;
    std::string artifact;
    int64_t created_at = 0;  // unix ms
};

/// Artifacts of earlier successful extractions, keyed by a digest of the
/// source contents and the request parameters that affect the artifact.
/// Safe to share between threads.
class ResultCache {
public:
    /// Opens (creating if needed) the cache database at `db_path`.
    /// Throws SQLite::Exception if the database cannot be opened.
    explicit ResultCache(const std::string& db_path);

    /// Digest over the source (tree entries or archive bytes), the build
    /// script name, the interpreter candidates and the instrumentation
    /// version.
    static auto compute_key(const ExtractionRequest& request) -> Result<std::string>;

    auto lookup(const std::string& key) -> Result<std::optional<CachedExtraction>>;

    /// Stores an Extracted result; other outcomes are rejected.
    auto store(const std::string& key, const ExtractionResult& result) -> Result<void>;

    /// True if an entry was deleted.
    auto remove(const std::string& key) -> Result<bool>;

    [[nodiscard]] auto size() -> Result<int64_t>;

private:
    void init_schema();

    std::mutex mutex_;
    std::unique_ptr<SQLite::Database> db_;
};

} // namespace buildprobe::extractor
