#include "buildprobe/extractor/result_cache.hpp"

#include <algorithm>
#include <fstream>
#include <vector>

#include "buildprobe/core/logger.hpp"
#include "buildprobe/core/utils.hpp"
#include "buildprobe/rewriter/instrumentation.hpp"

namespace buildprobe::extractor {

namespace fs = std::filesystem;

namespace {

auto hash_file(utils::Sha256& hasher, const fs::path& path) -> Result<void> {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return std::unexpected(make_error(ErrorCode::IoError,
            "Failed to open file for hashing", path.string()));
    }
    char buffer[65536];
    while (in.read(buffer, sizeof buffer) || in.gcount() > 0) {
        hasher.update(std::string_view(buffer, static_cast<size_t>(in.gcount())));
    }
    if (in.bad()) {
        return std::unexpected(make_error(ErrorCode::IoError,
            "Failed to read file for hashing", path.string()));
    }
    return {};
}

/// Length-prefixed so that adjacent fields cannot run into each other.
void hash_field(utils::Sha256& hasher, std::string_view field) {
    hasher.update(std::to_string(field.size()));
    hasher.update(":");
    hasher.update(field);
}

auto hash_tree(utils::Sha256& hasher, const fs::path& root) -> Result<void> {
    std::error_code ec;
    std::vector<fs::path> entries;
    for (auto it = fs::recursive_directory_iterator(root, ec);
         !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        entries.push_back(it->path());
    }
    if (ec) {
        return std::unexpected(make_error(ErrorCode::IoError,
            "Failed to walk source tree", root.string() + ": " + ec.message()));
    }
    std::sort(entries.begin(), entries.end());

    for (const auto& path : entries) {
        auto status = fs::symlink_status(path, ec);
        if (ec) {
            return std::unexpected(make_error(ErrorCode::IoError,
                "Failed to stat", path.string() + ": " + ec.message()));
        }
        hash_field(hasher, path.lexically_relative(root).generic_string());
        if (fs::is_symlink(status)) {
            hash_field(hasher, "l");
            hash_field(hasher, fs::read_symlink(path, ec).string());
        } else if (fs::is_directory(status)) {
            hash_field(hasher, "d");
        } else if (fs::is_regular_file(status)) {
            hash_field(hasher, "f");
            hash_field(hasher, std::to_string(fs::file_size(path, ec)));
            if (auto r = hash_file(hasher, path); !r) return r;
        } else {
            hash_field(hasher, "o");
        }
    }
    return {};
}

} // anonymous namespace

ResultCache::ResultCache(const std::string& db_path)
    : db_(std::make_unique<SQLite::Database>(
          db_path, SQLite::OPEN_READWRITE | SQLite::OPEN_CREATE)) {
    init_schema();
    LOG_INFO("Result cache opened at {}", db_path);
}

void ResultCache::init_schema() {
    db_->exec(R"SQL(
        CREATE TABLE IF NOT EXISTS extractions (
            key TEXT PRIMARY KEY,
            interpreter TEXT NOT NULL,
            artifact BLOB NOT NULL,
            created_at INTEGER NOT NULL
        )
    )SQL");
}

auto ResultCache::compute_key(const ExtractionRequest& request) -> Result<std::string> {
    utils::Sha256 hasher;
    hash_field(hasher, "buildprobe-cache");
    hash_field(hasher, std::to_string(rewriter::kInstrumentationVersion));
    hash_field(hasher, request.build_script);
    hash_field(hasher, std::to_string(request.interpreters.size()));
    for (const auto& interpreter : request.interpreters) {
        hash_field(hasher, interpreter);
    }

    std::error_code ec;
    auto status = fs::status(request.source, ec);
    if (fs::is_directory(status)) {
        hash_field(hasher, "tree");
        if (auto r = hash_tree(hasher, request.source); !r) {
            return std::unexpected(r.error());
        }
    } else if (fs::is_regular_file(status)) {
        hash_field(hasher, "archive");
        hash_field(hasher, request.source.filename().string());
        if (auto r = hash_file(hasher, request.source); !r) {
            return std::unexpected(r.error());
        }
    } else {
        return std::unexpected(make_error(ErrorCode::NotFound,
            "Source not found", request.source.string()));
    }
    return hasher.hex_digest();
}

auto ResultCache::lookup(const std::string& key) -> Result<std::optional<CachedExtraction>> {
    std::lock_guard lock(mutex_);
    try {
        SQLite::Statement stmt(*db_,
            "SELECT interpreter, artifact, created_at FROM extractions WHERE key = ?");
        stmt.bind(1, key);
        if (!stmt.executeStep()) {
            return std::optional<CachedExtraction>{};
        }
        CachedExtraction cached;
        cached.interpreter = stmt.getColumn(0).getString();
        cached.artifact = stmt.getColumn(1).getString();
        cached.created_at = stmt.getColumn(2).getInt64();
        return cached;
    } catch (const SQLite::Exception& e) {
        LOG_ERROR("Failed to look up cached extraction {}: {}", key, e.what());
        return std::unexpected(
            make_error(ErrorCode::DatabaseError, "Failed to look up cached extraction", e.what()));
    }
}

auto ResultCache::store(const std::string& key, const ExtractionResult& result) -> Result<void> {
    if (result.outcome != Outcome::Extracted || !result.artifact || !result.interpreter) {
        return std::unexpected(make_error(ErrorCode::InvalidArgument,
            "Only extracted results can be cached", std::string(outcome_to_string(result.outcome))));
    }

    std::lock_guard lock(mutex_);
    try {
        SQLite::Statement stmt(*db_,
            "INSERT OR REPLACE INTO extractions (key, interpreter, artifact, created_at) "
            "VALUES (?, ?, ?, ?)");
        stmt.bind(1, key);
        stmt.bind(2, *result.interpreter);
        stmt.bind(3, result.artifact->data(), static_cast<int>(result.artifact->size()));
        stmt.bind(4, utils::timestamp_ms());
        stmt.exec();
        LOG_DEBUG("Cached extraction {}", key);
        return {};
    } catch (const SQLite::Exception& e) {
        LOG_ERROR("Failed to cache extraction {}: {}", key, e.what());
        return std::unexpected(
            make_error(ErrorCode::DatabaseError, "Failed to cache extraction", e.what()));
    }
}

auto ResultCache::remove(const std::string& key) -> Result<bool> {
    std::lock_guard lock(mutex_);
    try {
        SQLite::Statement stmt(*db_, "DELETE FROM extractions WHERE key = ?");
        stmt.bind(1, key);
        bool removed = stmt.exec() > 0;
        if (removed) LOG_DEBUG("Removed cached extraction {}", key);
        return removed;
    } catch (const SQLite::Exception& e) {
        return std::unexpected(
            make_error(ErrorCode::DatabaseError, "Failed to remove cached extraction", e.what()));
    }
}

auto ResultCache::size() -> Result<int64_t> {
    std::lock_guard lock(mutex_);
    try {
        SQLite::Statement stmt(*db_, "SELECT COUNT(*) FROM extractions");
        stmt.executeStep();
        return stmt.getColumn(0).getInt64();
    } catch (const SQLite::Exception& e) {
        return std::unexpected(
            make_error(ErrorCode::DatabaseError, "Failed to count cached extractions", e.what()));
    }
}

} // namespace buildprobe::extractor
