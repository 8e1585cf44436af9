#include "adapters/duckdb/DuckCandleCache.hpp"

#include <filesystem>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>

#include <duckdb.hpp>

#include "common/Log.hpp"

namespace fs = std::filesystem;

namespace adapters::duckdb {
namespace {
using csync::log::Category;
using DuckdbValueVector = ::duckdb::vector<::duckdb::Value>;

std::runtime_error makeError(const std::string& what, const std::string& detail) {
    return std::runtime_error("DuckCandleCache: " + what + ": " + detail);
}

template <typename ResultPtr>
void throwIfFailed(const ResultPtr& result, const std::string& what) {
    if (!result || result->HasError()) {
        throw makeError(what, result ? result->GetError() : std::string{"unknown error"});
    }
}

}  // namespace

DuckCandleCache::DuckCandleCache(std::string dbPath, std::int64_t ttlSec)
    : core::CacheLayer(ttlSec), dbPath_(std::move(dbPath)) {
    const fs::path path{dbPath_};
    if (path.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            throw makeError("unable to create directory '" + path.parent_path().string() + "'", ec.message());
        }
    }

    database_ = std::make_unique<::duckdb::DuckDB>(path.string());
    connection_ = std::make_unique<::duckdb::Connection>(*database_);
    migrate_();
    LOG_INFO(Category::Db, "DuckCandleCache opened " << dbPath_);
}

DuckCandleCache::~DuckCandleCache() {
    connection_.reset();
    database_.reset();
}

void DuckCandleCache::migrate_() {
    static constexpr auto kCreateCacheTable = R"SQL(
        CREATE TABLE IF NOT EXISTS candle_cache (
            key TEXT PRIMARY KEY,
            payload TEXT NOT NULL,
            fetched_at_ms BIGINT NOT NULL
        )
    )SQL";

    auto result = connection_->Query(kCreateCacheTable);
    throwIfFailed(result, "migration failed");
}

std::optional<std::string> DuckCandleCache::readPayload(const std::string& cacheKey) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto statement = connection_->Prepare("SELECT payload FROM candle_cache WHERE key = ?");
    throwIfFailed(statement, "prepare select");

    DuckdbValueVector parameters;
    parameters.emplace_back(cacheKey);
    auto result = statement->Execute(parameters);
    throwIfFailed(result, "select payload");

    while (auto chunk = result->Fetch()) {
        if (chunk->size() == 0) {
            continue;
        }
        const auto value = chunk->GetValue(0, 0);
        if (value.IsNull()) {
            return std::nullopt;
        }
        return value.ToString();
    }
    return std::nullopt;
}

void DuckCandleCache::writePayload(const std::string& cacheKey,
                                   const std::string& payload,
                                   domain::TimestampMs fetchedAtMs) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto statement = connection_->Prepare(
        "INSERT OR REPLACE INTO candle_cache (key, payload, fetched_at_ms) VALUES (?, ?, ?)");
    throwIfFailed(statement, "prepare upsert");

    DuckdbValueVector parameters;
    parameters.reserve(3);
    parameters.emplace_back(cacheKey);
    parameters.emplace_back(payload);
    parameters.emplace_back(::duckdb::Value::BIGINT(static_cast<std::int64_t>(fetchedAtMs)));
    auto result = statement->Execute(parameters);
    throwIfFailed(result, "upsert payload");
}

void DuckCandleCache::erasePayload(const std::string& cacheKey) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto statement = connection_->Prepare("DELETE FROM candle_cache WHERE key = ?");
    throwIfFailed(statement, "prepare delete");

    DuckdbValueVector parameters;
    parameters.emplace_back(cacheKey);
    auto result = statement->Execute(parameters);
    throwIfFailed(result, "delete payload");
}

}  // namespace adapters::duckdb
