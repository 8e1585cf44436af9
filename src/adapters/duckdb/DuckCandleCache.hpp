#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "core/CacheLayer.h"

namespace duckdb {
class DuckDB;
class Connection;
}  // namespace duckdb

namespace adapters::duckdb {

// Candle snapshots persisted in a DuckDB file, one row per cache key.
class DuckCandleCache : public core::CacheLayer {
public:
    explicit DuckCandleCache(std::string dbPath = "data/candlesync.duckdb", std::int64_t ttlSec = 3600);
    ~DuckCandleCache() override;

    DuckCandleCache(const DuckCandleCache&) = delete;
    DuckCandleCache& operator=(const DuckCandleCache&) = delete;

    const std::string& path() const noexcept { return dbPath_; }

protected:
    std::optional<std::string> readPayload(const std::string& cacheKey) override;
    void writePayload(const std::string& cacheKey,
                      const std::string& payload,
                      domain::TimestampMs fetchedAtMs) override;
    void erasePayload(const std::string& cacheKey) override;

private:
    void migrate_();

    std::string dbPath_;
    std::mutex mutex_;
    std::unique_ptr<::duckdb::DuckDB> database_;
    std::unique_ptr<::duckdb::Connection> connection_;
};

}  // namespace adapters::duckdb
