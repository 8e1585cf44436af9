#include "bootstrap/CacheFactory.hpp"

#include <exception>

#include "adapters/memory/MemoryCandleCache.hpp"
#include "common/Log.hpp"

#if defined(HAS_DUCKDB)
#include "adapters/duckdb/DuckCandleCache.hpp"
#endif

namespace bootstrap {
namespace {
using csync::log::Category;
}

std::unique_ptr<core::CacheLayer> makeCandleCache(const csync::common::Config& config) {
    if (config.cache == "none") {
        LOG_INFO(Category::Cache, "Candle cache disabled");
        return nullptr;
    }

    if (config.cache == "duck") {
#if defined(HAS_DUCKDB)
        try {
            auto cache = std::make_unique<adapters::duckdb::DuckCandleCache>(config.duckdbPath, config.cacheTtlSec);
            LOG_INFO(Category::Cache, "Candle cache: DuckDB -> " << config.duckdbPath);
            return cache;
        } catch (const std::exception& ex) {
            LOG_WARN(Category::Cache,
                     "DuckDB cache at " << config.duckdbPath << " unavailable (" << ex.what()
                                        << "); using in-memory cache");
        }
#else
        LOG_WARN(Category::Cache, "DuckDB requested but not available in this build; using in-memory cache");
#endif
    }

    LOG_INFO(Category::Cache, "Candle cache: memory ttl=" << config.cacheTtlSec << "s");
    return std::make_unique<adapters::memory::MemoryCandleCache>(config.cacheTtlSec);
}

}  // namespace bootstrap
