#pragma once

#include <memory>

#include "common/Config.hpp"
#include "core/CacheLayer.h"

namespace bootstrap {

// Builds the cache selected by `config.cache` ("duck", "memory" or "none").
// Returns nullptr for "none". A DuckDB cache that cannot be opened, or a build
// without DuckDB, falls back to the in-memory cache.
std::unique_ptr<core::CacheLayer> makeCandleCache(const csync::common::Config& config);

}  // namespace bootstrap
