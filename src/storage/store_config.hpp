#pragma once

#include "core/theme.hpp"
#include <string>

namespace sparkle::storage {

inline constexpr const char* MEMORY_DATABASE = ":memory:";

/**
 * StoreConfig - How a Store opens its database.
 */
struct StoreConfig {
    std::string path = MEMORY_DATABASE;
    std::string default_theme_name = std::string(DEFAULT_THEME_NAME);
    int busy_timeout_ms = 5000;
    bool wal = true;

    [[nodiscard]] bool is_memory() const { return path == MEMORY_DATABASE; }

    /**
     * Defaults with SPARKLE_DB_PATH and SPARKLE_DEFAULT_THEME applied.
     * Without SPARKLE_DB_PATH the database lives in the app data location.
     */
    [[nodiscard]] static StoreConfig from_environment();
};

} // namespace sparkle::storage
