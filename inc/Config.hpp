#pragma once
#include <chrono>
#include <filesystem>
#include <string>
#include <nlohmann/json.hpp>

#include "Logging.hpp"

namespace NReservation {

    enum class EStoreBackend {
        Memory,
        Sqlite
    };

    struct TStoreConfig {
        EStoreBackend Backend = EStoreBackend::Memory;
        std::filesystem::path SqlitePath = "reservation.db";
        // Empty paths keep committed state in process memory only.
        std::filesystem::path SnapshotPath;
        std::filesystem::path JournalPath;
    };

    struct TReservationConfig {
        TStoreConfig Store;
        std::chrono::milliseconds LockWaitTimeout{5000};
        std::chrono::hours IdempotencyRetention{24 * 7};
        ELogLevel LogLevel = ELogLevel::Info;
    };

    // Missing fields keep their defaults.
    TReservationConfig ConfigFromJson(const nlohmann::json& j);
    TReservationConfig LoadConfig(const std::filesystem::path& path);

} // namespace NReservation
