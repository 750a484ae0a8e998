#include <Config.hpp>

#include <fstream>
#include <stdexcept>

namespace NReservation {

    TReservationConfig ConfigFromJson(const nlohmann::json& j) {
        TReservationConfig cfg;
        if (!j.is_object()) {
            throw std::runtime_error("Config root must be a JSON object");
        }

        if (j.contains("store")) {
            auto const& s = j.at("store");
            std::string backend = s.value("backend", std::string("memory"));
            if (backend == "memory") {
                cfg.Store.Backend = EStoreBackend::Memory;
            } else if (backend == "sqlite") {
                cfg.Store.Backend = EStoreBackend::Sqlite;
            } else {
                throw std::runtime_error("Unknown store backend: " + backend);
            }
            cfg.Store.SqlitePath = s.value("sqlite_path", cfg.Store.SqlitePath.string());
            cfg.Store.SnapshotPath = s.value("snapshot_path", std::string());
            cfg.Store.JournalPath = s.value("journal_path", std::string());
        }

        if (j.contains("lock_wait_timeout_ms")) {
            auto ms = j.at("lock_wait_timeout_ms").get<int64_t>();
            if (ms <= 0) {
                throw std::runtime_error("lock_wait_timeout_ms must be positive");
            }
            cfg.LockWaitTimeout = std::chrono::milliseconds(ms);
        }
        if (j.contains("idempotency_retention_hours")) {
            auto h = j.at("idempotency_retention_hours").get<int64_t>();
            if (h < 0) {
                throw std::runtime_error("idempotency_retention_hours must not be negative");
            }
            cfg.IdempotencyRetention = std::chrono::hours(h);
        }
        if (j.contains("log_level")) {
            cfg.LogLevel = LogLevelFromString(j.at("log_level").get<std::string>());
        }
        return cfg;
    }

    TReservationConfig LoadConfig(const std::filesystem::path& path) {
        std::ifstream in(path);
        if (!in) {
            throw std::runtime_error("Cannot open config file: " + path.string());
        }
        nlohmann::json j;
        in >> j;
        return ConfigFromJson(j);
    }

} // namespace NReservation
