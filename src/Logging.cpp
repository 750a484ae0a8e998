#include <Logging.hpp>

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace NReservation {

    namespace {

        std::string NowIso8601() {
            auto now = std::chrono::system_clock::now();
            auto time = std::chrono::system_clock::to_time_t(now);
            std::tm utc{};
            gmtime_r(&time, &utc);
            std::ostringstream ss;
            ss << std::put_time(&utc, "%FT%TZ");
            return ss.str();
        }

    } // namespace

    std::string ToString(ELogLevel level) {
        switch (level) {
            case ELogLevel::Debug:
                return "debug";
            case ELogLevel::Info:
                return "info";
            case ELogLevel::Warn:
                return "warn";
            case ELogLevel::Error:
                return "error";
        }
        return "info";
    }

    ELogLevel LogLevelFromString(const std::string& text) {
        if (text == "debug") {
            return ELogLevel::Debug;
        }
        if (text == "info") {
            return ELogLevel::Info;
        }
        if (text == "warn") {
            return ELogLevel::Warn;
        }
        if (text == "error") {
            return ELogLevel::Error;
        }
        throw std::invalid_argument("Unknown log level: " + text);
    }

    void TLogger::Log(ELogLevel level,
                      const std::string& component,
                      const std::string& message,
                      const nlohmann::json& fields) {
        std::lock_guard lk(Mutex_);
        if (level < Threshold) {
            return;
        }
        nlohmann::json entry = {
            {"timestamp", NowIso8601()},
            {"level", ToString(level)},
            {"component", component},
            {"message", message}};
        if (fields.is_object()) {
            for (auto& [key, value] : fields.items()) {
                // Caller fields never overwrite the envelope.
                if (!entry.contains(key)) {
                    entry[key] = value;
                }
            }
        }
        *Out << entry.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
    }

    void TLogger::SetThreshold(ELogLevel level) {
        std::lock_guard lk(Mutex_);
        Threshold = level;
    }

} // namespace NReservation
