#pragma once
#include <iostream>
#include <mutex>
#include <string>
#include <nlohmann/json.hpp>

namespace NReservation {

    enum class ELogLevel {
        Debug,
        Info,
        Warn,
        Error
    };

    std::string ToString(ELogLevel level);
    ELogLevel LogLevelFromString(const std::string& text);

    // One JSON object per line.
    class TLogger {
    public:
        explicit TLogger(std::ostream& out = std::clog, ELogLevel threshold = ELogLevel::Info)
            : Out(&out)
            , Threshold(threshold) {
        }

        void Log(ELogLevel level,
                 const std::string& component,
                 const std::string& message,
                 const nlohmann::json& fields = nlohmann::json::object());

        void Debug(const std::string& component, const std::string& message, const nlohmann::json& fields = nlohmann::json::object()) {
            Log(ELogLevel::Debug, component, message, fields);
        }
        void Info(const std::string& component, const std::string& message, const nlohmann::json& fields = nlohmann::json::object()) {
            Log(ELogLevel::Info, component, message, fields);
        }
        void Warn(const std::string& component, const std::string& message, const nlohmann::json& fields = nlohmann::json::object()) {
            Log(ELogLevel::Warn, component, message, fields);
        }
        void Error(const std::string& component, const std::string& message, const nlohmann::json& fields = nlohmann::json::object()) {
            Log(ELogLevel::Error, component, message, fields);
        }

        void SetThreshold(ELogLevel level);

    private:
        std::ostream* Out;
        ELogLevel Threshold;
        std::mutex Mutex_;
    };

} // namespace NReservation
