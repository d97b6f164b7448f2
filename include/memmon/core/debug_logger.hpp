#pragma once
#include <iostream>
#include <atomic>
#include <string>
#include <sstream>
#include <utility>

namespace memmon {

    class DebugLogger {
    public:
        static void setEnabled(bool enabled);
        static bool isEnabled();

        template<typename... Args>
        static void log(const char* prefix, Args&&... args) {
            if (isEnabled()) {
                std::cout << format(prefix, std::forward<Args>(args)...) << std::endl;
            }
        }

        template<typename... Args>
        static void error(const char* prefix, Args&&... args) {
            if (isEnabled()) {
                std::cerr << format(prefix, std::forward<Args>(args)...) << std::endl;
            }
        }

        // Warnings are printed regardless of the debug flag.
        template<typename... Args>
        static void warn(const char* prefix, Args&&... args) {
            std::cerr << format(prefix, std::forward<Args>(args)...) << std::endl;
        }

    private:
        template<typename... Args>
        static std::string format(const char* prefix, Args&&... args) {
            std::stringstream ss;
            ss << prefix;
            (ss << ... << std::forward<Args>(args));
            return ss.str();
        }
    };

    #define MEMMON_LOG_DEBUG(...) ::memmon::DebugLogger::log("[MEMMON] ", __VA_ARGS__)
    #define MEMMON_LOG_WARN(...) ::memmon::DebugLogger::warn("[MEMMON-WARN] ", __VA_ARGS__)
    #define MEMMON_LOG_ERROR(...) ::memmon::DebugLogger::error("[MEMMON-ERROR] ", __VA_ARGS__)

} // namespace memmon
