#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/fmt/ostr.h>
#include <memory>
#include <string>

namespace tessella {

class Log {
public:
    // Creates the console sink and, when writable, the tessella.log file sink.
    // Safe to call more than once; later calls only reset the level.
    static void Init(spdlog::level::level_enum level = spdlog::level::info);
    static void Shutdown();
    
    static void SetLevel(spdlog::level::level_enum level);
    // Accepts spdlog level names ("trace", "debug", "info", "warn", "error", "critical", "off").
    // Returns false and leaves the level unchanged for anything else.
    static bool SetLevel(const std::string& levelName);
    
    static std::shared_ptr<spdlog::logger>& GetCoreLogger();
    static std::shared_ptr<spdlog::logger>& GetClientLogger();

private:
    static void CreateLoggers(spdlog::level::level_enum level);
    
    static std::shared_ptr<spdlog::logger> s_CoreLogger;
    static std::shared_ptr<spdlog::logger> s_ClientLogger;
};

} // namespace tessella

// Core logging macros
#define TESSELLA_CORE_TRACE(...)    ::tessella::Log::GetCoreLogger()->trace(__VA_ARGS__)
#define TESSELLA_CORE_DEBUG(...)    ::tessella::Log::GetCoreLogger()->debug(__VA_ARGS__)
#define TESSELLA_CORE_INFO(...)     ::tessella::Log::GetCoreLogger()->info(__VA_ARGS__)
#define TESSELLA_CORE_WARN(...)     ::tessella::Log::GetCoreLogger()->warn(__VA_ARGS__)
#define TESSELLA_CORE_ERROR(...)    ::tessella::Log::GetCoreLogger()->error(__VA_ARGS__)
#define TESSELLA_CORE_CRITICAL(...) ::tessella::Log::GetCoreLogger()->critical(__VA_ARGS__)

// Client/application logging macros
#define TESSELLA_TRACE(...)     ::tessella::Log::GetClientLogger()->trace(__VA_ARGS__)
#define TESSELLA_LOG_DEBUG(...) ::tessella::Log::GetClientLogger()->debug(__VA_ARGS__)
#define TESSELLA_INFO(...)      ::tessella::Log::GetClientLogger()->info(__VA_ARGS__)
#define TESSELLA_WARN(...)      ::tessella::Log::GetClientLogger()->warn(__VA_ARGS__)
#define TESSELLA_ERROR(...)     ::tessella::Log::GetClientLogger()->error(__VA_ARGS__)
#define TESSELLA_CRITICAL(...)  ::tessella::Log::GetClientLogger()->critical(__VA_ARGS__)
