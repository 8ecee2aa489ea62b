#include "tessella/core/Log.h"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <mutex>
#include <vector>

namespace tessella {

std::shared_ptr<spdlog::logger> Log::s_CoreLogger;
std::shared_ptr<spdlog::logger> Log::s_ClientLogger;

static std::mutex s_InitMutex;

void Log::Init(spdlog::level::level_enum level) {
    std::scoped_lock lock(s_InitMutex);
    CreateLoggers(level);
}

// Caller holds s_InitMutex
void Log::CreateLoggers(spdlog::level::level_enum level) {
    if (s_CoreLogger && s_ClientLogger) {
        s_CoreLogger->set_level(level);
        s_ClientLogger->set_level(level);
        return;
    }
    
    // Create sinks
    std::vector<spdlog::sink_ptr> sinks;
    
    // Console sink with colors
    auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    consoleSink->set_pattern("%^[%T] [%n] %v%$");
    sinks.push_back(consoleSink);
    
    // File sink (optional - creates tessella.log)
    bool fileSinkFailed = false;
    try {
        auto fileSink = std::make_shared<spdlog::sinks::basic_file_sink_mt>("tessella.log", true);
        fileSink->set_pattern("[%T] [%l] [%n] %v");
        sinks.push_back(fileSink);
    } catch (const spdlog::spdlog_ex&) {
        fileSinkFailed = true;
    }
    
    // Core logger
    s_CoreLogger = std::make_shared<spdlog::logger>("TESSELLA", sinks.begin(), sinks.end());
    s_CoreLogger->set_level(level);
    s_CoreLogger->flush_on(spdlog::level::warn);
    
    // Client logger
    s_ClientLogger = std::make_shared<spdlog::logger>("TILEGEN", sinks.begin(), sinks.end());
    s_ClientLogger->set_level(level);
    s_ClientLogger->flush_on(spdlog::level::warn);
    
    if (fileSinkFailed) {
        s_CoreLogger->warn("Could not open tessella.log, logging to console only");
    }
    s_CoreLogger->debug("Tessella logging initialized");
}

void Log::Shutdown() {
    std::scoped_lock lock(s_InitMutex);
    if (s_CoreLogger) {
        s_CoreLogger->debug("Shutting down logging");
        s_CoreLogger->flush();
    }
    if (s_ClientLogger) {
        s_ClientLogger->flush();
    }
    s_CoreLogger.reset();
    s_ClientLogger.reset();
}

void Log::SetLevel(spdlog::level::level_enum level) {
    GetCoreLogger()->set_level(level);
    GetClientLogger()->set_level(level);
}

bool Log::SetLevel(const std::string& levelName) {
    spdlog::level::level_enum level = spdlog::level::from_str(levelName);
    // from_str maps unknown names to "off"
    if (level == spdlog::level::off && levelName != "off") {
        return false;
    }
    SetLevel(level);
    return true;
}

// Locked: generators may log from several threads before anyone calls Init
std::shared_ptr<spdlog::logger>& Log::GetCoreLogger() {
    std::scoped_lock lock(s_InitMutex);
    if (!s_CoreLogger) {
        CreateLoggers(spdlog::level::info);
    }
    return s_CoreLogger;
}

std::shared_ptr<spdlog::logger>& Log::GetClientLogger() {
    std::scoped_lock lock(s_InitMutex);
    if (!s_ClientLogger) {
        CreateLoggers(spdlog::level::info);
    }
    return s_ClientLogger;
}

} // namespace tessella
