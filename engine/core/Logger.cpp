#include "core/Logger.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <vector>

namespace Lattice {

std::shared_ptr<spdlog::logger> Logger::s_engineLogger;
std::shared_ptr<spdlog::logger> Logger::s_appLogger;
std::atomic<bool> Logger::s_initialized{false};
std::mutex Logger::s_initMutex;

namespace {

std::shared_ptr<spdlog::logger> MakeLogger(const std::string& name,
                                           const std::vector<spdlog::sink_ptr>& sinks,
                                           spdlog::level::level_enum level) {
    spdlog::drop(name);
    auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    logger->set_level(level);
    logger->flush_on(spdlog::level::warn);
    spdlog::register_logger(logger);
    return logger;
}

} // namespace

void Logger::Initialize(const LogSettings& settings) {
    std::lock_guard lock(s_initMutex);
    Configure(settings);
}

void Logger::Configure(const LogSettings& settings) {
    std::vector<spdlog::sink_ptr> sinks;

    if (settings.console) {
        auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        consoleSink->set_pattern("%^[%T] [%n] [%l]%$ %v");
        sinks.push_back(consoleSink);
    }

    if (!settings.file.empty()) {
        try {
            auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                settings.file, settings.maxFileBytes, settings.maxFiles);
            fileSink->set_pattern("[%Y-%m-%d %T.%e] [%n] [%t] [%l] %v");
            sinks.push_back(fileSink);
        } catch (const spdlog::spdlog_ex& e) {
            // Keep logging to the console rather than failing start-up
            spdlog::error("Cannot open log file {}: {}", settings.file, e.what());
        }
    }

    s_engineLogger = MakeLogger("LATTICE", sinks, settings.level);
    s_appLogger = MakeLogger("APP", sinks, settings.level);
    spdlog::set_default_logger(s_engineLogger);

    s_initialized.store(true, std::memory_order_release);
}

void Logger::Shutdown() {
    std::lock_guard lock(s_initMutex);
    if (!s_initialized.load(std::memory_order_relaxed)) {
        return;
    }

    s_engineLogger->flush();
    s_appLogger->flush();
    spdlog::drop_all();

    s_engineLogger.reset();
    s_appLogger.reset();
    s_initialized.store(false, std::memory_order_release);
}

void Logger::SetLevel(spdlog::level::level_enum level) {
    EnsureInitialized();
    s_engineLogger->set_level(level);
    s_appLogger->set_level(level);
}

spdlog::level::level_enum Logger::ParseLevel(const std::string& name) {
    auto level = spdlog::level::from_str(name);
    if (level == spdlog::level::off && name != "off") {
        return spdlog::level::info;
    }
    return level;
}

std::shared_ptr<spdlog::logger>& Logger::GetEngineLogger() {
    EnsureInitialized();
    return s_engineLogger;
}

std::shared_ptr<spdlog::logger>& Logger::GetAppLogger() {
    EnsureInitialized();
    return s_appLogger;
}

void Logger::EnsureInitialized() {
    if (s_initialized.load(std::memory_order_acquire)) {
        return;
    }
    std::lock_guard lock(s_initMutex);
    if (!s_initialized.load(std::memory_order_relaxed)) {
        Configure(LogSettings{});
    }
}

} // namespace Lattice
