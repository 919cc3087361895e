#pragma once

#include <spdlog/spdlog.h>

#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>

namespace Lattice {

/**
 * @brief Sinks and level shared by the engine and application loggers
 */
struct LogSettings {
    std::string file;                       // Empty disables the rotating file sink
    bool console = true;
    spdlog::level::level_enum level = spdlog::level::info;
    size_t maxFileBytes = 5 * 1024 * 1024;
    size_t maxFiles = 3;
};

/**
 * @brief Process-wide spdlog loggers
 *
 * Two loggers share one set of sinks: "LATTICE" for the engine (networking,
 * chunk streaming) and "APP" for the server and client executables. They
 * are created with console output on first use if Initialize() was never
 * called. Safe to use from generation workers.
 */
class Logger {
public:
    /**
     * @brief Create (or recreate) both loggers with the given sinks
     *
     * Loggers created lazily before this call, e.g. while loading the
     * configuration, are replaced.
     */
    static void Initialize(const LogSettings& settings = {});

    /** @brief Flush and drop both loggers */
    static void Shutdown();

    static void SetLevel(spdlog::level::level_enum level);

    /**
     * @brief Parse a level name ("trace", "debug", "info", "warn", ...)
     *
     * Unknown names map to info.
     */
    static spdlog::level::level_enum ParseLevel(const std::string& name);

    static std::shared_ptr<spdlog::logger>& GetEngineLogger();
    static std::shared_ptr<spdlog::logger>& GetAppLogger();

    static bool IsInitialized() { return s_initialized.load(std::memory_order_acquire); }

private:
    static void EnsureInitialized();
    static void Configure(const LogSettings& settings);     // Caller holds s_initMutex

    static std::shared_ptr<spdlog::logger> s_engineLogger;
    static std::shared_ptr<spdlog::logger> s_appLogger;
    static std::atomic<bool> s_initialized;
    static std::mutex s_initMutex;
};

} // namespace Lattice

#define LATTICE_LOG_TRACE(...)    ::Lattice::Logger::GetEngineLogger()->trace(__VA_ARGS__)
#define LATTICE_LOG_DEBUG(...)    ::Lattice::Logger::GetEngineLogger()->debug(__VA_ARGS__)
#define LATTICE_LOG_INFO(...)     ::Lattice::Logger::GetEngineLogger()->info(__VA_ARGS__)
#define LATTICE_LOG_WARN(...)     ::Lattice::Logger::GetEngineLogger()->warn(__VA_ARGS__)
#define LATTICE_LOG_ERROR(...)    ::Lattice::Logger::GetEngineLogger()->error(__VA_ARGS__)
#define LATTICE_LOG_CRITICAL(...) ::Lattice::Logger::GetEngineLogger()->critical(__VA_ARGS__)

#define APP_LOG_TRACE(...)    ::Lattice::Logger::GetAppLogger()->trace(__VA_ARGS__)
#define APP_LOG_DEBUG(...)    ::Lattice::Logger::GetAppLogger()->debug(__VA_ARGS__)
#define APP_LOG_INFO(...)     ::Lattice::Logger::GetAppLogger()->info(__VA_ARGS__)
#define APP_LOG_WARN(...)     ::Lattice::Logger::GetAppLogger()->warn(__VA_ARGS__)
#define APP_LOG_ERROR(...)    ::Lattice::Logger::GetAppLogger()->error(__VA_ARGS__)
#define APP_LOG_CRITICAL(...) ::Lattice::Logger::GetAppLogger()->critical(__VA_ARGS__)
