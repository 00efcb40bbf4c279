/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once

#include "log.h"
#include "logmanager.h"
#include <memory>
#include <mutex>

namespace keep {

/**
 * RAII manager for the logging subsystem.
 *
 * Usage:
 *   - Tests: Create in SetUpTestSuite(), destroy in TearDownTestSuite()
 *   - Production: Create at startup, destroy at shutdown
 */
class LogRuntime {
public:
    struct Config {
        bool enable_file_logging;
        std::string log_dir;
        LogLevel initial_level;

        Config()
            : enable_file_logging(false)
            , initial_level(LOG_WARNING) {}

        /**
         * Read KEEP_LOG_ENABLE_FILE, KEEP_LOG_DIR and KEEP_LOG_LEVEL
         */
        static Config fromEnv() {
            Config config;
            if (const char* enable = std::getenv("KEEP_LOG_ENABLE_FILE")) {
                config.enable_file_logging = (std::string(enable) != "0");
            }
            if (const char* dir = std::getenv("KEEP_LOG_DIR")) {
                config.log_dir = dir;
            }
            return config;
        }
    };

    explicit LogRuntime(const Config& config = Config())
        : config_(config) {

        logLevel.store(config_.initial_level, std::memory_order_relaxed);
        initLoggingFromEnv();

        if (config_.enable_file_logging && !config_.log_dir.empty()) {
            log_manager_ = std::make_unique<LogManager>(config_.log_dir);
        }
    }

    ~LogRuntime() {
        shutdown();
    }

    /**
     * Explicitly shutdown all logging components
     * Safe to call multiple times
     */
    void shutdown() {
        std::lock_guard<std::mutex> lock(mutex_);

        // Reset logger to stderr before destroying LogManager
        Logger::setLogFile(nullptr);
        log_manager_.reset();
    }

    const LogManager* manager() const { return log_manager_.get(); }

    LogRuntime(const LogRuntime&) = delete;
    LogRuntime& operator=(const LogRuntime&) = delete;

private:
    Config config_;
    std::unique_ptr<LogManager> log_manager_;
    std::mutex mutex_;
};

}
