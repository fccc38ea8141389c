/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

// Standard C++ headers
#include <mutex>
#include <string>
#include <vector>

// spdlog headers
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

// bridge headers
#include <bridge/internal/logger.h>
#include <bridge/logging/logging.h>

namespace bridge
{
    namespace logging
    {
        namespace
        {
            constexpr char logger_name[] = "bridge";

            std::mutex logger_mtx;
            std::shared_ptr<spdlog::logger> logger;

            std::shared_ptr<spdlog::logger> make_logger(const logging_options& options)
            {
                std::vector<spdlog::sink_ptr> sinks;
                sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
                if (options.log_file)
                {
                    try
                    {
                        sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(options.log_file->string()));
                    }
                    catch (const spdlog::spdlog_ex& ex)
                    {
                        spdlog::default_logger()->warn(
                            "unable to open log file '{}': {} - logging to console only", options.log_file->string(), ex.what());
                    }
                }

                auto result = std::make_shared<spdlog::logger>(logger_name, sinks.begin(), sinks.end());
                result->set_pattern(options.pattern);
                result->set_level(options.level);
                result->flush_on(spdlog::level::warn);
                return result;
            }
        }

        void init(const logging_options& options)
        {
            auto created = make_logger(options);
            std::unique_lock lock(logger_mtx);
            logger = std::move(created);
        }

        void set_level(spdlog::level::level_enum level)
        {
            get_logger()->set_level(level);
        }

        std::shared_ptr<spdlog::logger> get_logger()
        {
            std::unique_lock lock(logger_mtx);
            if (!logger)
                logger = make_logger(logging_options{});
            return logger;
        }
    }
}

extern "C"
{
    void bridge_log(int level, const char* str, size_t sz)
    {
        auto logger = bridge::logging::get_logger();
        std::string message(str, sz);
        switch (level)
        {
        case bridge::log_level::debug:
            logger->debug(message);
            break;
        case bridge::log_level::trace:
            logger->trace(message);
            break;
        case bridge::log_level::info:
            logger->info(message);
            break;
        case bridge::log_level::warn:
            logger->warn(message);
            break;
        case bridge::log_level::err:
            logger->error(message);
            break;
        case bridge::log_level::critical:
            logger->critical(message);
            break;
        default:
            logger->info(message);
            break;
        }
    }
}
