/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#include <spdlog/spdlog.h>

namespace bridge
{
    namespace logging
    {
        struct logging_options
        {
            spdlog::level::level_enum level = spdlog::level::info;
            std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v";
            // also write to this file, the console sink is always present
            std::optional<std::filesystem::path> log_file;
        };

        // replaces the bridge logger, safe to call more than once
        void init(const logging_options& options);

        void set_level(spdlog::level::level_enum level);

        // the logger behind bridge_log, created with default options on first use
        std::shared_ptr<spdlog::logger> get_logger();
    }
}
