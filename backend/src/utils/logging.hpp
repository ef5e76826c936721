#pragma once
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace Log
{
    // Installs the engine-wide default logger. An empty path logs to stdout.
    inline void init(spdlog::level::level_enum level = spdlog::level::info,
                     const std::string& file = "")
    {
        std::shared_ptr<spdlog::logger> logger;
        if (file.empty()) {
            logger = spdlog::get("anamnesis");
            if (!logger) logger = spdlog::stdout_color_mt("anamnesis");
        }
        else {
            logger = spdlog::get("anamnesis_file");
            if (!logger) logger = spdlog::basic_logger_mt("anamnesis_file", file);
        }

        // Make it the default so every component picks it up
        spdlog::set_default_logger(logger);

        // Set global log pattern ONCE
        spdlog::set_pattern("[%d:%m:%Y:%H:%M:%S.%e] [%l] %v");

        spdlog::set_level(level);
        spdlog::flush_on(spdlog::level::info);
    }
}
