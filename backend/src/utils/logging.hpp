#pragma once
#include <memory>
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>

namespace Log
{
    constexpr const char* LOGGER_NAME = "retentio";

    // Review and config events go to a file; stdout is reserved for the menus.
    // Calling init again keeps the first file and only updates the level.
    inline std::shared_ptr<spdlog::logger> init(const std::string& path = "retentio.log",
        spdlog::level::level_enum level = spdlog::level::debug)
    {
        auto logger = spdlog::get(LOGGER_NAME);
        if (!logger) {
            logger = spdlog::basic_logger_mt(LOGGER_NAME, path);
            logger->set_pattern("[%d:%m:%Y:%H:%M:%S.%e] [%l] %v");
            spdlog::set_default_logger(logger);
        }

        logger->set_level(level);
        logger->flush_on(spdlog::level::info);
        return logger;
    }
}
