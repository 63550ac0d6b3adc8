#include "assetdrop/client/logger.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <vector>

#include "assetdrop/error_codes.hpp"

namespace assetdrop::client
{

    std::shared_ptr<spdlog::logger> configure_logging(const std::optional<std::filesystem::path> &log_path,
                                                      bool verbose)
    {
        std::vector<spdlog::sink_ptr> sinks;
        auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console->set_level(verbose ? spdlog::level::info : spdlog::level::warn);
        sinks.push_back(console);

        if (log_path)
        {
            try
            {
                auto file = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_path->string(), true);
                file->set_level(spdlog::level::debug);
                sinks.push_back(file);
            }
            catch (const spdlog::spdlog_ex &ex)
            {
                throw UploadError(ErrorCode::InvalidConfiguration,
                                  "Cannot open log file " + log_path->string() + ": " + ex.what());
            }
        }

        auto logger = std::make_shared<spdlog::logger>("assetdrop", sinks.begin(), sinks.end());
        logger->set_pattern("%Y-%m-%d %H:%M:%S [%^%l%$] %v");
        logger->set_level(spdlog::level::debug);
        logger->flush_on(spdlog::level::warn);
        spdlog::set_default_logger(logger);
        return logger;
    }

} // namespace assetdrop::client
