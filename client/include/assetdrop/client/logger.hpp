#pragma once

#include <filesystem>
#include <memory>
#include <optional>

#include <spdlog/logger.h>

namespace assetdrop::client
{

    // Builds the process logger (stderr, plus a file when requested) and
    // installs it as the spdlog default used by the engine.
    std::shared_ptr<spdlog::logger> configure_logging(const std::optional<std::filesystem::path> &log_path,
                                                      bool verbose);

} // namespace assetdrop::client
