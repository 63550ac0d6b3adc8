#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "assetdrop/engine/upload_task.hpp"

namespace assetdrop::client
{

    struct CollectedFiles
    {
        std::vector<engine::FileSource> files;
        std::vector<std::filesystem::path> missing;
        std::size_t skipped_nested{};
        // Name of the first folder given, if any.
        std::optional<std::string> folder_name;
    };

    /**
     * Flattens command-line paths into upload sources. A folder contributes
     * only its top-level regular files; anything below a sub-folder is
     * counted in skipped_nested and left out.
     */
    CollectedFiles collect_files(const std::vector<std::filesystem::path> &inputs);

    engine::FileSource describe_file(const std::filesystem::path &path);

    std::string guess_content_type(const std::filesystem::path &path);

    std::uint64_t to_unix_millis(const std::filesystem::file_time_type &time);

} // namespace assetdrop::client
