#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace assetdrop::client
{

    inline constexpr auto kTokenEnvironmentVariable = "ASSETDROP_TOKEN";
    inline constexpr auto kDefaultConsoleBase = "https://app.contentful.com";

    struct ClientConfig
    {
        std::string space_id;
        std::string environment_id;
        std::string token;
        std::filesystem::path store_root;
        std::string console_base{kDefaultConsoleBase};
        std::size_t parallel_count{3};
        std::optional<std::string> tag_name;
        bool tag_from_folder{};
        std::optional<std::filesystem::path> json_report;
        std::optional<std::filesystem::path> log_path;
        bool verbose{};
        bool show_help{};
        std::vector<std::filesystem::path> inputs;
    };

    // Throws UploadError(InvalidConfiguration) on malformed command lines.
    ClientConfig parse_arguments(int argc, char *argv[]);

    std::string usage(const std::string &program_name);

} // namespace assetdrop::client
