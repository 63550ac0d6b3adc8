#include "assetdrop/client/file_collector.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <chrono>
#include <string_view>
#include <system_error>

namespace assetdrop::client
{

    namespace
    {

        struct ContentTypeMapping
        {
            std::string_view extension;
            std::string_view content_type;
        };

        constexpr std::array<ContentTypeMapping, 24> kContentTypes{{
            {".png", "image/png"},
            {".jpg", "image/jpeg"},
            {".jpeg", "image/jpeg"},
            {".gif", "image/gif"},
            {".webp", "image/webp"},
            {".svg", "image/svg+xml"},
            {".avif", "image/avif"},
            {".mp4", "video/mp4"},
            {".webm", "video/webm"},
            {".mov", "video/quicktime"},
            {".mp3", "audio/mpeg"},
            {".wav", "audio/wav"},
            {".ogg", "audio/ogg"},
            {".pdf", "application/pdf"},
            {".json", "application/json"},
            {".zip", "application/zip"},
            {".7z", "application/x-7z-compressed"},
            {".rar", "application/vnd.rar"},
            {".txt", "text/plain"},
            {".csv", "text/csv"},
            {".html", "text/html"},
            {".css", "text/css"},
            {".js", "text/javascript"},
            {".md", "text/markdown"},
        }};

        constexpr std::string_view kDefaultContentType = "application/octet-stream";

        std::size_t count_nested_files(const std::filesystem::path &directory)
        {
            std::size_t count = 0;
            std::error_code ec;
            for (std::filesystem::recursive_directory_iterator it(directory, ec), end; !ec && it != end; it.increment(ec))
            {
                if (it->is_regular_file(ec))
                {
                    ++count;
                }
            }
            return count;
        }

        void collect_directory(const std::filesystem::path &directory, CollectedFiles &collected)
        {
            std::vector<std::filesystem::path> files;
            for (const auto &entry : std::filesystem::directory_iterator(directory))
            {
                if (entry.is_regular_file())
                {
                    files.push_back(entry.path());
                }
                else if (entry.is_directory())
                {
                    collected.skipped_nested += count_nested_files(entry.path());
                }
            }
            std::sort(files.begin(), files.end());
            for (const auto &file : files)
            {
                collected.files.push_back(describe_file(file));
            }
        }

    } // namespace

    CollectedFiles collect_files(const std::vector<std::filesystem::path> &inputs)
    {
        CollectedFiles collected;
        for (const auto &input : inputs)
        {
            std::error_code ec;
            const auto status = std::filesystem::status(input, ec);
            if (ec || !std::filesystem::exists(status))
            {
                collected.missing.push_back(input);
                continue;
            }
            if (std::filesystem::is_directory(status))
            {
                if (!collected.folder_name)
                {
                    auto name = std::filesystem::absolute(input).lexically_normal().filename().string();
                    if (name.empty())
                    {
                        name = std::filesystem::absolute(input).lexically_normal().parent_path().filename().string();
                    }
                    if (!name.empty())
                    {
                        collected.folder_name = name;
                    }
                }
                collect_directory(input, collected);
            }
            else if (std::filesystem::is_regular_file(status))
            {
                collected.files.push_back(describe_file(input));
            }
            else
            {
                collected.missing.push_back(input);
            }
        }
        return collected;
    }

    engine::FileSource describe_file(const std::filesystem::path &path)
    {
        const auto absolute = std::filesystem::absolute(path);
        return engine::FileSource{
            .identity = engine::FileIdentity{
                .name = absolute.filename().string(),
                .size = std::filesystem::file_size(absolute),
                .modified_time = to_unix_millis(std::filesystem::last_write_time(absolute)),
                .content_type = guess_content_type(absolute),
            },
            .path = absolute,
        };
    }

    std::string guess_content_type(const std::filesystem::path &path)
    {
        auto extension = path.extension().string();
        std::transform(extension.begin(), extension.end(), extension.begin(), [](unsigned char ch)
                       { return static_cast<char>(std::tolower(ch)); });
        for (const auto &mapping : kContentTypes)
        {
            if (mapping.extension == extension)
            {
                return std::string(mapping.content_type);
            }
        }
        return std::string(kDefaultContentType);
    }

    std::uint64_t to_unix_millis(const std::filesystem::file_time_type &time)
    {
        using namespace std::chrono;
        const auto system_time = time_point_cast<milliseconds>(time - std::filesystem::file_time_type::clock::now() +
                                                               system_clock::now());
        const auto count = system_time.time_since_epoch().count();
        return count < 0 ? 0 : static_cast<std::uint64_t>(count);
    }

} // namespace assetdrop::client
