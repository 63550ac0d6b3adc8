#include "assetdrop/client/config.hpp"

#include <cstdlib>
#include <sstream>
#include <stdexcept>
#include <string>

#include "assetdrop/engine/uploader.hpp"
#include "assetdrop/error_codes.hpp"
#include "assetdrop/version.hpp"

namespace assetdrop::client
{

    namespace
    {

        [[noreturn]] void reject(const std::string &message)
        {
            throw UploadError(ErrorCode::InvalidConfiguration, message);
        }

        std::string require_value(int &index, int argc, char *argv[], const std::string &flag)
        {
            if (index >= argc)
            {
                reject(flag + " requires a value");
            }
            return argv[index++];
        }

        std::size_t parse_parallel(const std::string &value)
        {
            long long parsed = 0;
            try
            {
                std::size_t consumed = 0;
                parsed = std::stoll(value, &consumed);
                if (consumed != value.size())
                {
                    reject("--parallel expects a whole number, got '" + value + "'");
                }
            }
            catch (const std::logic_error &)
            {
                reject("--parallel expects a whole number, got '" + value + "'");
            }
            return engine::clamp_parallel_count(parsed);
        }

    } // namespace

    ClientConfig parse_arguments(int argc, char *argv[])
    {
        ClientConfig config;
        int index = 1;
        while (index < argc)
        {
            const std::string arg = argv[index++];
            if (arg == "--help" || arg == "-h")
            {
                config.show_help = true;
                return config;
            }
            if (arg == "--space")
            {
                config.space_id = require_value(index, argc, argv, arg);
            }
            else if (arg == "--environment" || arg == "--env")
            {
                config.environment_id = require_value(index, argc, argv, arg);
            }
            else if (arg == "--token")
            {
                config.token = require_value(index, argc, argv, arg);
            }
            else if (arg == "--store")
            {
                config.store_root = std::filesystem::path(require_value(index, argc, argv, arg));
            }
            else if (arg == "--console-url")
            {
                config.console_base = require_value(index, argc, argv, arg);
            }
            else if (arg == "--parallel" || arg == "-j")
            {
                config.parallel_count = parse_parallel(require_value(index, argc, argv, arg));
            }
            else if (arg == "--tag")
            {
                config.tag_name = require_value(index, argc, argv, arg);
            }
            else if (arg == "--tag-from-folder")
            {
                config.tag_from_folder = true;
            }
            else if (arg == "--json")
            {
                config.json_report = std::filesystem::path(require_value(index, argc, argv, arg));
            }
            else if (arg == "--log")
            {
                config.log_path = std::filesystem::path(require_value(index, argc, argv, arg));
            }
            else if (arg == "--verbose" || arg == "-v")
            {
                config.verbose = true;
            }
            else if (arg == "--")
            {
                while (index < argc)
                {
                    config.inputs.emplace_back(argv[index++]);
                }
            }
            else if (arg.starts_with("-") && arg.size() > 1)
            {
                reject("Unknown argument: " + arg);
            }
            else
            {
                config.inputs.emplace_back(arg);
            }
        }

        if (config.token.empty())
        {
            if (const char *token = std::getenv(kTokenEnvironmentVariable))
            {
                config.token = token;
            }
        }
        if (config.store_root.empty())
        {
            reject("--store is required");
        }
        if (config.inputs.empty())
        {
            reject("No files or folders given");
        }
        return config;
    }

    std::string usage(const std::string &program_name)
    {
        std::ostringstream out;
        out << "assetdrop " << assetdrop::version() << "\n"
            << "Usage: " << program_name
            << " --space <ID> --environment <ID> --store <DIR> [--token <TOKEN>] [--parallel <1-10>]\n"
               "       [--tag <NAME>] [--tag-from-folder] [--console-url <URL>] [--json <FILE>] [--log <FILE>]\n"
               "       [--verbose] <file-or-folder>...\n"
               "\n"
               "The access token may also be supplied through "
            << kTokenEnvironmentVariable << ".\n";
        return out.str();
    }

} // namespace assetdrop::client
