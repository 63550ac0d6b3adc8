#include <cstdlib>
#include <iostream>

#include "assetdrop/client/config.hpp"
#include "assetdrop/client/logger.hpp"
#include "assetdrop/client/session.hpp"
#include "assetdrop/error_codes.hpp"

int main(int argc, char *argv[])
{
    using assetdrop::client::parse_arguments;
    using assetdrop::client::UploadSession;

    try
    {
        const auto config = parse_arguments(argc, argv);
        if (config.show_help)
        {
            std::cout << assetdrop::client::usage(argv[0]);
            return EXIT_SUCCESS;
        }
        assetdrop::client::configure_logging(config.log_path, config.verbose);
        UploadSession session(config, std::cout);
        return session.run();
    }
    catch (const assetdrop::UploadError &ex)
    {
        std::cerr << "ERROR: " << assetdrop::to_string(ex.code()) << ": " << ex.what() << std::endl;
        if (ex.code() == assetdrop::ErrorCode::InvalidConfiguration)
        {
            std::cerr << assetdrop::client::usage(argv[0]);
        }
        return EXIT_FAILURE;
    }
    catch (const std::exception &ex)
    {
        std::cerr << "ERROR: " << assetdrop::to_string(assetdrop::ErrorCode::InternalError) << ": " << ex.what()
                  << std::endl;
        return EXIT_FAILURE;
    }
}
