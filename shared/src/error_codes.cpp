#include "assetdrop/error_codes.hpp"

#include <array>

namespace assetdrop
{

    namespace
    {
        struct ErrorCodeDescription
        {
            ErrorCode code;
            std::string_view description;
        };

        constexpr std::array<ErrorCodeDescription, 7> kDescriptions{{
            {ErrorCode::Ok, "ok"},
            {ErrorCode::InvalidConfiguration, "invalid_configuration"},
            {ErrorCode::EmptyBatch, "empty_batch"},
            {ErrorCode::AlreadyRunning, "already_running"},
            {ErrorCode::ConnectionFailed, "connection_failed"},
            {ErrorCode::FileIo, "file_io"},
            {ErrorCode::InternalError, "internal_error"},
        }};
    } // namespace

    std::string_view to_string(ErrorCode code) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (entry.code == code)
            {
                return entry.description;
            }
        }
        return "unknown";
    }

    UploadError::UploadError(ErrorCode code, std::string message)
        : std::runtime_error(std::move(message)), code_(code) {}

} // namespace assetdrop
