/**
 * assetdrop - Error taxonomy shared by the engine and the command-line client.
 */
#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace assetdrop
{

    enum class ErrorCode : std::uint16_t
    {
        Ok = 0,
        InvalidConfiguration = 1,
        EmptyBatch = 2,
        AlreadyRunning = 3,
        ConnectionFailed = 4,
        FileIo = 5,
        InternalError = 6
    };

    std::string_view to_string(ErrorCode code) noexcept;

    // Raised for batch-level failures: bad configuration or a failed connection.
    class UploadError : public std::runtime_error
    {
    public:
        UploadError(ErrorCode code, std::string message);

        ErrorCode code() const noexcept { return code_; }

    private:
        ErrorCode code_;
    };

} // namespace assetdrop
