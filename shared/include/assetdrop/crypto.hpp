/**
 * assetdrop - Content digests and random identifiers built on libsodium.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <istream>
#include <span>
#include <string>

#include <sodium.h>

namespace assetdrop::crypto
{

    void ensure_sodium_init();

    // Incremental BLAKE2b digest rendered as lower-case hex.
    class ContentDigest
    {
    public:
        ContentDigest();

        void update(std::span<const std::byte> data);
        std::string finish();

    private:
        crypto_generichash_state state_{};
        bool finished_{false};
    };

    std::string hash_bytes(std::span<const std::byte> data);

    std::string hash_stream(std::istream &input);

    std::string hash_file(const std::filesystem::path &path);

    // Hex string of `length` characters drawn from the libsodium CSPRNG.
    std::string random_hex(std::size_t length);

} // namespace assetdrop::crypto
