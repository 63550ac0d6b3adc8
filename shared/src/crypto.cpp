#include "assetdrop/crypto.hpp"

#include <array>
#include <fstream>
#include <stdexcept>
#include <vector>

namespace assetdrop::crypto
{

    namespace
    {
        constexpr std::size_t kReadChunk = 64 * 1024;

        std::string hex_encode(std::span<const unsigned char> data)
        {
            std::string hex(data.size() * 2 + 1, '\0');
            sodium_bin2hex(hex.data(), hex.size(), data.data(), data.size());
            hex.pop_back();
            return hex;
        }

    } // namespace

    void ensure_sodium_init()
    {
        static const int status = sodium_init();
        if (status < 0)
        {
            throw std::runtime_error("libsodium initialization failed");
        }
    }

    ContentDigest::ContentDigest()
    {
        ensure_sodium_init();
        if (crypto_generichash_init(&state_, nullptr, 0, crypto_generichash_BYTES) != 0)
        {
            throw std::runtime_error("crypto_generichash_init failed");
        }
    }

    void ContentDigest::update(std::span<const std::byte> data)
    {
        if (finished_)
        {
            throw std::logic_error("ContentDigest already finished");
        }
        if (data.empty())
        {
            return;
        }
        if (crypto_generichash_update(&state_, reinterpret_cast<const unsigned char *>(data.data()), data.size()) != 0)
        {
            throw std::runtime_error("crypto_generichash_update failed");
        }
    }

    std::string ContentDigest::finish()
    {
        if (finished_)
        {
            throw std::logic_error("ContentDigest already finished");
        }
        std::array<unsigned char, crypto_generichash_BYTES> digest{};
        if (crypto_generichash_final(&state_, digest.data(), digest.size()) != 0)
        {
            throw std::runtime_error("crypto_generichash_final failed");
        }
        finished_ = true;
        return hex_encode(digest);
    }

    std::string hash_bytes(std::span<const std::byte> data)
    {
        ContentDigest digest;
        digest.update(data);
        return digest.finish();
    }

    std::string hash_stream(std::istream &input)
    {
        ContentDigest digest;
        std::vector<std::byte> buffer(kReadChunk);
        while (input)
        {
            input.read(reinterpret_cast<char *>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
            digest.update(std::span<const std::byte>(buffer.data(), static_cast<std::size_t>(input.gcount())));
        }
        if (input.bad())
        {
            throw std::runtime_error("Read error while hashing");
        }
        return digest.finish();
    }

    std::string hash_file(const std::filesystem::path &path)
    {
        std::ifstream file(path, std::ios::binary);
        if (!file.is_open())
        {
            throw std::runtime_error("Failed to open file for hashing: " + path.string());
        }
        return hash_stream(file);
    }

    std::string random_hex(std::size_t length)
    {
        ensure_sodium_init();
        std::vector<unsigned char> bytes((length + 1) / 2);
        randombytes_buf(bytes.data(), bytes.size());
        auto hex = hex_encode(bytes);
        hex.resize(length);
        return hex;
    }

} // namespace assetdrop::crypto
