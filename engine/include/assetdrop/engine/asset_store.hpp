/**
 * assetdrop - Contract of the remote asset store the engine uploads to.
 *
 * Implementations own their network retries. Every operation reports failure
 * by throwing AssetStoreError. Diagnostics reach the engine only through the
 * observer attached with attach_observer(); a store serves one observer at a
 * time.
 */
#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace assetdrop::engine
{

    struct Credentials
    {
        std::string space_id;
        std::string environment_id;
        std::string token;

        bool complete() const noexcept
        {
            return !space_id.empty() && !environment_id.empty() && !token.empty();
        }
    };

    struct AssetHandle
    {
        std::string id;
        std::uint64_t version{};
        std::string file_name;
        std::string content_type;
        std::string file_url;
        std::vector<std::string> tag_ids;
        bool processed{};
        bool published{};
    };

    struct TagHandle
    {
        std::string id;
        std::string name;
    };

    enum class ClientLogLevel : std::uint8_t
    {
        Debug,
        Info,
        Warning,
        Error
    };

    struct ResponseInfo
    {
        int status{};
        std::string method;
        std::string url;
    };

    class AssetStoreError : public std::runtime_error
    {
    public:
        explicit AssetStoreError(const std::string &message, std::optional<int> http_status = std::nullopt);

        std::optional<int> http_status() const noexcept { return http_status_; }

    private:
        std::optional<int> http_status_;
    };

    class AssetStoreObserver
    {
    public:
        virtual ~AssetStoreObserver() = default;

        // Every HTTP response the store receives, retried ones included.
        virtual void on_response(const ResponseInfo &response) = 0;
        // Messages from the store's internal logging.
        virtual void on_client_log(ClientLogLevel level, std::string_view message) = 0;
    };

    class AssetStore
    {
    public:
        virtual ~AssetStore() = default;

        // Throws std::logic_error when another observer is already attached.
        void attach_observer(AssetStoreObserver &observer);
        // Clears the observer only if it is the given one.
        void detach_observer(const AssetStoreObserver &observer) noexcept;
        bool has_observer() const noexcept;

        // True when the store calls on_response for its HTTP traffic.
        virtual bool reports_response_status() const noexcept = 0;

        virtual void connect(const Credentials &credentials) = 0;
        virtual AssetHandle create_asset(std::span<const std::byte> bytes, const std::string &file_name,
                                         const std::string &content_type) = 0;
        // May poll internally until processing finishes.
        virtual AssetHandle process_asset(const AssetHandle &asset) = 0;
        virtual AssetHandle apply_tag(const AssetHandle &asset, const TagHandle &tag) = 0;
        virtual AssetHandle publish_asset(const AssetHandle &asset) = 0;
        virtual TagHandle find_or_create_tag(const std::string &name) = 0;

        virtual std::string asset_public_url(const AssetHandle &asset) const = 0;
        virtual std::string asset_console_url(const AssetHandle &asset, const std::string &space_id,
                                              const std::string &environment_id) const = 0;

    protected:
        void notify_response(const ResponseInfo &response) const;
        void notify_log(ClientLogLevel level, std::string_view message) const;

    private:
        std::atomic<AssetStoreObserver *> observer_{nullptr};
    };

    std::string_view to_string(ClientLogLevel level) noexcept;

    // "My Tag / 2024" -> "my-tag-2024"
    std::string make_tag_id(std::string_view name);

    // Protocol-relative URLs ("//host/x") become https; anything else is kept.
    std::string normalize_asset_url(std::string_view url);

    std::string make_console_url(std::string_view base, std::string_view space_id, std::string_view environment_id,
                                 std::string_view asset_id);

} // namespace assetdrop::engine
