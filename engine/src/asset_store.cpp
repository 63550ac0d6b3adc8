#include "assetdrop/engine/asset_store.hpp"

#include <cctype>

namespace assetdrop::engine
{

    AssetStoreError::AssetStoreError(const std::string &message, std::optional<int> http_status)
        : std::runtime_error(message), http_status_(http_status) {}

    void AssetStore::attach_observer(AssetStoreObserver &observer)
    {
        AssetStoreObserver *expected = nullptr;
        if (!observer_.compare_exchange_strong(expected, &observer, std::memory_order_acq_rel) && expected != &observer)
        {
            throw std::logic_error("Asset store already has an observer attached");
        }
    }

    void AssetStore::detach_observer(const AssetStoreObserver &observer) noexcept
    {
        auto *expected = const_cast<AssetStoreObserver *>(&observer);
        observer_.compare_exchange_strong(expected, nullptr, std::memory_order_acq_rel);
    }

    bool AssetStore::has_observer() const noexcept
    {
        return observer_.load(std::memory_order_acquire) != nullptr;
    }

    void AssetStore::notify_response(const ResponseInfo &response) const
    {
        if (auto *observer = observer_.load(std::memory_order_acquire))
        {
            observer->on_response(response);
        }
    }

    void AssetStore::notify_log(ClientLogLevel level, std::string_view message) const
    {
        if (auto *observer = observer_.load(std::memory_order_acquire))
        {
            observer->on_client_log(level, message);
        }
    }

    std::string_view to_string(ClientLogLevel level) noexcept
    {
        switch (level)
        {
        case ClientLogLevel::Debug:
            return "debug";
        case ClientLogLevel::Info:
            return "info";
        case ClientLogLevel::Warning:
            return "warning";
        case ClientLogLevel::Error:
            return "error";
        }
        return "unknown";
    }

    std::string make_tag_id(std::string_view name)
    {
        std::string id;
        id.reserve(name.size());
        for (const auto raw : name)
        {
            const auto ch = static_cast<char>(std::tolower(static_cast<unsigned char>(raw)));
            const bool allowed = (ch >= 'a' && ch <= 'z') || (ch >= '0' && ch <= '9') || ch == '-';
            const char out = allowed ? ch : '-';
            if (out == '-' && !id.empty() && id.back() == '-')
            {
                continue;
            }
            id.push_back(out);
        }
        const auto begin = id.find_first_not_of('-');
        if (begin == std::string::npos)
        {
            return "";
        }
        const auto end = id.find_last_not_of('-');
        return id.substr(begin, end - begin + 1);
    }

    std::string normalize_asset_url(std::string_view url)
    {
        if (url.starts_with("//"))
        {
            return "https:" + std::string(url);
        }
        return std::string(url);
    }

    std::string make_console_url(std::string_view base, std::string_view space_id, std::string_view environment_id,
                                 std::string_view asset_id)
    {
        std::string url(base);
        while (!url.empty() && url.back() == '/')
        {
            url.pop_back();
        }
        url += "/spaces/";
        url += space_id;
        url += "/environments/";
        url += environment_id;
        url += "/assets/";
        url += asset_id;
        return url;
    }

} // namespace assetdrop::engine
