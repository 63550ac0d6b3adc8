/**
 * assetdrop - Asset store backed by a local directory tree.
 *
 * <root>/spaces/<space>/environments/<env>/assets/<id>/{asset.json,<file>}
 * <root>/spaces/<space>/environments/<env>/tags.json
 */
#pragma once

#include <filesystem>
#include <mutex>
#include <string>

#include "assetdrop/engine/asset_store.hpp"

namespace assetdrop::client
{

    class DirectoryAssetStore final : public engine::AssetStore
    {
    public:
        DirectoryAssetStore(std::filesystem::path root, std::string console_base);

        bool reports_response_status() const noexcept override { return false; }

        void connect(const engine::Credentials &credentials) override;
        engine::AssetHandle create_asset(std::span<const std::byte> bytes, const std::string &file_name,
                                         const std::string &content_type) override;
        engine::AssetHandle process_asset(const engine::AssetHandle &asset) override;
        engine::AssetHandle apply_tag(const engine::AssetHandle &asset, const engine::TagHandle &tag) override;
        engine::AssetHandle publish_asset(const engine::AssetHandle &asset) override;
        engine::TagHandle find_or_create_tag(const std::string &name) override;

        std::string asset_public_url(const engine::AssetHandle &asset) const override;
        std::string asset_console_url(const engine::AssetHandle &asset, const std::string &space_id,
                                      const std::string &environment_id) const override;

        std::filesystem::path environment_directory() const;

    private:
        std::filesystem::path asset_directory(const std::string &asset_id) const;
        engine::AssetHandle load_asset_locked(const std::string &asset_id) const;
        // Loads the stored asset and rejects handles older than it.
        engine::AssetHandle load_current_locked(const engine::AssetHandle &asset) const;
        void ensure_connected_locked() const;

        std::filesystem::path root_;
        std::string console_base_;

        mutable std::mutex mutex_;
        std::filesystem::path environment_dir_;
    };

} // namespace assetdrop::client
