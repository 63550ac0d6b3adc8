#include "assetdrop/client/directory_store.hpp"

#include <algorithm>
#include <fstream>
#include <vector>

#include <spdlog/common.h>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include "assetdrop/crypto.hpp"

namespace assetdrop::client
{

    namespace
    {
        constexpr auto kAssetsDir = "assets";
        constexpr auto kAssetMetadataFile = "asset.json";
        constexpr auto kTagsFile = "tags.json";
        constexpr std::size_t kAssetIdLength = 22;

        constexpr int kNotFound = 404;
        constexpr int kConflict = 409;
        constexpr int kUnprocessable = 422;
        constexpr int kServerError = 500;

        struct StoredAsset
        {
            engine::AssetHandle handle;
            std::uint64_t size{};
            std::string digest;
        };

        nlohmann::json asset_to_json(const StoredAsset &asset)
        {
            return {
                {"id", asset.handle.id},
                {"version", asset.handle.version},
                {"file_name", asset.handle.file_name},
                {"content_type", asset.handle.content_type},
                {"size", asset.size},
                {"digest", asset.digest},
                {"file_url", asset.handle.file_url},
                {"tags", asset.handle.tag_ids},
                {"processed", asset.handle.processed},
                {"published", asset.handle.published},
            };
        }

        StoredAsset asset_from_json(const nlohmann::json &json)
        {
            StoredAsset asset{};
            asset.handle.id = json.at("id").get<std::string>();
            asset.handle.version = json.value("version", 0ULL);
            asset.handle.file_name = json.at("file_name").get<std::string>();
            asset.handle.content_type = json.value("content_type", std::string{});
            asset.handle.file_url = json.value("file_url", std::string{});
            asset.handle.tag_ids = json.value("tags", std::vector<std::string>{});
            asset.handle.processed = json.value("processed", false);
            asset.handle.published = json.value("published", false);
            asset.size = json.value("size", 0ULL);
            asset.digest = json.value("digest", std::string{});
            return asset;
        }

        nlohmann::json read_json(const std::filesystem::path &path)
        {
            std::ifstream in(path);
            if (!in.is_open())
            {
                throw engine::AssetStoreError("Cannot open " + path.string(), kServerError);
            }
            try
            {
                nlohmann::json json;
                in >> json;
                return json;
            }
            catch (const nlohmann::json::exception &ex)
            {
                throw engine::AssetStoreError("Corrupt metadata in " + path.string() + ": " + ex.what(), kServerError);
            }
        }

        void write_json(const std::filesystem::path &path, const nlohmann::json &json)
        {
            const auto temp = path.string() + ".tmp";
            {
                std::ofstream out(temp, std::ios::trunc);
                if (!out.is_open())
                {
                    throw engine::AssetStoreError("Cannot write " + path.string(), kServerError);
                }
                out << json.dump(2);
            }
            std::error_code ec;
            std::filesystem::rename(temp, path, ec);
            if (ec)
            {
                throw engine::AssetStoreError("Cannot replace " + path.string() + ": " + ec.message(), kServerError);
            }
        }

        bool is_safe_segment(const std::string &segment)
        {
            return !segment.empty() && segment != "." && segment != ".." &&
                   segment.find_first_of("/\\") == std::string::npos;
        }

        std::string file_url(const std::filesystem::path &path)
        {
            return "file://" + std::filesystem::absolute(path).lexically_normal().generic_string();
        }

    } // namespace

    DirectoryAssetStore::DirectoryAssetStore(std::filesystem::path root, std::string console_base)
        : root_(std::move(root)), console_base_(std::move(console_base))
    {
        crypto::ensure_sodium_init();
    }

    void DirectoryAssetStore::connect(const engine::Credentials &credentials)
    {
        if (!credentials.complete())
        {
            throw engine::AssetStoreError("Access token, space and environment are required", 401);
        }
        if (!is_safe_segment(credentials.space_id) || !is_safe_segment(credentials.environment_id))
        {
            throw engine::AssetStoreError("Invalid space or environment id", kNotFound);
        }
        std::error_code ec;
        if (!std::filesystem::is_directory(root_, ec))
        {
            throw engine::AssetStoreError("Store directory not found: " + root_.string(), kNotFound);
        }

        auto environment = root_ / "spaces" / credentials.space_id / "environments" / credentials.environment_id;
        std::filesystem::create_directories(environment / kAssetsDir, ec);
        if (ec)
        {
            throw engine::AssetStoreError("Cannot prepare " + environment.string() + ": " + ec.message(), kServerError);
        }

        {
            std::lock_guard lock(mutex_);
            environment_dir_ = environment;
        }
        spdlog::debug("Connected to store at {}", environment.string());
        notify_log(engine::ClientLogLevel::Debug, "Connected to asset store");
    }

    engine::AssetHandle DirectoryAssetStore::create_asset(std::span<const std::byte> bytes, const std::string &file_name,
                                                          const std::string &content_type)
    {
        if (!is_safe_segment(file_name))
        {
            throw engine::AssetStoreError("Invalid file name: " + file_name, kUnprocessable);
        }

        StoredAsset asset{};
        asset.handle.file_name = file_name;
        asset.handle.content_type = content_type;
        asset.handle.version = 1;
        asset.size = bytes.size();
        asset.digest = crypto::hash_bytes(bytes);

        std::filesystem::path directory;
        {
            std::lock_guard lock(mutex_);
            ensure_connected_locked();
            // create_directory returns false for an id that is already taken.
            std::error_code ec;
            do
            {
                asset.handle.id = crypto::random_hex(kAssetIdLength);
                directory = asset_directory(asset.handle.id);
            } while (!std::filesystem::create_directory(directory, ec) && !ec);
            if (ec)
            {
                throw engine::AssetStoreError("Cannot reserve asset directory: " + ec.message(), kServerError);
            }
        }

        // The reserved directory belongs to this call alone, so the payload is written unlocked.
        {
            std::ofstream out(directory / file_name, std::ios::binary | std::ios::trunc);
            if (!out.is_open())
            {
                throw engine::AssetStoreError("Cannot store " + file_name, kServerError);
            }
            out.write(reinterpret_cast<const char *>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
            if (!out)
            {
                throw engine::AssetStoreError("Short write while storing " + file_name, kServerError);
            }
        }
        write_json(directory / kAssetMetadataFile, asset_to_json(asset));

        spdlog::debug("Created asset {} for {} ({} bytes)", asset.handle.id, file_name, asset.size);
        notify_log(engine::ClientLogLevel::Debug, "Stored asset payload");
        return asset.handle;
    }

    engine::AssetHandle DirectoryAssetStore::process_asset(const engine::AssetHandle &asset)
    {
        StoredAsset stored{};
        std::filesystem::path directory;
        {
            std::lock_guard lock(mutex_);
            load_current_locked(asset);
            directory = asset_directory(asset.id);
            stored = asset_from_json(read_json(directory / kAssetMetadataFile));
        }

        const auto file = directory / stored.handle.file_name;
        if (crypto::hash_file(file) != stored.digest)
        {
            spdlog::debug("Digest mismatch for asset {}", asset.id);
            notify_log(engine::ClientLogLevel::Error, "Stored payload failed its digest check");
            throw engine::AssetStoreError("Stored file is corrupt for asset " + asset.id, kUnprocessable);
        }

        std::lock_guard lock(mutex_);
        // Another writer may have moved the asset on while it was being hashed.
        load_current_locked(asset);
        stored.handle.file_url = file_url(file);
        stored.handle.processed = true;
        ++stored.handle.version;
        write_json(directory / kAssetMetadataFile, asset_to_json(stored));
        return stored.handle;
    }

    engine::AssetHandle DirectoryAssetStore::apply_tag(const engine::AssetHandle &asset, const engine::TagHandle &tag)
    {
        std::lock_guard lock(mutex_);
        load_current_locked(asset);

        const auto tags_path = environment_dir_ / kTagsFile;
        const auto tags = std::filesystem::exists(tags_path) ? read_json(tags_path) : nlohmann::json::object();
        if (!tags.contains(tag.id))
        {
            throw engine::AssetStoreError("Tag not found: " + tag.id, kNotFound);
        }

        auto stored = asset_from_json(read_json(asset_directory(asset.id) / kAssetMetadataFile));
        if (std::find(stored.handle.tag_ids.begin(), stored.handle.tag_ids.end(), tag.id) == stored.handle.tag_ids.end())
        {
            stored.handle.tag_ids.push_back(tag.id);
        }
        ++stored.handle.version;
        write_json(asset_directory(asset.id) / kAssetMetadataFile, asset_to_json(stored));
        return stored.handle;
    }

    engine::AssetHandle DirectoryAssetStore::publish_asset(const engine::AssetHandle &asset)
    {
        std::lock_guard lock(mutex_);
        load_current_locked(asset);

        auto stored = asset_from_json(read_json(asset_directory(asset.id) / kAssetMetadataFile));
        if (!stored.handle.processed)
        {
            throw engine::AssetStoreError("Asset " + asset.id + " has not been processed", kUnprocessable);
        }
        stored.handle.published = true;
        ++stored.handle.version;
        write_json(asset_directory(asset.id) / kAssetMetadataFile, asset_to_json(stored));
        spdlog::debug("Published asset {}", asset.id);
        notify_log(engine::ClientLogLevel::Info, "Published asset");
        return stored.handle;
    }

    engine::TagHandle DirectoryAssetStore::find_or_create_tag(const std::string &name)
    {
        const auto id = engine::make_tag_id(name);
        if (id.empty())
        {
            throw engine::AssetStoreError("Tag name '" + name + "' yields an empty id", kUnprocessable);
        }

        std::lock_guard lock(mutex_);
        ensure_connected_locked();
        const auto tags_path = environment_dir_ / kTagsFile;
        auto tags = std::filesystem::exists(tags_path) ? read_json(tags_path) : nlohmann::json::object();
        if (tags.contains(id))
        {
            return engine::TagHandle{.id = id, .name = tags.at(id).value("name", name)};
        }

        tags[id] = {{"name", name}};
        write_json(tags_path, tags);
        spdlog::debug("Created tag {} ({})", name, id);
        notify_log(engine::ClientLogLevel::Info, "Created tag");
        return engine::TagHandle{.id = id, .name = name};
    }

    std::string DirectoryAssetStore::asset_public_url(const engine::AssetHandle &asset) const
    {
        if (asset.file_url.empty())
        {
            throw engine::AssetStoreError("Asset file URL not found", kNotFound);
        }
        return asset.file_url;
    }

    std::string DirectoryAssetStore::asset_console_url(const engine::AssetHandle &asset, const std::string &space_id,
                                                       const std::string &environment_id) const
    {
        return engine::make_console_url(console_base_, space_id, environment_id, asset.id);
    }

    std::filesystem::path DirectoryAssetStore::environment_directory() const
    {
        std::lock_guard lock(mutex_);
        return environment_dir_;
    }

    std::filesystem::path DirectoryAssetStore::asset_directory(const std::string &asset_id) const
    {
        return environment_dir_ / kAssetsDir / asset_id;
    }

    engine::AssetHandle DirectoryAssetStore::load_asset_locked(const std::string &asset_id) const
    {
        ensure_connected_locked();
        if (!is_safe_segment(asset_id))
        {
            throw engine::AssetStoreError("Invalid asset id", kNotFound);
        }
        const auto path = asset_directory(asset_id) / kAssetMetadataFile;
        if (!std::filesystem::exists(path))
        {
            throw engine::AssetStoreError("Asset not found: " + asset_id, kNotFound);
        }
        return asset_from_json(read_json(path)).handle;
    }

    engine::AssetHandle DirectoryAssetStore::load_current_locked(const engine::AssetHandle &asset) const
    {
        auto stored = load_asset_locked(asset.id);
        if (stored.version != asset.version)
        {
            throw engine::AssetStoreError(spdlog::fmt_lib::format("Version mismatch for asset {}: expected {}, got {}", asset.id,
                                                      stored.version, asset.version),
                                          kConflict);
        }
        return stored;
    }

    void DirectoryAssetStore::ensure_connected_locked() const
    {
        if (environment_dir_.empty())
        {
            throw engine::AssetStoreError("Store is not connected", 401);
        }
    }

} // namespace assetdrop::client
