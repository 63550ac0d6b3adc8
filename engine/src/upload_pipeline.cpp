#include "assetdrop/engine/upload_pipeline.hpp"

#include <fstream>
#include <vector>

#include <spdlog/spdlog.h>

#include "assetdrop/error_codes.hpp"

namespace assetdrop::engine
{

    namespace
    {

        constexpr int kProgressStarted = 10;
        constexpr int kProgressCreated = 50;
        constexpr int kProgressProcessed = 80;

        std::vector<std::byte> read_file_bytes(const FileSource &source)
        {
            std::ifstream in(source.path, std::ios::binary | std::ios::ate);
            if (!in.is_open())
            {
                throw UploadError(ErrorCode::FileIo, "Could not open local file: " + source.path.string());
            }
            const auto size = static_cast<std::size_t>(in.tellg());
            in.seekg(0);
            std::vector<std::byte> bytes(size);
            in.read(reinterpret_cast<char *>(bytes.data()), static_cast<std::streamsize>(size));
            if (!in)
            {
                throw UploadError(ErrorCode::FileIo, "Could not read local file: " + source.path.string());
            }
            return bytes;
        }

    } // namespace

    UploadPipeline::UploadPipeline(UploadBatch &batch, AssetStore &store, const CancellationToken &token,
                                   Credentials credentials, std::optional<TagHandle> tag,
                                   CompletionCallback on_completed)
        : batch_(batch),
          store_(store),
          token_(token),
          credentials_(std::move(credentials)),
          tag_(std::move(tag)),
          on_completed_(std::move(on_completed)) {}

    UploadStatus UploadPipeline::run(const std::string &task_id)
    {
        const auto source = batch_.source(task_id);
        if (!source)
        {
            spdlog::warn("Task {} left the batch before it was admitted", task_id);
            return UploadStatus::Cancelled;
        }
        const auto &file_name = source->identity.name;

        if (token_.is_cancelled())
        {
            return finish_cancelled(task_id);
        }
        if (!batch_.begin_processing(task_id, Clock::now()))
        {
            // Bulk cancel got there first.
            const auto current = batch_.find(task_id);
            return current ? current->status : UploadStatus::Cancelled;
        }

        try
        {
            if (cancelled_at(task_id, Checkpoint::BeforeCreate) || !report_progress(task_id, kProgressStarted))
            {
                return finish_cancelled(task_id);
            }

            const auto bytes = read_file_bytes(*source);
            auto asset = store_.create_asset(bytes, file_name, source->identity.content_type);
            if (cancelled_at(task_id, Checkpoint::AfterCreate) || !report_progress(task_id, kProgressCreated))
            {
                return finish_cancelled(task_id);
            }

            asset = store_.process_asset(asset);
            if (cancelled_at(task_id, Checkpoint::AfterProcess) || !report_progress(task_id, kProgressProcessed))
            {
                return finish_cancelled(task_id);
            }

            if (tag_)
            {
                asset = tag_best_effort(asset, file_name);
            }

            asset = store_.publish_asset(asset);
            if (cancelled_at(task_id, Checkpoint::AfterPublish))
            {
                return finish_cancelled(task_id);
            }

            AssetResult result{
                .asset_id = asset.id,
                .asset_url = normalize_asset_url(store_.asset_public_url(asset)),
                .console_url = store_.asset_console_url(asset, credentials_.space_id, credentials_.environment_id),
            };
            if (!batch_.complete(task_id, Clock::now(), std::move(result)))
            {
                return finish_cancelled(task_id);
            }
            spdlog::info("Uploaded {} as asset {}", file_name, asset.id);
            if (on_completed_)
            {
                on_completed_(task_id);
            }
            return UploadStatus::Completed;
        }
        catch (const std::exception &ex)
        {
            if (token_.is_cancelled())
            {
                return finish_cancelled(task_id);
            }
            return finish_failed(task_id, file_name, ex.what());
        }
    }

    bool UploadPipeline::cancelled_at(const std::string &task_id, Checkpoint checkpoint)
    {
        if (!token_.is_cancelled())
        {
            return false;
        }
        spdlog::debug("Task {} stopped at checkpoint '{}'", task_id, describe(checkpoint));
        return true;
    }

    std::string_view UploadPipeline::describe(Checkpoint checkpoint) noexcept
    {
        switch (checkpoint)
        {
        case Checkpoint::BeforeCreate:
            return "before create";
        case Checkpoint::AfterCreate:
            return "after create";
        case Checkpoint::AfterProcess:
            return "after process";
        case Checkpoint::AfterPublish:
            return "after publish";
        }
        return "unknown";
    }

    bool UploadPipeline::report_progress(const std::string &task_id, int progress)
    {
        if (token_.is_cancelled())
        {
            return false;
        }
        return batch_.update_progress(task_id, progress);
    }

    UploadStatus UploadPipeline::finish_cancelled(const std::string &task_id)
    {
        batch_.cancel(task_id, Clock::now());
        spdlog::debug("Task {} cancelled", task_id);
        const auto current = batch_.find(task_id);
        return current ? current->status : UploadStatus::Cancelled;
    }

    UploadStatus UploadPipeline::finish_failed(const std::string &task_id, const std::string &file_name,
                                               const std::string &error)
    {
        batch_.fail(task_id, Clock::now(), error);
        spdlog::warn("Upload of {} failed: {}", file_name, error);
        const auto current = batch_.find(task_id);
        return current ? current->status : UploadStatus::Failed;
    }

    AssetHandle UploadPipeline::tag_best_effort(const AssetHandle &asset, const std::string &file_name)
    {
        try
        {
            return store_.apply_tag(asset, *tag_);
        }
        catch (const AssetStoreError &ex)
        {
            spdlog::warn("Could not tag {} (asset {}) with '{}': {}; publishing untagged", file_name, asset.id,
                         tag_->name, ex.what());
            return asset;
        }
    }

} // namespace assetdrop::engine
