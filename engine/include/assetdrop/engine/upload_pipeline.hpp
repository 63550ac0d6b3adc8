#pragma once

#include <functional>
#include <optional>
#include <string>
#include <string_view>

#include "assetdrop/engine/asset_store.hpp"
#include "assetdrop/engine/cancellation.hpp"
#include "assetdrop/engine/upload_batch.hpp"

namespace assetdrop::engine
{

    /**
     * Drives one admitted task through create -> process -> [tag] -> publish.
     *
     * The token is consulted on admission, before creating the asset, after
     * creating it, after processing it, after publishing it and whenever
     * progress is reported. Failures never leave run(); they end up on the
     * task as `failed`, or as `cancelled` when the token was already signalled.
     */
    class UploadPipeline
    {
    public:
        using CompletionCallback = std::function<void(const std::string &task_id)>;

        UploadPipeline(UploadBatch &batch, AssetStore &store, const CancellationToken &token, Credentials credentials,
                       std::optional<TagHandle> tag, CompletionCallback on_completed = {});

        UploadStatus run(const std::string &task_id);

    private:
        enum class Checkpoint
        {
            BeforeCreate,
            AfterCreate,
            AfterProcess,
            AfterPublish
        };

        static std::string_view describe(Checkpoint checkpoint) noexcept;
        bool cancelled_at(const std::string &task_id, Checkpoint checkpoint);
        bool report_progress(const std::string &task_id, int progress);
        UploadStatus finish_cancelled(const std::string &task_id);
        UploadStatus finish_failed(const std::string &task_id, const std::string &file_name, const std::string &error);
        AssetHandle tag_best_effort(const AssetHandle &asset, const std::string &file_name);

        UploadBatch &batch_;
        AssetStore &store_;
        const CancellationToken &token_;
        Credentials credentials_;
        std::optional<TagHandle> tag_;
        CompletionCallback on_completed_;
    };

} // namespace assetdrop::engine
