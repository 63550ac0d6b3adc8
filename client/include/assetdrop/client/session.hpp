#pragma once

#include <asio/io_context.hpp>
#include <asio/signal_set.hpp>
#include <asio/steady_timer.hpp>

#include <chrono>
#include <memory>
#include <ostream>
#include <thread>

#include "assetdrop/client/config.hpp"
#include "assetdrop/client/directory_store.hpp"
#include "assetdrop/engine/uploader.hpp"

namespace assetdrop::client
{

    /**
     * One invocation of the command-line tool: collects the input files,
     * uploads them to the directory store and reports the outcome.
     */
    class UploadSession
    {
    public:
        static constexpr std::chrono::milliseconds kStatusInterval{1000};

        UploadSession(ClientConfig config, std::ostream &out);
        ~UploadSession();

        UploadSession(const UploadSession &) = delete;
        UploadSession &operator=(const UploadSession &) = delete;

        // 0 when every file completed, 2 when some failed or were cancelled.
        // Batch-level errors propagate as UploadError.
        int run();

        engine::Uploader &uploader() noexcept { return uploader_; }

    private:
        void prepare_batch();
        void start_control_loop();
        void stop_control_loop();
        void wait_for_signal();
        void schedule_status();
        void print_status();
        void print_summary(const engine::RunSummary &summary);
        void write_report(const engine::RunSummary &summary) const;

        ClientConfig config_;
        std::ostream &out_;
        std::shared_ptr<DirectoryAssetStore> store_;
        engine::Uploader uploader_;

        asio::io_context control_;
        asio::signal_set signals_;
        asio::steady_timer status_timer_;
        std::thread control_thread_;
    };

} // namespace assetdrop::client
