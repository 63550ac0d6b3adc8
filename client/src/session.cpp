#include "assetdrop/client/session.hpp"

#include <asio/post.hpp>

#include <csignal>
#include <fstream>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "assetdrop/client/file_collector.hpp"
#include "assetdrop/client/format.hpp"
#include "assetdrop/engine/report.hpp"
#include "assetdrop/error_codes.hpp"

namespace assetdrop::client
{

    UploadSession::UploadSession(ClientConfig config, std::ostream &out)
        : config_(std::move(config)),
          out_(out),
          store_(std::make_shared<DirectoryAssetStore>(config_.store_root, config_.console_base)),
          uploader_(store_, engine::UploaderOptions{.parallel_count = config_.parallel_count,
                                                    .tag_name = config_.tag_name}),
          signals_(control_),
          status_timer_(control_) {}

    UploadSession::~UploadSession()
    {
        stop_control_loop();
    }

    int UploadSession::run()
    {
        prepare_batch();

        const engine::Credentials credentials{
            .space_id = config_.space_id,
            .environment_id = config_.environment_id,
            .token = config_.token,
        };

        start_control_loop();
        const auto summary = uploader_.run(credentials);
        stop_control_loop();

        print_summary(summary);
        if (config_.json_report)
        {
            write_report(summary);
        }

        const bool all_completed = summary.failed == 0 && summary.cancelled == 0 && summary.pending == 0;
        return all_completed ? 0 : 2;
    }

    void UploadSession::prepare_batch()
    {
        auto collected = collect_files(config_.inputs);
        for (const auto &missing : collected.missing)
        {
            spdlog::warn("Skipping {}: not a file or folder", missing.string());
        }
        if (collected.skipped_nested > 0)
        {
            spdlog::warn("Skipped {} file(s) inside nested folders; only top-level files are uploaded",
                         collected.skipped_nested);
        }

        if (config_.tag_from_folder && !config_.tag_name && collected.folder_name)
        {
            spdlog::info("Tagging uploads with folder name '{}'", *collected.folder_name);
            uploader_.set_tag_name(collected.folder_name);
        }

        const auto added = uploader_.add_files(collected.files);
        spdlog::info("Queued {} file(s) for upload", added);
    }

    void UploadSession::start_control_loop()
    {
        signals_.add(SIGINT);
        signals_.add(SIGTERM);
        wait_for_signal();
        schedule_status();
        control_thread_ = std::thread([this]
                                      { control_.run(); });
    }

    void UploadSession::stop_control_loop()
    {
        if (!control_thread_.joinable())
        {
            return;
        }
        asio::post(control_, [this]
                   {
            std::error_code ec;
            signals_.cancel(ec);
            signals_.clear(ec);
            status_timer_.cancel(); });
        control_thread_.join();
        out_ << '\n';
    }

    void UploadSession::wait_for_signal()
    {
        signals_.async_wait([this](const std::error_code &ec, int signal)
                            {
            if (ec)
            {
                return;
            }
            spdlog::info("Received signal {}, cancelling uploads", signal);
            uploader_.cancel();
            wait_for_signal(); });
    }

    void UploadSession::schedule_status()
    {
        status_timer_.expires_after(kStatusInterval);
        status_timer_.async_wait([this](const std::error_code &ec)
                                 {
            if (ec)
            {
                return;
            }
            print_status();
            schedule_status(); });
    }

    void UploadSession::print_status()
    {
        const auto stats = uploader_.stats();
        const auto run = uploader_.run_snapshot();
        if (run.connecting)
        {
            out_ << "\rConnecting..." << std::flush;
            return;
        }

        out_ << "\r" << stats.completed << "/" << stats.total << " completed, " << stats.failed << " failed, "
             << stats.processing << " uploading, " << stats.pending << " queued";
        if (const auto eta = uploader_.projected_completion())
        {
            out_ << " | ETA " << format_clock(*eta);
        }
        if (run.rate_limit_events > 0)
        {
            out_ << " | throttled " << run.rate_limit_events << "x";
        }
        out_ << std::flush;
    }

    void UploadSession::print_summary(const engine::RunSummary &summary)
    {
        for (const auto &task : uploader_.tasks())
        {
            out_ << "  [" << engine::to_string(task.status) << "] " << task.file_name << " ("
                 << format_bytes(task.size);
            if (task.upload_speed)
            {
                out_ << ", " << format_speed(*task.upload_speed);
            }
            out_ << ")";
            if (task.error)
            {
                out_ << " - " << *task.error;
            }
            out_ << '\n';
            if (task.result)
            {
                out_ << "      " << task.result->asset_url << '\n'
                     << "      " << task.result->console_url << '\n';
            }
        }

        out_ << summary.completed << " completed, " << summary.failed << " failed, " << summary.cancelled
             << " cancelled";
        if (summary.duration)
        {
            out_ << " in " << format_duration(*summary.duration);
        }
        out_ << '\n';

        const auto run = uploader_.run_snapshot();
        if (run.first_estimate)
        {
            out_ << "First completion estimate: " << format_clock(*run.first_estimate) << '\n';
        }
        if (summary.rate_limit_events > 0)
        {
            out_ << "Rate limited " << summary.rate_limit_events << " time(s)\n";
        }
        if (summary.cancel_requested)
        {
            out_ << "Upload cancelled\n";
        }
    }

    void UploadSession::write_report(const engine::RunSummary &summary) const
    {
        const auto report = engine::make_run_report(uploader_.run_snapshot(), summary, uploader_.tasks());
        std::ofstream file(*config_.json_report, std::ios::trunc);
        if (!file.is_open())
        {
            throw UploadError(ErrorCode::FileIo, "Cannot write report to " + config_.json_report->string());
        }
        file << report.dump(2) << '\n';
        spdlog::info("Wrote run report to {}", config_.json_report->string());
    }

} // namespace assetdrop::client
