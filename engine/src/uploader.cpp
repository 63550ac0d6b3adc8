#include "assetdrop/engine/uploader.hpp"

#include <algorithm>
#include <stdexcept>
#include <thread>

#include <asio/io_context.hpp>
#include <spdlog/spdlog.h>

#include "assetdrop/engine/cancellation.hpp"
#include "assetdrop/engine/eta_estimator.hpp"
#include "assetdrop/engine/upload_gate.hpp"
#include "assetdrop/engine/upload_pipeline.hpp"
#include "assetdrop/error_codes.hpp"

namespace assetdrop::engine
{

    namespace
    {

        std::string trim(const std::string &input)
        {
            const auto begin = input.find_first_not_of(" \t\r\n");
            if (begin == std::string::npos)
            {
                return "";
            }
            const auto end = input.find_last_not_of(" \t\r\n");
            return input.substr(begin, end - begin + 1);
        }

    } // namespace

    struct Uploader::Run
    {
        explicit Run(std::size_t parallel)
            : io_context(static_cast<int>(parallel)),
              gate(io_context.get_executor(), parallel),
              parallel_count(parallel) {}

        asio::io_context io_context;
        CancellationToken token;
        UploadGate gate;
        std::size_t parallel_count;
    };

    std::size_t clamp_parallel_count(long long requested) noexcept
    {
        const auto low = static_cast<long long>(UploaderOptions::kMinParallel);
        const auto high = static_cast<long long>(UploaderOptions::kMaxParallel);
        return static_cast<std::size_t>(std::clamp(requested, low, high));
    }

    Uploader::Uploader(std::shared_ptr<AssetStore> store, UploaderOptions options)
        : store_(std::move(store)), options_(std::move(options))
    {
        if (!store_)
        {
            throw std::invalid_argument("Uploader requires an asset store");
        }
        options_.parallel_count = clamp_parallel_count(static_cast<long long>(options_.parallel_count));
        rate_limits_.set_detection(store_->reports_response_status() ? RateLimitMonitor::Detection::ResponseStatus
                                                                     : RateLimitMonitor::Detection::LogMessage);
        store_->attach_observer(rate_limits_);
    }

    Uploader::~Uploader()
    {
        store_->detach_observer(rate_limits_);
    }

    std::size_t Uploader::add_files(const std::vector<FileSource> &sources)
    {
        ensure_idle("add files");
        const auto added = batch_.add(sources);
        if (added < sources.size())
        {
            spdlog::debug("Skipped {} file(s) already in the batch", sources.size() - added);
        }
        return added;
    }

    bool Uploader::remove_file(const std::string &id)
    {
        ensure_idle("remove files");
        return batch_.remove(id);
    }

    void Uploader::clear_files()
    {
        ensure_idle("clear files");
        batch_.clear();
    }

    void Uploader::set_parallel_count(long long requested)
    {
        std::lock_guard lock(mutex_);
        options_.parallel_count = clamp_parallel_count(requested);
    }

    std::size_t Uploader::parallel_count() const
    {
        std::lock_guard lock(mutex_);
        return options_.parallel_count;
    }

    void Uploader::set_tag_name(std::optional<std::string> tag_name)
    {
        std::lock_guard lock(mutex_);
        options_.tag_name = std::move(tag_name);
    }

    RunSummary Uploader::run(const Credentials &credentials)
    {
        std::shared_ptr<Run> run;
        std::optional<std::string> tag_name;
        std::vector<std::string> task_ids;
        {
            std::lock_guard lock(mutex_);
            if (current_run_)
            {
                throw UploadError(ErrorCode::AlreadyRunning, "An upload is already running");
            }
            validate(credentials, options_.tag_name);
            tag_name = options_.tag_name;
            task_ids = batch_.pending_in_run_order();
            run = std::make_shared<Run>(options_.parallel_count);
            current_run_ = run;
            connecting_ = true;
            run_parallel_count_ = run->parallel_count;
            start_time_ = Clock::now();
            end_time_.reset();
            first_estimate_.reset();
        }
        rate_limits_.reset();

        spdlog::info("Starting upload of {} file(s) with {} parallel slot(s)", task_ids.size(), run->parallel_count);

        try
        {
            store_->connect(credentials);
        }
        catch (const std::exception &ex)
        {
            spdlog::error("Connection to space {} / environment {} failed: {}", credentials.space_id,
                          credentials.environment_id, ex.what());
            finish_run();
            throw UploadError(ErrorCode::ConnectionFailed, std::string("Connection failed: ") + ex.what());
        }

        try
        {
            {
                std::lock_guard lock(mutex_);
                connecting_ = false;
            }
            spdlog::info("Connected to space {} / environment {}", credentials.space_id, credentials.environment_id);

            std::optional<TagHandle> tag;
            if (!run->token.is_cancelled())
            {
                tag = resolve_tag(tag_name);
            }
            execute(*run, task_ids, credentials, tag);
        }
        catch (...)
        {
            finish_run();
            throw;
        }
        finish_run();

        RunSummary summary{};
        for (const auto &id : task_ids)
        {
            const auto snapshot = batch_.find(id);
            if (!snapshot)
            {
                continue;
            }
            switch (snapshot->status)
            {
            case UploadStatus::Completed:
                ++summary.completed;
                break;
            case UploadStatus::Failed:
                ++summary.failed;
                break;
            case UploadStatus::Cancelled:
                ++summary.cancelled;
                break;
            case UploadStatus::Pending:
            case UploadStatus::Processing:
                ++summary.pending;
                break;
            }
        }
        summary.cancel_requested = run->token.is_cancelled();
        summary.duration = session_duration();
        summary.rate_limit_events = rate_limits_.count();

        spdlog::info("Run finished: {} completed, {} failed, {} cancelled, {} throttled request(s)", summary.completed,
                     summary.failed, summary.cancelled, summary.rate_limit_events);
        return summary;
    }

    bool Uploader::cancel()
    {
        std::shared_ptr<Run> run;
        {
            std::lock_guard lock(mutex_);
            run = current_run_;
        }
        if (!run)
        {
            return false;
        }
        if (run->token.request())
        {
            const auto cancelled = batch_.cancel_unfinished(Clock::now());
            spdlog::info("Cancellation requested; {} unfinished upload(s) cancelled", cancelled);
        }
        return true;
    }

    std::vector<TaskSnapshot> Uploader::tasks() const
    {
        return batch_.snapshot();
    }

    std::optional<TaskSnapshot> Uploader::task(const std::string &id) const
    {
        return batch_.find(id);
    }

    BatchStats Uploader::stats() const
    {
        return batch_.stats();
    }

    RunSnapshot Uploader::run_snapshot() const
    {
        std::lock_guard lock(mutex_);
        return RunSnapshot{
            .running = current_run_ != nullptr,
            .connecting = connecting_,
            .parallel_count = current_run_ ? run_parallel_count_ : options_.parallel_count,
            .start_time = start_time_,
            .end_time = end_time_,
            .first_estimate = first_estimate_,
            .rate_limit_events = rate_limits_.count(),
        };
    }

    std::optional<TimePoint> Uploader::projected_completion(TimePoint now) const
    {
        std::size_t parallel = 0;
        {
            std::lock_guard lock(mutex_);
            if (!current_run_)
            {
                return std::nullopt;
            }
            parallel = run_parallel_count_;
        }
        return engine::projected_completion(batch_.snapshot(), parallel, now);
    }

    std::optional<std::chrono::milliseconds> Uploader::session_duration(TimePoint now) const
    {
        std::lock_guard lock(mutex_);
        return engine::session_duration(start_time_, end_time_, now);
    }

    void Uploader::ensure_idle(const char *operation) const
    {
        std::lock_guard lock(mutex_);
        if (current_run_)
        {
            throw UploadError(ErrorCode::AlreadyRunning, std::string("Cannot ") + operation +
                                                             " while an upload is running");
        }
    }

    void Uploader::validate(const Credentials &credentials, const std::optional<std::string> &tag_name) const
    {
        if (!credentials.complete())
        {
            throw UploadError(ErrorCode::InvalidConfiguration,
                              "Missing credentials: space, environment and token are required");
        }
        if (batch_.empty())
        {
            throw UploadError(ErrorCode::EmptyBatch, "No files to upload");
        }
        if (tag_name && trim(*tag_name).empty())
        {
            throw UploadError(ErrorCode::InvalidConfiguration, "Enter a tag name or disable tagging before uploading");
        }
    }

    std::optional<TagHandle> Uploader::resolve_tag(const std::optional<std::string> &tag_name)
    {
        if (!tag_name)
        {
            return std::nullopt;
        }
        const auto name = trim(*tag_name);
        try
        {
            auto tag = store_->find_or_create_tag(name);
            spdlog::info("Tagging uploads with '{}' ({})", tag.name, tag.id);
            return tag;
        }
        catch (const std::exception &ex)
        {
            spdlog::warn("Failed to find or create tag '{}': {}; uploading untagged", name, ex.what());
            return std::nullopt;
        }
    }

    void Uploader::execute(Run &run, const std::vector<std::string> &task_ids, const Credentials &credentials,
                           const std::optional<TagHandle> &tag)
    {
        const auto parallel = run.parallel_count;
        UploadPipeline pipeline(batch_, *store_, run.token, credentials, tag,
                                [this, parallel](const std::string &)
                                { capture_first_estimate(parallel); });

        // Admission follows creation order.
        for (const auto &id : task_ids)
        {
            run.gate.async_acquire([&pipeline, id](UploadGate::Permit permit)
                                   {
                pipeline.run(id);
                permit.release(); });
        }

        std::vector<std::thread> workers;
        workers.reserve(parallel > 0 ? parallel - 1 : 0);
        for (std::size_t i = 1; i < parallel; ++i)
        {
            workers.emplace_back([&run]
                                 { run.io_context.run(); });
        }
        run.io_context.run();

        for (auto &worker : workers)
        {
            if (worker.joinable())
            {
                worker.join();
            }
        }
    }

    void Uploader::capture_first_estimate(std::size_t parallel_count)
    {
        const auto estimate = engine::projected_completion(batch_.snapshot(), parallel_count, Clock::now());
        if (!estimate)
        {
            return;
        }
        std::lock_guard lock(mutex_);
        if (!first_estimate_)
        {
            first_estimate_ = estimate;
        }
    }

    void Uploader::finish_run()
    {
        std::lock_guard lock(mutex_);
        end_time_ = Clock::now();
        connecting_ = false;
        current_run_.reset();
    }

} // namespace assetdrop::engine
