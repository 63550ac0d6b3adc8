#include "assetdrop/engine/report.hpp"

#include <string>

namespace assetdrop::engine
{

    namespace
    {

        std::int64_t to_unix_millis(TimePoint time)
        {
            return std::chrono::duration_cast<std::chrono::milliseconds>(time.time_since_epoch()).count();
        }

        template <typename T>
        void put_optional(nlohmann::json &json, const char *key, const std::optional<T> &value)
        {
            if (value)
            {
                json[key] = *value;
            }
            else
            {
                json[key] = nullptr;
            }
        }

        void put_time(nlohmann::json &json, const char *key, const std::optional<TimePoint> &value)
        {
            if (value)
            {
                json[key] = to_unix_millis(*value);
            }
            else
            {
                json[key] = nullptr;
            }
        }

    } // namespace

    void to_json(nlohmann::json &json, const AssetResult &result)
    {
        json = nlohmann::json{
            {"asset_id", result.asset_id},
            {"asset_url", result.asset_url},
            {"console_url", result.console_url},
        };
    }

    void to_json(nlohmann::json &json, const TaskSnapshot &task)
    {
        json = nlohmann::json{
            {"id", task.id},
            {"file_name", task.file_name},
            {"size", task.size},
            {"content_type", task.content_type},
            {"status", std::string(to_string(task.status))},
            {"progress", task.progress},
        };
        put_optional(json, "error", task.error);
        put_optional(json, "result", task.result);
        put_time(json, "start_time", task.start_time);
        put_time(json, "end_time", task.end_time);
        put_optional(json, "upload_speed", task.upload_speed);
    }

    void to_json(nlohmann::json &json, const BatchStats &stats)
    {
        json = nlohmann::json{
            {"total", stats.total},
            {"pending", stats.pending},
            {"processing", stats.processing},
            {"completed", stats.completed},
            {"failed", stats.failed},
            {"cancelled", stats.cancelled},
        };
    }

    void to_json(nlohmann::json &json, const RunSnapshot &run)
    {
        json = nlohmann::json{
            {"running", run.running},
            {"connecting", run.connecting},
            {"parallel_count", run.parallel_count},
            {"rate_limit_events", run.rate_limit_events},
        };
        put_time(json, "start_time", run.start_time);
        put_time(json, "end_time", run.end_time);
        put_time(json, "first_estimate", run.first_estimate);
    }

    void to_json(nlohmann::json &json, const RunSummary &summary)
    {
        json = nlohmann::json{
            {"completed", summary.completed},
            {"failed", summary.failed},
            {"cancelled", summary.cancelled},
            {"pending", summary.pending},
            {"cancel_requested", summary.cancel_requested},
            {"rate_limit_events", summary.rate_limit_events},
        };
        if (summary.duration)
        {
            json["duration_ms"] = summary.duration->count();
        }
        else
        {
            json["duration_ms"] = nullptr;
        }
    }

    nlohmann::json make_run_report(const RunSnapshot &run, const RunSummary &summary,
                                   const std::vector<TaskSnapshot> &tasks)
    {
        return nlohmann::json{
            {"run", run},
            {"summary", summary},
            {"tasks", tasks},
        };
    }

} // namespace assetdrop::engine
