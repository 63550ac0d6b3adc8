/**
 * assetdrop - JSON serialization of task and run snapshots.
 */
#pragma once

#include <vector>

#include <nlohmann/json.hpp>

#include "assetdrop/engine/upload_batch.hpp"
#include "assetdrop/engine/upload_task.hpp"
#include "assetdrop/engine/uploader.hpp"

namespace assetdrop::engine
{

    void to_json(nlohmann::json &json, const AssetResult &result);

    void to_json(nlohmann::json &json, const TaskSnapshot &task);

    void to_json(nlohmann::json &json, const BatchStats &stats);

    void to_json(nlohmann::json &json, const RunSnapshot &run);

    void to_json(nlohmann::json &json, const RunSummary &summary);

    nlohmann::json make_run_report(const RunSnapshot &run, const RunSummary &summary,
                                   const std::vector<TaskSnapshot> &tasks);

} // namespace assetdrop::engine
