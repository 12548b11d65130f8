#include "task/task_info.hpp"

#include <date/date.h>

const char* toString(IndexState state) {
    switch (state) {
        case IndexState::None:       return "IndexStateNone";
        case IndexState::Unissued:   return "Unissued";
        case IndexState::InProgress: return "InProgress";
        case IndexState::Finished:   return "Finished";
        case IndexState::Failed:     return "Failed";
        case IndexState::Retry:      return "Retry";
    }
    return "Unknown";
}

std::string formatTime(std::chrono::system_clock::time_point tp) {
    return date::format("%F %T", date::floor<std::chrono::seconds>(tp));
}

void to_json(nlohmann::json& j, const JobInfo& info) {
    nlohmann::json params = nlohmann::json::object();
    for (const auto& [k, v] : info.IndexParams) params[k] = v;
    j = nlohmann::json{
        {"num_rows",     info.NumRows},
        {"dim",          info.Dim},
        {"start_time",   info.StartTime},
        {"end_time",     info.EndTime},
        {"index_params", params},
        {"pod_id",       info.PodID}
    };
}

void to_json(nlohmann::json& j, const IndexTaskInfo& info) {
    j = nlohmann::json{
        {"state",                 toString(info.State)},
        {"fail_reason",           info.FailReason},
        {"file_keys",             info.FileKeys},
        {"serialized_size",       info.SerializedSize},
        {"current_index_version", info.CurrentIndexVersion},
        {"index_store_version",   info.IndexStoreVersion},
        {"has_cancel",            static_cast<bool>(info.Cancel)},
        {"create_time",           formatTime(info.CreateTime)}
    };
    if (info.Statistic) {
        j["statistic"] = *info.Statistic;
    } else {
        j["statistic"] = nullptr;
    }
}

void to_json(nlohmann::json& j, const AnalysisTaskInfo& info) {
    // json 对象的键只能是字符串
    nlohmann::json mapping = nlohmann::json::object();
    for (const auto& [segID, file] : info.SegmentsOffsetMapping) {
        mapping[std::to_string(segID)] = file;
    }
    j = nlohmann::json{
        {"state",                   toString(info.State)},
        {"fail_reason",             info.FailReason},
        {"centroids_file",          info.CentroidsFile},
        {"segments_offset_mapping", mapping},
        {"index_store_version",     info.IndexStoreVersion},
        {"has_cancel",              static_cast<bool>(info.Cancel)},
        {"create_time",             formatTime(info.CreateTime)}
    };
}
