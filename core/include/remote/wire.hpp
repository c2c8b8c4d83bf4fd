#pragma once

#include <nlohmann/json.hpp>

#include <remote/processing_service.hpp>

// JSON mapping for the remote service. Keys are snake_case.
namespace pc {
    void to_json(nlohmann::json& j, const BoundingBox& b);
    void from_json(const nlohmann::json& j, BoundingBox& b);
    void from_json(const nlohmann::json& j, Dimensions& d);

    nlohmann::json detection_to_json(const Detection& d);
    Detection detection_from_json(const nlohmann::json& j);
    std::vector<Detection> detections_from_json(const nlohmann::json& j);

    nlohmann::json to_json(const RemoteDetectRequest& r);
    nlohmann::json to_json(const RemoteCropRequest& r);
    nlohmann::json to_json(const RemoteBatchRequest& r);
    nlohmann::json to_json(const RemoteSheetRequest& r);

    RemoteHealth health_from_json(const nlohmann::json& j);
    RemoteProcessedImage processed_image_from_json(const nlohmann::json& j);
    RemoteBatchResult batch_result_from_json(const nlohmann::json& j);
    RemoteComposedSheet composed_sheet_from_json(const nlohmann::json& j);
}
