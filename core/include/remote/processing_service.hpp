#pragma once

#include <stdexcept>
#include <string>
#include <vector>

#include <common/geometry.hpp>
#include <pipeline/types.hpp>

namespace pc {
    // status: HTTP status, 0 transport failure, 408 timeout, 503 connection refused
    class RemoteServiceError : public std::runtime_error {
    public:
        RemoteServiceError(int status, const std::string& what)
            : std::runtime_error(what), status_(status) {}

        int status() const { return status_; }

    private:
        int status_;
    };

    struct RemoteHealth {
        std::string status; // healthy | degraded | unhealthy
        std::string version;
        double uptime_seconds = 0.0;

        bool healthy() const { return status == "healthy"; }
    };

    struct RemoteDetectRequest {
        std::string image_path;
        std::vector<DetectionType> detection_types;
        float confidence_threshold = 0.4f;
    };

    struct RemoteCropRequest {
        std::string image_path;
        AspectRatio target_aspect_ratio;
        std::vector<Detection> detection_results;
        std::string crop_strategy = "center_faces"; // center | center_faces | preserve_all
    };

    struct RemoteProcessedImage {
        std::string original_path;
        std::string processed_path;
        BoundingBox crop_coordinates;
        Dimensions final_dimensions;
        std::vector<Detection> detections;
        double processing_time = 0.0; // seconds
    };

    struct RemoteBatchRequest {
        std::vector<std::string> images;
        AspectRatio target_aspect_ratio;
        std::string crop_strategy = "center_faces";
        std::vector<DetectionType> detection_types;
    };

    struct RemoteBatchFailure {
        std::string path;
        std::string error;
    };

    struct RemoteBatchResult {
        std::vector<RemoteProcessedImage> processed_images;
        std::vector<RemoteBatchFailure> failed_images;
    };

    struct RemoteSheetRequest {
        std::vector<std::string> processed_images;
        GridLayout grid_layout;
        SheetOrientation sheet_orientation = SheetOrientation::Portrait;
        std::string output_format = "image"; // image | pdf
    };

    struct RemoteComposedSheet {
        std::string output_path;
        std::string format;
        Dimensions dimensions;
    };

    // Out-of-process image service. Every failure is a RemoteServiceError.
    class IRemoteProcessingService {
    public:
        virtual ~IRemoteProcessingService() = default;

        virtual RemoteHealth health_check() = 0;
        virtual std::vector<Detection> detect_objects(const RemoteDetectRequest& req) = 0;
        virtual RemoteProcessedImage crop_image(const RemoteCropRequest& req) = 0;
        virtual RemoteBatchResult process_batch(const RemoteBatchRequest& req) = 0;
        virtual RemoteComposedSheet compose_sheet(const RemoteSheetRequest& req) = 0;
    };
}
