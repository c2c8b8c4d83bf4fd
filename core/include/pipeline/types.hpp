#pragma once

#include <chrono>
#include <cstdint>
#include <utility>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <common/geometry.hpp>

namespace pc {
    using Clock = std::chrono::system_clock;

    enum class DetectionType {
        Face,
        Person
    };

    struct Keypoint {
        double x = 0.0;
        double y = 0.0;
        float confidence = 0.0f;
        std::string name;
    };

    struct FaceDetection {
        BoundingBox box;
        float confidence = 0.0f;
        std::vector<Point> landmarks;
    };

    struct PersonDetection {
        BoundingBox box;
        float confidence = 0.0f;
        std::vector<Keypoint> keypoints;
    };

    using Detection = std::variant<FaceDetection, PersonDetection>;

    const BoundingBox& box_of(const Detection& d);
    float confidence_of(const Detection& d);
    DetectionType type_of(const Detection& d);
    const char* to_string(DetectionType t);

    struct DetectionResult {
        std::vector<FaceDetection> faces;
        std::vector<PersonDetection> people;
        float confidence = 0.0f; // mean of member confidences, 0 when empty
    };

    // Splits a mixed list by tag and computes the mean confidence.
    DetectionResult make_detection_result(const std::vector<Detection>& detections);
    std::vector<Detection> all_detections(const DetectionResult& r);
    bool has_detections(const DetectionResult& r);

    struct CropArea : BoundingBox {
        float confidence = 0.0f; // quality of the crop decision, not detector accuracy
    };

    enum class CropStrategy {
        PeopleCentered,
        FallbackCenter,
        RuleOfThirds,
        FallbackSmart,
        Remote
    };

    const char* to_string(CropStrategy s);

    struct ProcessedImage {
        std::string id;
        std::string original_file_id;
        std::string processed_path;
        CropArea crop_area;
        AspectRatio aspect_ratio;
        DetectionResult detections;
        int64_t processing_time_ms = 0;
        CropStrategy strategy = CropStrategy::FallbackSmart;
    };

    using ProcessedImagePtr = std::shared_ptr<const ProcessedImage>;

    struct GridLayout {
        int rows = 1;
        int columns = 1;
        std::string name;
    };

    inline int capacity_of(const GridLayout& g) { return g.rows * g.columns; }

    // 1x1, 1x2, 1x3, 1x4, 2x2, 2x3, 3x2, 3x3
    const std::vector<GridLayout>& predefined_grid_layouts();
    std::optional<GridLayout> find_grid_layout(const std::string& name);

    struct ComposedSheet {
        std::string id;
        std::string sheet_path;
        GridLayout layout;
        SheetOrientation orientation = SheetOrientation::Portrait;
        std::vector<ProcessedImagePtr> images;
        int empty_slots = 0;
        Clock::time_point created_at{};
    };

    struct FileMetadata {
        std::string id;
        std::string original_name;
        std::string upload_path;
        int64_t size = 0;
        std::string mime_type;
    };

    struct SheetCompositionOptions {
        bool enabled = false;
        GridLayout grid_layout;
        SheetOrientation orientation = SheetOrientation::Portrait;
        bool generate_pdf = false;
    };

    struct ProcessingOptions {
        AspectRatio aspect_ratio;
        bool face_detection_enabled = true;
        std::optional<SheetCompositionOptions> sheet_composition;
    };

    enum class JobStatus {
        Pending,
        Processing,
        Composing,
        GeneratingPdf,
        Completed,
        Failed
    };

    enum class PipelineStage {
        Uploading,
        Processing,
        Composing,
        GeneratingPdf,
        Completed
    };

    const char* to_string(JobStatus s);
    const char* to_string(PipelineStage s);

    struct JobProgress {
        PipelineStage current_stage = PipelineStage::Uploading;
        int processed_images = 0;
        int total_images = 0;
        int percentage = 0;
    };

    struct Job {
        std::string id;
        JobStatus status = JobStatus::Pending;
        std::vector<FileMetadata> files;
        ProcessingOptions options;
        JobProgress progress;
        Clock::time_point created_at{};
        std::optional<Clock::time_point> completed_at;
        std::string error_message;
    };

    struct ProcessingResults {
        std::string job_id;
        std::vector<ProcessedImagePtr> processed_images;
        std::vector<ComposedSheet> composed_sheets;
        std::optional<std::string> pdf_path;
        std::vector<std::string> errors; // per-file failures that did not abort the job
    };

    struct ProcessingStats {
        int total_images = 0;
        int successful_images = 0;
        int failed_images = 0;
        int total_sheets = 0;
        bool has_pdf = false;
        int64_t processing_time_ms = 0;
    };

    ProcessingStats processing_stats(const Job& job, const ProcessingResults& results);

    // Outcome of one pipeline stage; never leaves the orchestrator.
    template <class T>
    struct PipelineStageResult {
        bool success = false;
        std::string error;
        T data{};

        static PipelineStageResult ok(T v) {
            PipelineStageResult r;
            r.success = true;
            r.data = std::move(v);
            return r;
        }

        static PipelineStageResult fail(std::string e) {
            PipelineStageResult r;
            r.error = std::move(e);
            return r;
        }
    };
}
