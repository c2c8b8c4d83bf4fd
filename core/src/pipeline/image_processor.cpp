#include <pipeline/image_processor.hpp>

#include <chrono>
#include <cmath>
#include <filesystem>
#include <iostream>
#include <stdexcept>

#include <common/ids.hpp>

namespace pc {
    namespace {
        const std::vector<DetectionType> kAllTypes = {DetectionType::Face, DetectionType::Person};

        int64_t elapsed_ms(std::chrono::steady_clock::time_point t0) {
            return std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - t0).count();
        }
    } // namespace

    std::string processed_file_name(const FileMetadata& file, const std::string& image_id, const AspectRatio& ratio) {
        const std::string source = file.original_name.empty() ? file.upload_path : file.original_name;
        const std::string stem = std::filesystem::path(source).stem().string();
        return "processed_" + stem + "_" + short_id(image_id) + "_" + ratio.name + ".jpg";
    }

    ProcessedImage from_remote(const RemoteProcessedImage& r,
                               const FileMetadata& file,
                               const AspectRatio& ratio,
                               const std::vector<Detection>& detections) {
        const BoundingBox& box = r.crop_coordinates;
        if (box.width <= 0 || box.height <= 0 || box.x < 0 || box.y < 0) {
            throw RemoteServiceError(502, "Remote returned an invalid crop box for " + r.original_path);
        }

        ProcessedImage img;
        img.id = make_uuid();
        img.original_file_id = file.id;
        img.processed_path = r.processed_path;
        static_cast<BoundingBox&>(img.crop_area) = r.crop_coordinates;
        img.crop_area.confidence = kRemoteCropConfidence;
        img.aspect_ratio = ratio;
        img.detections = make_detection_result(detections.empty() ? r.detections : detections);
        img.processing_time_ms = static_cast<int64_t>(std::llround(r.processing_time * 1000.0));
        img.strategy = CropStrategy::Remote;
        return img;
    }

    LocalImageProcessor::LocalImageProcessor(IImageCodec& codec, IDetector* detector)
        : codec_(codec),
          detector_(detector) {}

    std::vector<Detection> LocalImageProcessor::detect_(const FileMetadata& file, const ImageTask& task) const {
        if (!task.detect || !detector_) return {};
        try {
            return detector_->detect(file.upload_path, kAllTypes, task.detection_confidence);
        } catch (const std::exception& e) {
            std::cerr << "[Processor](detect_) detection failed for " << file.original_name
                      << ", using fallback crop: " << e.what() << "\n";
            return {};
        }
    }

    ProcessedImage LocalImageProcessor::process(const FileMetadata& file, const ImageTask& task) const {
        const auto t0 = std::chrono::steady_clock::now();

        const Dimensions dims = codec_.probe(file.upload_path);
        if (!is_valid(dims)) {
            throw std::runtime_error("Invalid image dimensions for " + file.original_name);
        }

        const DetectionResult detections = make_detection_result(detect_(file, task));
        const CropDecision decision = decide_crop(dims, detections, task.target, task.crop);

        ProcessedImage img;
        img.id = make_uuid();
        img.original_file_id = file.id;
        img.processed_path =
            (std::filesystem::path(task.output_dir) / processed_file_name(file, img.id, task.target)).string();

        const Dimensions written = codec_.crop(file.upload_path, decision.crop_area, img.processed_path);
        if (written.width != decision.crop_area.width || written.height != decision.crop_area.height) {
            std::cerr << "[Processor](process) " << file.original_name << ": wrote " << written.width << "x"
                      << written.height << ", expected " << decision.crop_area.width << "x"
                      << decision.crop_area.height << "\n";
        }

        img.crop_area = decision.crop_area;
        img.aspect_ratio = task.target;
        img.detections = detections;
        img.strategy = decision.strategy;
        img.processing_time_ms = elapsed_ms(t0);
        return img;
    }

    RemoteImageProcessor::RemoteImageProcessor(IRemoteProcessingService& remote)
        : remote_(remote) {}

    ProcessedImage RemoteImageProcessor::process(const FileMetadata& file, const ImageTask& task) const {
        std::vector<Detection> detections;
        if (task.detect) {
            try {
                RemoteDetectRequest req;
                req.image_path = file.upload_path;
                req.detection_types = kAllTypes;
                req.confidence_threshold = task.detection_confidence;
                detections = remote_.detect_objects(req);
            } catch (const std::exception& e) {
                std::cerr << "[Processor](remote) detection failed for " << file.original_name
                          << ", continuing with fallback cropping: " << e.what() << "\n";
            }
        }

        RemoteCropRequest crop;
        crop.image_path = file.upload_path;
        crop.target_aspect_ratio = task.target;
        crop.detection_results = detections;
        crop.crop_strategy = detections.empty() ? "center" : "center_faces";

        const RemoteProcessedImage r = remote_.crop_image(crop);
        return from_remote(r, file, task.target, detections);
    }
}
