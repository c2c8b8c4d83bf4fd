#pragma once

#include <memory>
#include <string>
#include <vector>

#include <opencv2/core.hpp>

#include <inference/detector.hpp>

namespace pc {
    struct YuNetDetectorConfig {
        std::string param_path = "models/detector/face_detection_yunet_2023mar.ncnn.param";
        std::string bin_path = "models/detector/face_detection_yunet_2023mar.ncnn.bin";
        int input_w = 640;
        int input_h = 640;
        float score_threshold = 0.3f; // candidate cutoff before NMS
        float nms_threshold = 0.3f;
        int top_k = 750;
        int ncnn_threads = 1;
    };

    // Face detector. Person requests are not answered locally.
    class YuNetDetector : public IDetector {
    public:
        explicit YuNetDetector(YuNetDetectorConfig cfg);
        ~YuNetDetector() override;

        YuNetDetector(YuNetDetector&&) noexcept;
        YuNetDetector& operator=(YuNetDetector&&) noexcept;

        YuNetDetector(const YuNetDetector&) = delete;
        YuNetDetector& operator=(const YuNetDetector&) = delete;

        std::vector<Detection> detect(const std::string& image_path,
                                      const std::vector<DetectionType>& types,
                                      float confidence_threshold) override;

        std::vector<FaceDetection> detect_faces(const cv::Mat& bgr, float confidence_threshold) const;

    private:
        YuNetDetectorConfig cfg_;
        class Impl;
        std::unique_ptr<Impl> impl_;
    };
}
