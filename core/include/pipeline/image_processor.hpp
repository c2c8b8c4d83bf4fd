#pragma once

#include <string>

#include <codec/image_codec.hpp>
#include <cropping/crop_engine.hpp>
#include <inference/detector.hpp>
#include <pipeline/types.hpp>
#include <remote/processing_service.hpp>

namespace pc {
    // Crops reported by the remote service carry this fixed confidence.
    inline constexpr float kRemoteCropConfidence = 0.8f;

    struct ImageTask {
        AspectRatio target;
        bool detect = true;
        float detection_confidence = 0.4f;
        std::string output_dir;
        CropOptions crop;
    };

    // processed_<stem>_<first 8 of image id>_<ratio name>.jpg
    std::string processed_file_name(const FileMetadata& file, const std::string& image_id, const AspectRatio& ratio);

    ProcessedImage from_remote(const RemoteProcessedImage& r,
                               const FileMetadata& file,
                               const AspectRatio& ratio,
                               const std::vector<Detection>& detections);

    // probe -> detect -> decide -> crop, all in process.
    class LocalImageProcessor {
    public:
        LocalImageProcessor(IImageCodec& codec, IDetector* detector);

        ProcessedImage process(const FileMetadata& file, const ImageTask& task) const;

    private:
        std::vector<Detection> detect_(const FileMetadata& file, const ImageTask& task) const;

        IImageCodec& codec_;
        IDetector* detector_;
    };

    // detect + crop through the remote service. Detection errors mean no detections;
    // crop errors propagate as RemoteServiceError.
    class RemoteImageProcessor {
    public:
        explicit RemoteImageProcessor(IRemoteProcessingService& remote);

        ProcessedImage process(const FileMetadata& file, const ImageTask& task) const;

    private:
        IRemoteProcessingService& remote_;
    };
}
