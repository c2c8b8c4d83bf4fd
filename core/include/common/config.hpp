#pragma once

#include <string>
#include <vector>

#include <pipeline/types.hpp>

namespace pc {
    struct RemoteConfig {
        bool enabled = false;
        std::string url = "http://localhost:8000";
        int timeout_ms = 30000;
        int max_retries = 3;
        int retry_delay_ms = 1000;
    };

    struct DetectorConfig {
        bool enabled = true;
        std::string param_path = "models/detector/face_detection_yunet_2023mar.ncnn.param";
        std::string bin_path = "models/detector/face_detection_yunet_2023mar.ncnn.bin";
        int input_w = 640;
        int input_h = 640;
        float score_threshold = 0.3f;
        float nms_threshold = 0.3f;
        int top_k = 750;
        int ncnn_threads = 1;
    };

    struct CodecConfig {
        int jpeg_quality = 95;
        std::string interp = "area"; // nearest|cubic|linear|area|lanczos
    };

    struct PipelineConfig {
        std::string output_dir = "output";
        std::string temp_dir = "tmp";
        bool cleanup_on_error = true;
        int max_retries = 3;
        int retry_base_delay_ms = 1000;
        float detection_confidence = 0.4f;
    };

    struct CropConfig {
        std::string fallback_strategy = "smart"; // center|rule-of-thirds|smart
    };

    struct SheetConfig {
        int margin = 30;
        int spacing = 15;
        int dense_spacing = 10;
    };

    struct AppConfig {
        RemoteConfig remote;
        DetectorConfig detector;
        CodecConfig codec;
        PipelineConfig pipeline;
        CropConfig crop;
        SheetConfig sheet;
    };

    AppConfig load_config_yaml(const std::string& path);

    // Job document: id, files[]{id,name,path}, options{aspect_ratio, face_detection, sheet{...}}.
    Job load_job_yaml(const std::string& path);

    std::string mime_type_for(const std::string& path);
}
