#include <common/config.hpp>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <system_error>

#include <yaml-cpp/yaml.h>

#include <common/ids.hpp>
#include <cropping/crop_engine.hpp>

namespace pc {
    static bool get_bool(
        const YAML::Node& n, const char* key, bool def) {
        return (n && n[key]) ? n[key].as<bool>() : def;
    }

    static int get_int(
        const YAML::Node& n, const char* key, int def) {
        return (n && n[key]) ? n[key].as<int>() : def;
    }

    static float get_float(
        const YAML::Node& n, const char* key, float def) {
        return (n && n[key]) ? n[key].as<float>() : def;
    }

    static std::string get_str(
        const YAML::Node& n, const char* key, const std::string& def) {
        return (n && n[key]) ? n[key].as<std::string>() : def;
    }

    static RemoteConfig parse_remote_config(const YAML::Node& r) {
        RemoteConfig c;
        if (!r) return c;
        c.enabled = get_bool(r, "enabled", c.enabled);
        c.url = get_str(r, "url", c.url);
        c.timeout_ms = get_int(r, "timeout_ms", c.timeout_ms);
        c.max_retries = get_int(r, "max_retries", c.max_retries);
        c.retry_delay_ms = get_int(r, "retry_delay_ms", c.retry_delay_ms);

        if (c.enabled && c.url.empty()) {
            throw std::runtime_error("[Config] remote.enabled requires remote.url!");
        }
        if (c.max_retries < 1) c.max_retries = 1;
        if (c.retry_delay_ms < 0) c.retry_delay_ms = 0;
        return c;
    }

    static DetectorConfig parse_detector_config(const YAML::Node& d) {
        DetectorConfig c;
        if (!d) return c;
        c.enabled = get_bool(d, "enabled", c.enabled);
        c.param_path = get_str(d, "param_path", c.param_path);
        c.bin_path = get_str(d, "bin_path", c.bin_path);
        c.input_w = get_int(d, "input_w", c.input_w);
        c.input_h = get_int(d, "input_h", c.input_h);
        c.score_threshold = get_float(d, "score_threshold", c.score_threshold);
        c.nms_threshold = get_float(d, "nms_threshold", c.nms_threshold);
        c.top_k = get_int(d, "top_k", c.top_k);
        c.ncnn_threads = get_int(d, "ncnn_threads", c.ncnn_threads);

        // YuNet strides go up to 32.
        if (c.input_w <= 0 || c.input_h <= 0 || c.input_w % 32 != 0 || c.input_h % 32 != 0) {
            throw std::runtime_error("[Config] detector input size must be a positive multiple of 32!");
        }
        return c;
    }

    static CodecConfig parse_codec_config(const YAML::Node& n) {
        CodecConfig c;
        if (!n) return c;
        c.jpeg_quality = get_int(n, "jpeg_quality", c.jpeg_quality);
        c.interp = get_str(n, "interp", c.interp);
        if (c.jpeg_quality < 1 || c.jpeg_quality > 100) {
            throw std::runtime_error("[Config] codec.jpeg_quality must be in 1..100!");
        }
        return c;
    }

    static PipelineConfig parse_pipeline_config(const YAML::Node& p) {
        PipelineConfig c;
        if (!p) return c;
        c.output_dir = get_str(p, "output_dir", c.output_dir);
        c.temp_dir = get_str(p, "temp_dir", c.temp_dir);
        c.cleanup_on_error = get_bool(p, "cleanup_on_error", c.cleanup_on_error);
        c.max_retries = get_int(p, "max_retries", c.max_retries);
        c.retry_base_delay_ms = get_int(p, "retry_base_delay_ms", c.retry_base_delay_ms);
        c.detection_confidence = get_float(p, "detection_confidence", c.detection_confidence);

        if (c.output_dir.empty()) {
            throw std::runtime_error("[Config] pipeline.output_dir is empty!");
        }
        if (c.max_retries < 1) {
            throw std::runtime_error("[Config] pipeline.max_retries must be >= 1!");
        }
        if (c.retry_base_delay_ms < 0) c.retry_base_delay_ms = 0;
        if (c.detection_confidence < 0.0f || c.detection_confidence > 1.0f) {
            throw std::runtime_error("[Config] pipeline.detection_confidence must be in [0, 1]!");
        }
        return c;
    }

    static CropConfig parse_crop_config(const YAML::Node& n) {
        CropConfig c;
        if (!n) return c;
        c.fallback_strategy = get_str(n, "fallback_strategy", c.fallback_strategy);

        FallbackStrategy s;
        if (!parse_fallback_strategy(c.fallback_strategy, s)) {
            throw std::runtime_error("[Config] unknown crop.fallback_strategy: " + c.fallback_strategy);
        }
        return c;
    }

    static SheetConfig parse_sheet_config(const YAML::Node& n) {
        SheetConfig c;
        if (!n) return c;
        c.margin = get_int(n, "margin", c.margin);
        c.spacing = get_int(n, "spacing", c.spacing);
        c.dense_spacing = get_int(n, "dense_spacing", c.dense_spacing);
        if (c.margin < 0 || c.spacing < 0 || c.dense_spacing < 0) {
            throw std::runtime_error("[Config] sheet margin and spacing must be >= 0!");
        }
        return c;
    }

    AppConfig load_config_yaml(const std::string& path) {
        AppConfig cfg;
        YAML::Node root = YAML::LoadFile(path);

        cfg.remote = parse_remote_config(root["remote"]);
        cfg.detector = parse_detector_config(root["detector"]);
        cfg.codec = parse_codec_config(root["codec"]);
        cfg.pipeline = parse_pipeline_config(root["pipeline"]);
        cfg.crop = parse_crop_config(root["crop"]);
        cfg.sheet = parse_sheet_config(root["sheet"]);
        return cfg;
    }

    std::string mime_type_for(const std::string& path) {
        std::string ext = std::filesystem::path(path).extension().string();
        std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) {
            return static_cast<char>(std::tolower(c));
        });

        if (ext == ".jpg" || ext == ".jpeg") return "image/jpeg";
        if (ext == ".png") return "image/png";
        if (ext == ".webp") return "image/webp";
        if (ext == ".tif" || ext == ".tiff") return "image/tiff";
        if (ext == ".bmp") return "image/bmp";
        return "application/octet-stream";
    }

    // Scalar name ("4x6", "Square") or {width, height[, name]}.
    static AspectRatio parse_aspect_ratio(const YAML::Node& n) {
        if (!n) {
            throw std::runtime_error("[Config] job options.aspect_ratio is required!");
        }

        if (n.IsScalar()) {
            const auto name = n.as<std::string>();
            AspectRatio ar;
            if (!find_aspect_ratio(name, ar)) {
                throw std::runtime_error("[Config] unknown aspect ratio: " + name);
            }
            return ar;
        }

        if (!n.IsMap() || !n["width"] || !n["height"]) {
            throw std::runtime_error("[Config] aspect_ratio needs width and height!");
        }
        return make_aspect_ratio(n["width"].as<double>(), n["height"].as<double>(), get_str(n, "name", ""));
    }

    // Scalar name ("2x2") or {rows, columns}.
    static GridLayout parse_grid_layout(const YAML::Node& n) {
        if (!n) return GridLayout{1, 1, "1x1"};

        if (n.IsScalar()) {
            const auto name = n.as<std::string>();
            const auto found = find_grid_layout(name);
            if (!found) {
                throw std::runtime_error("[Config] unknown grid layout: " + name);
            }
            return *found;
        }

        GridLayout g;
        g.rows = get_int(n, "rows", 1);
        g.columns = get_int(n, "columns", 1);
        g.name = get_str(n, "name", std::to_string(g.rows) + "x" + std::to_string(g.columns));
        return g;
    }

    static std::optional<SheetCompositionOptions> parse_sheet_options(const YAML::Node& n) {
        if (!n) return std::nullopt;

        SheetCompositionOptions s;
        s.enabled = get_bool(n, "enabled", true);
        s.grid_layout = parse_grid_layout(n["layout"]);
        s.generate_pdf = get_bool(n, "pdf", false);

        const auto orient = get_str(n, "orientation", "portrait");
        if (!parse_sheet_orientation(orient, s.orientation)) {
            throw std::runtime_error("[Config] unknown sheet orientation: " + orient);
        }
        return s;
    }

    static FileMetadata parse_file(const YAML::Node& f, size_t index) {
        FileMetadata m;
        if (f.IsScalar()) {
            m.upload_path = f.as<std::string>();
        } else {
            m.upload_path = get_str(f, "path", "");
            m.id = get_str(f, "id", "");
            m.original_name = get_str(f, "name", "");
        }

        if (m.upload_path.empty()) {
            throw std::runtime_error("[Config] job file #" + std::to_string(index) + " has no path!");
        }
        if (m.id.empty()) m.id = make_uuid();
        if (m.original_name.empty()) m.original_name = std::filesystem::path(m.upload_path).filename().string();

        std::error_code ec;
        const auto size = std::filesystem::file_size(m.upload_path, ec);
        m.size = ec ? 0 : static_cast<int64_t>(size);
        m.mime_type = mime_type_for(m.upload_path);
        return m;
    }

    Job load_job_yaml(const std::string& path) {
        YAML::Node root = YAML::LoadFile(path);

        Job job;
        job.id = get_str(root, "id", "");
        if (job.id.empty()) job.id = make_uuid();
        job.created_at = Clock::now();

        const auto files = root["files"];
        if (files) {
            if (!files.IsSequence()) {
                throw std::runtime_error("[Config] job files must be a list!");
            }
            for (size_t i = 0; i < files.size(); ++i) {
                job.files.push_back(parse_file(files[i], i));
            }
        }

        const auto opts = root["options"];
        if (!opts) {
            throw std::runtime_error("[Config] job has no options!");
        }
        job.options.aspect_ratio = parse_aspect_ratio(opts["aspect_ratio"]);
        job.options.face_detection_enabled = get_bool(opts, "face_detection", true);
        job.options.sheet_composition = parse_sheet_options(opts["sheet"]);
        return job;
    }
}
