#include <remote/wire.hpp>

#include <cmath>
#include <stdexcept>
#include <string>

namespace pc {
    namespace {
        using nlohmann::json;

        int int_field(const json& j, const char* key, int def = 0) {
            if (!j.contains(key) || j.at(key).is_null()) return def;
            const auto& v = j.at(key);
            if (v.is_number_integer()) return v.get<int>();
            if (v.is_number()) return static_cast<int>(std::lround(v.get<double>()));
            throw std::runtime_error(std::string("field ") + key + " is not a number");
        }

        std::string str_field(const json& j, const char* key, const std::string& def = {}) {
            if (!j.contains(key) || j.at(key).is_null()) return def;
            return j.at(key).get<std::string>();
        }

        // Whole-number ratios go out as integers.
        json ratio_value(double v) {
            const double r = std::round(v);
            if (std::fabs(v - r) < 1e-9) return static_cast<int>(r);
            return v;
        }

        json aspect_to_json(const AspectRatio& ar) {
            return json{{"width", ratio_value(ar.width)}, {"height", ratio_value(ar.height)}};
        }

        json types_to_json(const std::vector<DetectionType>& types) {
            json out = json::array();
            for (auto t : types) out.push_back(to_string(t));
            return out;
        }

        const json& dims_of(const json& j) {
            if (j.contains("dimensions")) return j.at("dimensions");
            if (j.contains("sheet_dimensions")) return j.at("sheet_dimensions");
            return j.at("final_dimensions");
        }
    } // namespace

    void to_json(nlohmann::json& j, const BoundingBox& b) {
        j = nlohmann::json{{"x", b.x}, {"y", b.y}, {"width", b.width}, {"height", b.height}};
    }

    void from_json(const nlohmann::json& j, BoundingBox& b) {
        b.x = int_field(j, "x");
        b.y = int_field(j, "y");
        b.width = int_field(j, "width");
        b.height = int_field(j, "height");
    }

    void from_json(const nlohmann::json& j, Dimensions& d) {
        d.width = int_field(j, "width");
        d.height = int_field(j, "height");
    }

    nlohmann::json detection_to_json(const Detection& d) {
        return json{
            {"type", to_string(type_of(d))},
            {"confidence", confidence_of(d)},
            {"bounding_box", box_of(d)}
        };
    }

    Detection detection_from_json(const nlohmann::json& j) {
        const std::string type = str_field(j, "type", "face");
        const BoundingBox box = j.at("bounding_box").get<BoundingBox>();
        const float conf = j.value("confidence", 0.0f);

        if (type == "person") {
            PersonDetection p;
            p.box = box;
            p.confidence = conf;
            return p;
        }
        if (type != "face") {
            throw std::runtime_error("unknown detection type: " + type);
        }

        FaceDetection f;
        f.box = box;
        f.confidence = conf;
        return f;
    }

    std::vector<Detection> detections_from_json(const nlohmann::json& j) {
        // /api/v1/detect answers {detections: [...]}; batch items carry a bare array.
        const json& arr = j.is_object() ? j.at("detections") : j;
        std::vector<Detection> out;
        out.reserve(arr.size());
        for (const auto& d : arr) out.push_back(detection_from_json(d));
        return out;
    }

    nlohmann::json to_json(const RemoteDetectRequest& r) {
        return json{
            {"image_path", r.image_path},
            {"detection_types", types_to_json(r.detection_types)},
            {"confidence_threshold", r.confidence_threshold}
        };
    }

    nlohmann::json to_json(const RemoteCropRequest& r) {
        json j{
            {"image_path", r.image_path},
            {"target_aspect_ratio", aspect_to_json(r.target_aspect_ratio)},
            {"crop_strategy", r.crop_strategy}
        };
        if (!r.detection_results.empty()) {
            json dets = json::array();
            for (const auto& d : r.detection_results) dets.push_back(detection_to_json(d));
            j["detection_results"] = std::move(dets);
        }
        return j;
    }

    nlohmann::json to_json(const RemoteBatchRequest& r) {
        json opts{
            {"target_aspect_ratio", aspect_to_json(r.target_aspect_ratio)},
            {"crop_strategy", r.crop_strategy}
        };
        if (!r.detection_types.empty()) opts["detection_types"] = types_to_json(r.detection_types);

        return json{{"images", r.images}, {"processing_options", std::move(opts)}};
    }

    nlohmann::json to_json(const RemoteSheetRequest& r) {
        return json{
            {"processed_images", r.processed_images},
            {"grid_layout", {{"rows", r.grid_layout.rows}, {"columns", r.grid_layout.columns}}},
            {"sheet_orientation", to_string(r.sheet_orientation)},
            {"output_format", r.output_format}
        };
    }

    RemoteHealth health_from_json(const nlohmann::json& j) {
        RemoteHealth h;
        h.status = str_field(j, "status", "unhealthy");
        h.version = str_field(j, "version");
        if (j.contains("uptime_seconds") && j.at("uptime_seconds").is_number()) {
            h.uptime_seconds = j.at("uptime_seconds").get<double>();
        }
        return h;
    }

    RemoteProcessedImage processed_image_from_json(const nlohmann::json& j) {
        RemoteProcessedImage p;
        p.original_path = str_field(j, "original_path");
        p.processed_path = j.at("processed_path").get<std::string>();
        p.crop_coordinates = j.at("crop_coordinates").get<BoundingBox>();
        if (j.contains("final_dimensions")) {
            p.final_dimensions = j.at("final_dimensions").get<Dimensions>();
        } else {
            p.final_dimensions = {p.crop_coordinates.width, p.crop_coordinates.height};
        }
        if (j.contains("detections") && j.at("detections").is_array()) {
            p.detections = detections_from_json(j.at("detections"));
        }
        if (j.contains("processing_time") && j.at("processing_time").is_number()) {
            p.processing_time = j.at("processing_time").get<double>();
        }
        return p;
    }

    RemoteBatchResult batch_result_from_json(const nlohmann::json& j) {
        RemoteBatchResult r;
        for (const auto& item : j.at("processed_images")) {
            r.processed_images.push_back(processed_image_from_json(item));
        }
        if (j.contains("failed_images")) {
            for (const auto& f : j.at("failed_images")) {
                r.failed_images.push_back({str_field(f, "path"), str_field(f, "error")});
            }
        }
        return r;
    }

    RemoteComposedSheet composed_sheet_from_json(const nlohmann::json& j) {
        RemoteComposedSheet s;
        s.output_path = j.at("output_path").get<std::string>();
        s.format = str_field(j, "format", "image");
        s.dimensions = dims_of(j).get<Dimensions>();
        return s;
    }
}
