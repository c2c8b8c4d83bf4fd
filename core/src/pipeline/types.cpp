#include <pipeline/types.hpp>

#include <numeric>

namespace pc {
    const BoundingBox& box_of(const Detection& d) {
        return std::visit([](const auto& v) -> const BoundingBox& { return v.box; }, d);
    }

    float confidence_of(const Detection& d) {
        return std::visit([](const auto& v) { return v.confidence; }, d);
    }

    DetectionType type_of(const Detection& d) {
        return std::holds_alternative<FaceDetection>(d) ? DetectionType::Face : DetectionType::Person;
    }

    const char* to_string(DetectionType t) {
        return t == DetectionType::Face ? "face" : "person";
    }

    DetectionResult make_detection_result(const std::vector<Detection>& detections) {
        DetectionResult r;
        double sum = 0.0;
        for (const auto& d : detections) {
            sum += confidence_of(d);
            if (const auto* f = std::get_if<FaceDetection>(&d)) {
                r.faces.push_back(*f);
            } else {
                r.people.push_back(std::get<PersonDetection>(d));
            }
        }
        r.confidence = detections.empty() ? 0.0f : static_cast<float>(sum / detections.size());
        return r;
    }

    std::vector<Detection> all_detections(const DetectionResult& r) {
        std::vector<Detection> out;
        out.reserve(r.faces.size() + r.people.size());
        for (const auto& f : r.faces) out.emplace_back(f);
        for (const auto& p : r.people) out.emplace_back(p);
        return out;
    }

    bool has_detections(const DetectionResult& r) {
        return !r.faces.empty() || !r.people.empty();
    }

    const char* to_string(CropStrategy s) {
        switch (s) {
            case CropStrategy::PeopleCentered: return "people-centered";
            case CropStrategy::FallbackCenter: return "fallback-center";
            case CropStrategy::RuleOfThirds: return "rule-of-thirds";
            case CropStrategy::FallbackSmart: return "fallback-smart";
            case CropStrategy::Remote: return "remote";
        }
        return "fallback-smart";
    }

    const std::vector<GridLayout>& predefined_grid_layouts() {
        static const std::vector<GridLayout> layouts = {
            {1, 1, "1x1"},
            {1, 2, "1x2"},
            {1, 3, "1x3"},
            {1, 4, "1x4"},
            {2, 2, "2x2"},
            {2, 3, "2x3"},
            {3, 2, "3x2"},
            {3, 3, "3x3"},
        };
        return layouts;
    }

    std::optional<GridLayout> find_grid_layout(const std::string& name) {
        for (const auto& g : predefined_grid_layouts()) {
            if (g.name == name) return g;
        }
        return std::nullopt;
    }

    const char* to_string(JobStatus s) {
        switch (s) {
            case JobStatus::Pending: return "pending";
            case JobStatus::Processing: return "processing";
            case JobStatus::Composing: return "composing";
            case JobStatus::GeneratingPdf: return "generating_pdf";
            case JobStatus::Completed: return "completed";
            case JobStatus::Failed: return "failed";
        }
        return "pending";
    }

    const char* to_string(PipelineStage s) {
        switch (s) {
            case PipelineStage::Uploading: return "uploading";
            case PipelineStage::Processing: return "processing";
            case PipelineStage::Composing: return "composing";
            case PipelineStage::GeneratingPdf: return "generating_pdf";
            case PipelineStage::Completed: return "completed";
        }
        return "uploading";
    }

    ProcessingStats processing_stats(const Job& job, const ProcessingResults& results) {
        ProcessingStats s;
        s.total_images = static_cast<int>(job.files.size());
        s.successful_images = static_cast<int>(results.processed_images.size());
        s.failed_images = s.total_images - s.successful_images;
        s.total_sheets = static_cast<int>(results.composed_sheets.size());
        s.has_pdf = results.pdf_path.has_value();
        s.processing_time_ms = std::accumulate(results.processed_images.begin(),
                                               results.processed_images.end(),
                                               int64_t{0},
                                               [](int64_t acc, const ProcessedImagePtr& p) {
                                                   return acc + (p ? p->processing_time_ms : 0);
                                               });
        return s;
    }
}
