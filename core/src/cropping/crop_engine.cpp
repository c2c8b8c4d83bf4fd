#include <cropping/crop_engine.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>

namespace pc {
    namespace {
        std::string normalize_name(std::string s) {
            std::transform(s.begin(),
                           s.end(),
                           s.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            std::replace(s.begin(), s.end(), '_', '-');
            return s;
        }

        // Top-left corner of a box of size `crop` whose center sits at `center`, kept inside
        // the image.
        BoundingBox place_centered_at(const Point& center, const Dimensions& crop, const Dimensions& image) {
            const double max_x = double(image.width - crop.width);
            const double max_y = double(image.height - crop.height);

            BoundingBox b;
            b.width = crop.width;
            b.height = crop.height;
            b.x = int(std::lround(clamp_value(center.x - crop.width / 2.0, 0.0, max_x)));
            b.y = int(std::lround(clamp_value(center.y - crop.height / 2.0, 0.0, max_y)));
            return b;
        }

        BoundingBox center_crop(const Dimensions& image, const Dimensions& crop) {
            return place_centered_at({image.width / 2.0, image.height / 2.0}, crop, image);
        }

        // Crop centered on the thirds intersection closest to the image center. All four are
        // equidistant on an exact grid, so ties resolve in reading order.
        BoundingBox rule_of_thirds_crop(const Dimensions& image, const Dimensions& crop) {
            const double w = image.width;
            const double h = image.height;
            const std::array<Point, 4> points = {{
                {w / 3.0, h / 3.0},
                {2.0 * w / 3.0, h / 3.0},
                {w / 3.0, 2.0 * h / 3.0},
                {2.0 * w / 3.0, 2.0 * h / 3.0},
            }};

            const Point c{w / 2.0, h / 2.0};
            Point best = points[0];
            double best_d = std::hypot(best.x - c.x, best.y - c.y);
            for (size_t i = 1; i < points.size(); ++i) {
                const double d = std::hypot(points[i].x - c.x, points[i].y - c.y);
                if (d < best_d - 1e-6) {
                    best = points[i];
                    best_d = d;
                }
            }
            return place_centered_at(best, crop, image);
        }

        // Edge-avoiding heuristic: keep 20% of the slack before the box on each axis.
        BoundingBox smart_crop(const Dimensions& image, const Dimensions& crop) {
            BoundingBox b;
            b.width = crop.width;
            b.height = crop.height;
            b.x = int(std::lround((image.width - crop.width) * 0.2));
            b.y = int(std::lround((image.height - crop.height) * 0.2));
            return b;
        }

        double people_quality_score(const BoundingBox& crop, const Point& com, float confidence) {
            const Point cc = box_center(crop);
            const double dist = std::hypot(com.x - cc.x, com.y - cc.y);
            const double max_dist = std::hypot(crop.width / 2.0, crop.height / 2.0);
            const double centering = max_dist > 0.0 ? std::max(0.0, 1.0 - dist / max_dist) : 0.0;

            const double conf = clamp_value(double(confidence), 0.0, 1.0);
            return clamp_value(conf * (0.7 + 0.3 * centering), 0.0, 1.0);
        }
    } // namespace

    bool parse_fallback_strategy(const std::string& s, FallbackStrategy& out) {
        const std::string v = normalize_name(s);
        if (v == "center") {
            out = FallbackStrategy::Center;
        } else if (v == "rule-of-thirds" || v == "thirds") {
            out = FallbackStrategy::RuleOfThirds;
        } else if (v == "smart") {
            out = FallbackStrategy::Smart;
        } else {
            return false;
        }
        return true;
    }

    const char* to_string(FallbackStrategy s) {
        switch (s) {
            case FallbackStrategy::Center: return "center";
            case FallbackStrategy::RuleOfThirds: return "rule-of-thirds";
            case FallbackStrategy::Smart: return "smart";
        }
        return "smart";
    }

    Point weighted_center_of_mass(const std::vector<Detection>& detections) {
        if (detections.empty()) return {0.0, 0.0};

        double sx = 0.0;
        double sy = 0.0;
        double total = 0.0;
        for (const auto& d : detections) {
            const Point c = box_center(box_of(d));
            const double w = std::max(0.0f, confidence_of(d));
            sx += c.x * w;
            sy += c.y * w;
            total += w;
        }

        if (total > 0.0) return {sx / total, sy / total};

        // all weights zero: plain mean of centers
        sx = 0.0;
        sy = 0.0;
        for (const auto& d : detections) {
            const Point c = box_center(box_of(d));
            sx += c.x;
            sy += c.y;
        }
        return {sx / detections.size(), sy / detections.size()};
    }

    Dimensions crop_dimensions(const Dimensions& image, double target_ratio) {
        const double image_ratio = double(image.width) / double(image.height);

        long w = 0;
        long h = 0;
        if (target_ratio > image_ratio) {
            w = image.width;
            h = std::lround(image.width / target_ratio);
        } else {
            h = image.height;
            w = std::lround(image.height * target_ratio);
        }

        Dimensions d;
        d.width = int(clamp_value<long>(w, 1, image.width));
        d.height = int(clamp_value<long>(h, 1, image.height));
        return d;
    }

    CropDecision decide_crop(const Dimensions& image,
                             const DetectionResult& detections,
                             const AspectRatio& target,
                             const CropOptions& options) {
        const Dimensions crop = crop_dimensions(image, ratio_of(target));

        CropDecision out;
        BoundingBox box;

        if (has_detections(detections)) {
            const Point com = weighted_center_of_mass(all_detections(detections));
            box = place_centered_at(com, crop, image);
            out.strategy = CropStrategy::PeopleCentered;
            out.quality_score = people_quality_score(box, com, detections.confidence);
            out.crop_area.confidence = clamp_value(detections.confidence, 0.0f, 1.0f);
        } else {
            switch (options.fallback_strategy) {
                case FallbackStrategy::Center:
                    box = center_crop(image, crop);
                    out.strategy = CropStrategy::FallbackCenter;
                    break;
                case FallbackStrategy::RuleOfThirds:
                    box = rule_of_thirds_crop(image, crop);
                    out.strategy = CropStrategy::RuleOfThirds;
                    break;
                case FallbackStrategy::Smart:
                default:
                    box = smart_crop(image, crop);
                    out.strategy = CropStrategy::FallbackSmart;
                    break;
            }
            out.quality_score = kFallbackCropConfidence;
            out.crop_area.confidence = kFallbackCropConfidence;
        }

        static_cast<BoundingBox&>(out.crop_area) = clamp_box(box, image);
        return out;
    }
}
