#pragma once

#include <string>
#include <vector>

#include <common/geometry.hpp>
#include <pipeline/types.hpp>

namespace pc {
    enum class FallbackStrategy {
        Center,
        RuleOfThirds,
        Smart
    };

    bool parse_fallback_strategy(const std::string& s, FallbackStrategy& out);
    const char* to_string(FallbackStrategy s);

    struct CropOptions {
        FallbackStrategy fallback_strategy = FallbackStrategy::Smart;
    };

    struct CropDecision {
        CropArea crop_area;
        CropStrategy strategy = CropStrategy::FallbackSmart;
        double quality_score = 0.0;
    };

    // Confidence and quality reported for every fallback crop. Downstream statistics
    // depend on the exact value.
    inline constexpr float kFallbackCropConfidence = 0.4f;

    // Confidence-weighted mean of detection centers; (0,0) for an empty set.
    Point weighted_center_of_mass(const std::vector<Detection>& detections);

    // Largest box of the target ratio that fits inside the image.
    Dimensions crop_dimensions(const Dimensions& image, double target_ratio);

    // Precondition: image has positive width and height. Callers reject empty images
    // before asking for a decision.
    CropDecision decide_crop(const Dimensions& image,
                             const DetectionResult& detections,
                             const AspectRatio& target,
                             const CropOptions& options = {});
}
