#pragma once

#include <algorithm>
#include <string>
#include <vector>

#include <pipeline/types.hpp>

namespace pc {
    // Finds faces and/or people in an image file.
    // Implementations throw on unreadable input; callers treat any error as "no detections".
    class IDetector {
    public:
        virtual ~IDetector() = default;

        virtual std::vector<Detection> detect(const std::string& image_path,
                                              const std::vector<DetectionType>& types,
                                              float confidence_threshold) = 0;
    };

    inline bool wants(const std::vector<DetectionType>& types, DetectionType t) {
        return std::find(types.begin(), types.end(), t) != types.end();
    }
}
