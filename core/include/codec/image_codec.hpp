#pragma once

#include <string>
#include <vector>

#include <opencv2/core.hpp>

#include <common/geometry.hpp>

namespace pc {
    struct Rgb {
        int r = 255;
        int g = 255;
        int b = 255;
    };

    struct Placement {
        cv::Mat raster;
        int x = 0;
        int y = 0;
    };

    // Pixel-level operations on image files.
    class IImageCodec {
    public:
        virtual ~IImageCodec() = default;

        virtual Dimensions probe(const std::string& image_path) = 0;

        // Writes the box of image_path to output_path, returns the written size.
        virtual Dimensions crop(const std::string& image_path,
                                const BoundingBox& box,
                                const std::string& output_path) = 0;

        // Fit inside cell, keep aspect ratio, no enlargement.
        virtual cv::Mat resize_to_fit(const std::string& image_path, const Dimensions& cell) = 0;

        // Pastes placements on a filled canvas and writes it, returns output_path.
        virtual std::string compose(const Dimensions& canvas,
                                    const Rgb& background,
                                    const std::vector<Placement>& placements,
                                    const std::string& output_path) = 0;
    };
}
