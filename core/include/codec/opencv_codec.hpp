#pragma once

#include <string>

#include <codec/image_codec.hpp>

namespace pc {
    struct OpenCvCodecConfig {
        int jpeg_quality = 95;
        std::string interp = "area"; // nearest|linear|cubic|area|lanczos
    };

    class OpenCvCodec : public IImageCodec {
    public:
        explicit OpenCvCodec(OpenCvCodecConfig cfg = {});

        Dimensions probe(const std::string& image_path) override;
        Dimensions crop(const std::string& image_path,
                        const BoundingBox& box,
                        const std::string& output_path) override;
        cv::Mat resize_to_fit(const std::string& image_path, const Dimensions& cell) override;
        std::string compose(const Dimensions& canvas,
                            const Rgb& background,
                            const std::vector<Placement>& placements,
                            const std::string& output_path) override;

    private:
        cv::Mat read_or_throw_(const std::string& path) const;
        void write_or_throw_(const std::string& path, const cv::Mat& img) const;

        OpenCvCodecConfig cfg_;
        int interp_;
    };
}
