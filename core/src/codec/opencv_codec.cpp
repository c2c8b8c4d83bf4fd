#include <codec/opencv_codec.hpp>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <stdexcept>
#include <utility>
#include <vector>

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include <common/resize.hpp>

namespace pc {
    namespace {
        bool is_png(const std::string& path) {
            std::string ext = std::filesystem::path(path).extension().string();
            std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) {
                return static_cast<char>(std::tolower(c));
            });
            return ext == ".png";
        }
    } // namespace

    OpenCvCodec::OpenCvCodec(OpenCvCodecConfig cfg)
        : cfg_(std::move(cfg)),
          interp_(interp_from_str(cfg_.interp)) {
        cfg_.jpeg_quality = std::clamp(cfg_.jpeg_quality, 1, 100);
    }

    cv::Mat OpenCvCodec::read_or_throw_(const std::string& path) const {
        if (!std::filesystem::exists(path)) {
            throw std::runtime_error("Image file not found: " + path);
        }
        cv::Mat img = cv::imread(path, cv::IMREAD_COLOR);
        if (img.empty()) {
            throw std::runtime_error("Unable to decode image: " + path);
        }
        return img;
    }

    void OpenCvCodec::write_or_throw_(const std::string& path, const cv::Mat& img) const {
        const auto parent = std::filesystem::path(path).parent_path();
        if (!parent.empty()) std::filesystem::create_directories(parent);

        std::vector<int> params;
        if (is_png(path)) {
            params = {cv::IMWRITE_PNG_COMPRESSION, 6};
        } else {
            params = {cv::IMWRITE_JPEG_QUALITY, cfg_.jpeg_quality, cv::IMWRITE_JPEG_PROGRESSIVE, 1};
        }

        if (!cv::imwrite(path, img, params)) {
            throw std::runtime_error("Unable to write image: " + path);
        }
    }

    Dimensions OpenCvCodec::probe(const std::string& image_path) {
        const cv::Mat img = read_or_throw_(image_path);
        return {img.cols, img.rows};
    }

    Dimensions OpenCvCodec::crop(const std::string& image_path,
                                 const BoundingBox& box,
                                 const std::string& output_path) {
        const cv::Mat img = read_or_throw_(image_path);

        const cv::Rect want(box.x, box.y, box.width, box.height);
        const cv::Rect roi = want & cv::Rect(0, 0, img.cols, img.rows);
        if (roi.width <= 0 || roi.height <= 0) {
            throw std::runtime_error("Crop box lies outside the image: " + image_path);
        }

        const cv::Mat out = img(roi).clone();
        write_or_throw_(output_path, out);
        return {out.cols, out.rows};
    }

    cv::Mat OpenCvCodec::resize_to_fit(const std::string& image_path, const Dimensions& cell) {
        const cv::Mat img = read_or_throw_(image_path);
        return pc::resize_to_fit(img, cell, interp_);
    }

    std::string OpenCvCodec::compose(const Dimensions& canvas,
                                     const Rgb& background,
                                     const std::vector<Placement>& placements,
                                     const std::string& output_path) {
        if (!is_valid(canvas)) {
            throw std::runtime_error("Invalid canvas size for " + output_path);
        }

        cv::Mat out(canvas.height, canvas.width, CV_8UC3, cv::Scalar(background.b, background.g, background.r));
        const cv::Rect bounds(0, 0, out.cols, out.rows);

        for (const auto& p : placements) {
            if (p.raster.empty()) continue;

            cv::Mat src = p.raster;
            if (src.channels() == 4) {
                cv::cvtColor(src, src, cv::COLOR_BGRA2BGR);
            } else if (src.channels() == 1) {
                cv::cvtColor(src, src, cv::COLOR_GRAY2BGR);
            }

            const cv::Rect dst = cv::Rect(p.x, p.y, src.cols, src.rows) & bounds;
            if (dst.width <= 0 || dst.height <= 0) continue;

            const cv::Rect src_roi(dst.x - p.x, dst.y - p.y, dst.width, dst.height);
            src(src_roi).copyTo(out(dst));
        }

        write_or_throw_(output_path, out);
        return output_path;
    }
}
