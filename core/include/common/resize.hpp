#pragma once

#include <opencv2/imgproc.hpp>
#include <string>
#include <algorithm>

#include <common/geometry.hpp>

namespace pc {
    inline int interp_from_str(const std::string& s) {
        if (s == "nearest") return cv::INTER_NEAREST;
        if (s == "cubic") return cv::INTER_CUBIC;
        if (s == "linear") return cv::INTER_LINEAR;
        if (s == "lanczos") return cv::INTER_LANCZOS4;
        return cv::INTER_AREA;
    }

    // Scales src down to fit inside bounds keeping its aspect ratio. Never enlarges.
    inline cv::Mat resize_to_fit(
        const cv::Mat& src,
        const Dimensions& bounds,
        int interp
    ) {
        if (src.empty() || !is_valid(bounds)) return src;

        const Dimensions target = fit_inside({src.cols, src.rows}, bounds);
        if (target.width == src.cols && target.height == src.rows) return src.clone();

        cv::Mat resized;
        cv::resize(src, resized, {target.width, target.height}, 0, 0, interp);
        return resized;
    }
}
