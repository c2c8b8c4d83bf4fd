#pragma once

#include <string>

namespace pc {
    enum class Orientation {
        Portrait,
        Landscape,
        Square
    };

    enum class SheetOrientation {
        Portrait,
        Landscape
    };

    struct Dimensions {
        int width = 0;
        int height = 0;
    };

    struct BoundingBox {
        int x = 0;
        int y = 0;
        int width = 0;
        int height = 0;
    };

    struct Point {
        double x = 0.0;
        double y = 0.0;
    };

    // width/height are a ratio, not pixels
    struct AspectRatio {
        double width = 0.0;
        double height = 0.0;
        std::string name;
        Orientation orientation = Orientation::Square;
    };

    Orientation orientation_for(double width, double height);
    AspectRatio make_aspect_ratio(double width, double height, std::string name = {});
    double ratio_of(const AspectRatio& ar);
    bool is_valid_aspect_ratio(const AspectRatio& ar);

    // Predefined print ratios: 4x6, 5x7, 8x10, 16x9, 3x2, Square.
    bool find_aspect_ratio(const std::string& name, AspectRatio& out);

    bool is_valid(const Dimensions& d);

    template <class T>
    T clamp_value(T v, T lo, T hi) {
        if (v < lo) return lo;
        if (v > hi) return hi;
        return v;
    }

    BoundingBox clamp_box(const BoundingBox& b, const Dimensions& image);
    bool box_inside(const BoundingBox& b, const Dimensions& image);
    Point box_center(const BoundingBox& b);

    // Largest size with the aspect of `src` that fits in `bounds` without enlargement.
    Dimensions fit_inside(const Dimensions& src, const Dimensions& bounds);

    const char* to_string(Orientation o);
    const char* to_string(SheetOrientation o);
    bool parse_sheet_orientation(const std::string& s, SheetOrientation& out);
}
