#include <common/geometry.hpp>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <utility>

namespace pc {
    namespace {
        std::string lower(std::string s) {
            std::transform(s.begin(),
                           s.end(),
                           s.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return s;
        }

        struct NamedRatio {
            const char* name;
            double width;
            double height;
        };

        constexpr NamedRatio kPrintRatios[] = {
            {"4x6", 4.0, 6.0},
            {"5x7", 5.0, 7.0},
            {"8x10", 8.0, 10.0},
            {"16x9", 16.0, 9.0},
            {"3x2", 3.0, 2.0},
            {"Square", 1.0, 1.0},
        };
    } // namespace

    Orientation orientation_for(double width, double height) {
        if (width > height) return Orientation::Landscape;
        if (width < height) return Orientation::Portrait;
        return Orientation::Square;
    }

    AspectRatio make_aspect_ratio(double width, double height, std::string name) {
        AspectRatio ar;
        ar.width = width;
        ar.height = height;
        ar.orientation = orientation_for(width, height);
        if (name.empty()) {
            name = std::to_string(static_cast<long long>(std::lround(width))) + "x" +
                   std::to_string(static_cast<long long>(std::lround(height)));
        }
        ar.name = std::move(name);
        return ar;
    }

    double ratio_of(const AspectRatio& ar) {
        return ar.width / ar.height;
    }

    bool is_valid_aspect_ratio(const AspectRatio& ar) {
        if (!std::isfinite(ar.width) || !std::isfinite(ar.height)) return false;
        if (ar.width <= 0.0 || ar.height <= 0.0) return false;
        return ar.orientation == orientation_for(ar.width, ar.height);
    }

    bool find_aspect_ratio(const std::string& name, AspectRatio& out) {
        const std::string key = lower(name);
        for (const auto& r : kPrintRatios) {
            if (lower(r.name) == key) {
                out = make_aspect_ratio(r.width, r.height, r.name);
                return true;
            }
        }
        return false;
    }

    bool is_valid(const Dimensions& d) {
        return d.width > 0 && d.height > 0;
    }

    BoundingBox clamp_box(const BoundingBox& b, const Dimensions& image) {
        BoundingBox r;
        r.width = clamp_value(b.width, 1, std::max(1, image.width));
        r.height = clamp_value(b.height, 1, std::max(1, image.height));
        r.x = clamp_value(b.x, 0, std::max(0, image.width - r.width));
        r.y = clamp_value(b.y, 0, std::max(0, image.height - r.height));
        return r;
    }

    bool box_inside(const BoundingBox& b, const Dimensions& image) {
        return b.x >= 0 && b.y >= 0 && b.width > 0 && b.height > 0 &&
               b.x + b.width <= image.width && b.y + b.height <= image.height;
    }

    Point box_center(const BoundingBox& b) {
        return {b.x + b.width / 2.0, b.y + b.height / 2.0};
    }

    Dimensions fit_inside(const Dimensions& src, const Dimensions& bounds) {
        if (!is_valid(src) || !is_valid(bounds)) return {};

        const double sx = double(bounds.width) / double(src.width);
        const double sy = double(bounds.height) / double(src.height);
        const double s = std::min(1.0, std::min(sx, sy));

        Dimensions out;
        out.width = std::min(bounds.width, std::max(1, int(std::lround(src.width * s))));
        out.height = std::min(bounds.height, std::max(1, int(std::lround(src.height * s))));
        return out;
    }

    const char* to_string(Orientation o) {
        switch (o) {
            case Orientation::Portrait: return "portrait";
            case Orientation::Landscape: return "landscape";
            case Orientation::Square: return "square";
        }
        return "square";
    }

    const char* to_string(SheetOrientation o) {
        return o == SheetOrientation::Landscape ? "landscape" : "portrait";
    }

    bool parse_sheet_orientation(const std::string& s, SheetOrientation& out) {
        const std::string v = lower(s);
        if (v == "portrait") {
            out = SheetOrientation::Portrait;
            return true;
        }
        if (v == "landscape") {
            out = SheetOrientation::Landscape;
            return true;
        }
        return false;
    }
}
