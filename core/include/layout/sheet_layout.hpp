#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <utility>
#include <vector>

#include <codec/image_codec.hpp>
#include <common/geometry.hpp>
#include <pipeline/types.hpp>

namespace pc {
    // A4 at 300 DPI.
    inline constexpr Dimensions kA4Portrait300{2480, 3508};
    inline constexpr Dimensions kA4Landscape300{3508, 2480};

    using PageDimensionsFn = std::function<Dimensions(SheetOrientation)>;

    Dimensions a4_page_dimensions(SheetOrientation o);

    struct SheetLayoutConfig {
        int margin = 30;
        int spacing = 15;
        int dense_spacing = 10;

        // Grids with at least this many cells, or listed by name, use dense_spacing.
        int dense_cell_threshold = 4;
        std::vector<std::string> dense_layout_names = {"1x3"};

        Rgb background{255, 255, 255};
    };

    int spacing_for_layout(const GridLayout& layout, const SheetLayoutConfig& cfg);

    struct SheetGeometry {
        Dimensions canvas;
        Dimensions cell;
        int spacing = 0;
        std::vector<BoundingBox> cells; // one per occupied slot, row-major
    };

    // Cell size comes from the full grid; the block of occupied cells is centered on the
    // canvas and kept at least `margin` from the edges.
    SheetGeometry compute_sheet_geometry(const GridLayout& layout,
                                         const Dimensions& canvas,
                                         int occupied,
                                         const SheetLayoutConfig& cfg);

    // Consecutive [begin, end) ranges of at most `capacity` items.
    std::vector<std::pair<size_t, size_t>> paginate(size_t count, int capacity);

    // Centers a raster of the given size inside the cell.
    BoundingBox place_in_cell(const Dimensions& raster, const BoundingBox& cell);

    class SheetLayoutEngine {
    public:
        SheetLayoutEngine(IImageCodec& codec,
                          PageDimensionsFn page_dimensions = a4_page_dimensions,
                          SheetLayoutConfig cfg = {});

        std::vector<ComposedSheet> compose_sheets(const std::vector<ProcessedImagePtr>& images,
                                                  const GridLayout& layout,
                                                  SheetOrientation orientation,
                                                  const std::string& output_dir);

        const SheetLayoutConfig& config() const { return cfg_; }

    private:
        ComposedSheet compose_one_(const std::vector<ProcessedImagePtr>& images,
                                   const GridLayout& layout,
                                   SheetOrientation orientation,
                                   const std::string& output_dir,
                                   size_t sheet_index);

        IImageCodec& codec_;
        PageDimensionsFn page_dimensions_;
        SheetLayoutConfig cfg_;
    };
}
