#include <layout/sheet_layout.hpp>

#include <algorithm>
#include <filesystem>
#include <iostream>
#include <stdexcept>

#include <common/ids.hpp>

namespace pc {
    Dimensions a4_page_dimensions(SheetOrientation o) {
        return o == SheetOrientation::Landscape ? kA4Landscape300 : kA4Portrait300;
    }

    int spacing_for_layout(const GridLayout& layout, const SheetLayoutConfig& cfg) {
        if (capacity_of(layout) >= cfg.dense_cell_threshold) return cfg.dense_spacing;
        const auto& names = cfg.dense_layout_names;
        if (std::find(names.begin(), names.end(), layout.name) != names.end()) return cfg.dense_spacing;
        return cfg.spacing;
    }

    SheetGeometry compute_sheet_geometry(const GridLayout& layout,
                                         const Dimensions& canvas,
                                         int occupied,
                                         const SheetLayoutConfig& cfg) {
        if (layout.rows < 1 || layout.columns < 1) {
            throw std::invalid_argument("[Layout] grid needs at least one row and one column");
        }

        SheetGeometry g;
        g.canvas = canvas;
        g.spacing = spacing_for_layout(layout, cfg);

        const int avail_w = canvas.width - 2 * cfg.margin - (layout.columns - 1) * g.spacing;
        const int avail_h = canvas.height - 2 * cfg.margin - (layout.rows - 1) * g.spacing;
        g.cell.width = avail_w / layout.columns;
        g.cell.height = avail_h / layout.rows;
        if (g.cell.width < 1 || g.cell.height < 1) {
            throw std::runtime_error("[Layout] grid " + layout.name + " does not fit on a " +
                                     std::to_string(canvas.width) + "x" + std::to_string(canvas.height) +
                                     " canvas");
        }

        occupied = std::clamp(occupied, 0, capacity_of(layout));
        if (occupied == 0) return g;

        const int cols_used = std::min(occupied, layout.columns);
        const int rows_used = (occupied + layout.columns - 1) / layout.columns;
        const int block_w = cols_used * g.cell.width + (cols_used - 1) * g.spacing;
        const int block_h = rows_used * g.cell.height + (rows_used - 1) * g.spacing;

        const int start_x = std::max(cfg.margin, (canvas.width - block_w) / 2);
        const int start_y = std::max(cfg.margin, (canvas.height - block_h) / 2);

        g.cells.reserve(static_cast<size_t>(occupied));
        for (int i = 0; i < occupied; ++i) {
            const int row = i / layout.columns;
            const int col = i % layout.columns;

            BoundingBox c;
            c.x = start_x + col * (g.cell.width + g.spacing);
            c.y = start_y + row * (g.cell.height + g.spacing);
            c.width = g.cell.width;
            c.height = g.cell.height;
            g.cells.push_back(c);
        }
        return g;
    }

    std::vector<std::pair<size_t, size_t>> paginate(size_t count, int capacity) {
        if (capacity < 1) throw std::invalid_argument("[Layout] capacity must be positive");

        const size_t cap = static_cast<size_t>(capacity);
        std::vector<std::pair<size_t, size_t>> out;
        out.reserve((count + cap - 1) / cap);
        for (size_t begin = 0; begin < count; begin += cap) {
            out.emplace_back(begin, std::min(begin + cap, count));
        }
        return out;
    }

    BoundingBox place_in_cell(const Dimensions& raster, const BoundingBox& cell) {
        BoundingBox b;
        b.width = raster.width;
        b.height = raster.height;
        b.x = cell.x + (cell.width - raster.width) / 2;
        b.y = cell.y + (cell.height - raster.height) / 2;
        return b;
    }

    SheetLayoutEngine::SheetLayoutEngine(IImageCodec& codec,
                                         PageDimensionsFn page_dimensions,
                                         SheetLayoutConfig cfg)
        : codec_(codec),
          page_dimensions_(std::move(page_dimensions)),
          cfg_(std::move(cfg)) {
        if (!page_dimensions_) page_dimensions_ = a4_page_dimensions;
    }

    std::vector<ComposedSheet> SheetLayoutEngine::compose_sheets(const std::vector<ProcessedImagePtr>& images,
                                                                 const GridLayout& layout,
                                                                 SheetOrientation orientation,
                                                                 const std::string& output_dir) {
        if (images.empty()) {
            throw std::invalid_argument("No images provided for sheet composition");
        }
        if (layout.rows < 1 || layout.columns < 1) {
            throw std::invalid_argument("[Layout] grid needs at least one row and one column");
        }

        std::vector<ComposedSheet> sheets;
        const auto pages = paginate(images.size(), capacity_of(layout));
        sheets.reserve(pages.size());

        for (size_t i = 0; i < pages.size(); ++i) {
            const std::vector<ProcessedImagePtr> chunk(images.begin() + static_cast<std::ptrdiff_t>(pages[i].first),
                                                       images.begin() + static_cast<std::ptrdiff_t>(pages[i].second));
            sheets.push_back(compose_one_(chunk, layout, orientation, output_dir, i));
        }
        return sheets;
    }

    ComposedSheet SheetLayoutEngine::compose_one_(const std::vector<ProcessedImagePtr>& images,
                                                  const GridLayout& layout,
                                                  SheetOrientation orientation,
                                                  const std::string& output_dir,
                                                  size_t sheet_index) {
        const Dimensions canvas = page_dimensions_(orientation);
        const SheetGeometry geo = compute_sheet_geometry(layout, canvas, static_cast<int>(images.size()), cfg_);

        ComposedSheet sheet;
        sheet.id = make_uuid();
        sheet.layout = layout;
        sheet.orientation = orientation;
        sheet.images = images;
        sheet.empty_slots = std::max(0, capacity_of(layout) - static_cast<int>(images.size()));

        std::vector<Placement> placements;
        placements.reserve(images.size());

        for (size_t i = 0; i < images.size() && i < geo.cells.size(); ++i) {
            const auto& img = images[i];
            if (!img) continue;

            try {
                cv::Mat raster = codec_.resize_to_fit(img->processed_path, geo.cell);
                if (raster.empty()) {
                    throw std::runtime_error("empty raster");
                }
                if (raster.cols > geo.cell.width || raster.rows > geo.cell.height) {
                    throw std::runtime_error("raster " + std::to_string(raster.cols) + "x" +
                                             std::to_string(raster.rows) + " exceeds cell");
                }

                const BoundingBox at = place_in_cell({raster.cols, raster.rows}, geo.cells[i]);
                Placement p;
                p.raster = std::move(raster);
                p.x = at.x;
                p.y = at.y;
                placements.push_back(std::move(p));
            } catch (const std::exception& e) {
                std::cerr << "[Layout](compose_one_) skipping image " << img->id
                          << " on sheet " << (sheet_index + 1) << ": " << e.what() << "\n";
            }
        }

        const std::string name = "sheet_" + std::to_string(sheet_index + 1) + "_" + sheet.id + ".jpg";
        const std::string path = (std::filesystem::path(output_dir) / name).string();
        sheet.sheet_path = codec_.compose(canvas, cfg_.background, placements, path);
        sheet.created_at = Clock::now();
        return sheet;
    }
}
