#include <render/cairo_pdf_renderer.hpp>

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <system_error>
#include <utility>

#include <cairo-pdf.h>
#include <cairo.h>

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include <common/ids.hpp>

namespace pc {
    namespace {
        struct SurfaceDeleter {
            void operator()(cairo_surface_t* s) const { cairo_surface_destroy(s); }
        };
        struct ContextDeleter {
            void operator()(cairo_t* cr) const { cairo_destroy(cr); }
        };

        using SurfacePtr = std::unique_ptr<cairo_surface_t, SurfaceDeleter>;
        using ContextPtr = std::unique_ptr<cairo_t, ContextDeleter>;

        void check_status(cairo_status_t st, const std::string& what) {
            if (st != CAIRO_STATUS_SUCCESS) {
                throw std::runtime_error(what + ": " + cairo_status_to_string(st));
            }
        }

        bool little_endian_host() {
            const uint32_t one = 1;
            unsigned char first = 0;
            std::memcpy(&first, &one, 1);
            return first == 1;
        }

        // Cairo RGB24 pixels are native-endian 32-bit words, 0xXXRRGGBB.
        SurfacePtr surface_from_file(const std::string& path) {
            const cv::Mat bgr = cv::imread(path, cv::IMREAD_COLOR);
            if (bgr.empty()) {
                throw std::runtime_error("Unable to read sheet image: " + path);
            }

            SurfacePtr s(cairo_image_surface_create(CAIRO_FORMAT_RGB24, bgr.cols, bgr.rows));
            check_status(cairo_surface_status(s.get()), "cairo image surface for " + path);

            cairo_surface_flush(s.get());
            unsigned char* data = cairo_image_surface_get_data(s.get());
            const int stride = cairo_image_surface_get_stride(s.get());

            cv::Mat bgra(bgr.rows, bgr.cols, CV_8UC4, data, static_cast<size_t>(stride));
            if (little_endian_host()) {
                cv::cvtColor(bgr, bgra, cv::COLOR_BGR2BGRA);
            } else {
                // Big-endian byte order is X,R,G,B.
                bgra.setTo(cv::Scalar::all(255));
                const int from_to[] = {0, 3, 1, 2, 2, 1};
                cv::mixChannels(&bgr, 1, &bgra, 1, from_to, 3);
            }
            cairo_surface_mark_dirty(s.get());
            return s;
        }

        void set_metadata(cairo_surface_t* pdf, const PdfMetadata& m) {
            cairo_pdf_surface_set_metadata(pdf, CAIRO_PDF_METADATA_TITLE, m.title.c_str());
            cairo_pdf_surface_set_metadata(pdf, CAIRO_PDF_METADATA_AUTHOR, m.author.c_str());
            cairo_pdf_surface_set_metadata(pdf, CAIRO_PDF_METADATA_SUBJECT, m.subject.c_str());
            cairo_pdf_surface_set_metadata(pdf, CAIRO_PDF_METADATA_CREATOR, m.creator.c_str());
            if (!m.keywords.empty()) {
                cairo_pdf_surface_set_metadata(pdf, CAIRO_PDF_METADATA_KEYWORDS, m.keywords.c_str());
            }
        }
    } // namespace

    CairoPdfRenderer::CairoPdfRenderer(CairoPdfRendererConfig cfg)
        : cfg_(std::move(cfg)) {}

    std::string CairoPdfRenderer::render(const std::vector<ComposedSheet>& sheets,
                                         const std::string& output_dir,
                                         const PdfMetadata& metadata) {
        if (sheets.empty()) {
            throw std::invalid_argument("No sheets provided for PDF generation");
        }

        std::filesystem::create_directories(output_dir);
        const std::string pdf_path =
            (std::filesystem::path(output_dir) / ("composed_sheets_" + make_uuid() + ".pdf")).string();

        auto page_size = [this](SheetOrientation o) {
            return o == SheetOrientation::Landscape
                ? std::make_pair(cfg_.page_height_pt, cfg_.page_width_pt)
                : std::make_pair(cfg_.page_width_pt, cfg_.page_height_pt);
        };

        try {
            const auto first = page_size(sheets.front().orientation);
            SurfacePtr pdf(cairo_pdf_surface_create(pdf_path.c_str(), first.first, first.second));
            check_status(cairo_surface_status(pdf.get()), "cairo pdf surface " + pdf_path);
            set_metadata(pdf.get(), metadata);

            ContextPtr cr(cairo_create(pdf.get()));
            check_status(cairo_status(cr.get()), "cairo context");

            for (const auto& sheet : sheets) {
                const auto [pw, ph] = page_size(sheet.orientation);
                cairo_pdf_surface_set_size(pdf.get(), pw, ph);

                SurfacePtr img = surface_from_file(sheet.sheet_path);
                const double iw = cairo_image_surface_get_width(img.get());
                const double ih = cairo_image_surface_get_height(img.get());
                const double scale = std::min(pw / iw, ph / ih);

                cairo_save(cr.get());
                cairo_set_source_rgb(cr.get(), 1.0, 1.0, 1.0);
                cairo_paint(cr.get());
                cairo_translate(cr.get(), (pw - iw * scale) / 2.0, (ph - ih * scale) / 2.0);
                cairo_scale(cr.get(), scale, scale);
                cairo_set_source_surface(cr.get(), img.get(), 0, 0);
                cairo_paint(cr.get());
                cairo_restore(cr.get());

                cairo_show_page(cr.get());
                check_status(cairo_status(cr.get()), "cairo page for sheet " + sheet.id);
            }

            cr.reset();
            cairo_surface_finish(pdf.get());
            check_status(cairo_surface_status(pdf.get()), "cairo finish " + pdf_path);
        } catch (const std::exception& e) {
            std::error_code ec;
            std::filesystem::remove(pdf_path, ec);
            std::cerr << "[Pdf](render) " << e.what() << "\n";
            throw;
        }

        return pdf_path;
    }
}
