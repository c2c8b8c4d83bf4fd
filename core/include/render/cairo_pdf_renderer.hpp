#pragma once

#include <string>
#include <vector>

#include <render/pdf_renderer.hpp>

namespace pc {
    struct CairoPdfRendererConfig {
        // A4 in PostScript points, portrait.
        double page_width_pt = 595.28;
        double page_height_pt = 841.89;
    };

    class CairoPdfRenderer : public IPdfRenderer {
    public:
        explicit CairoPdfRenderer(CairoPdfRendererConfig cfg = {});

        std::string render(const std::vector<ComposedSheet>& sheets,
                           const std::string& output_dir,
                           const PdfMetadata& metadata) override;

    private:
        CairoPdfRendererConfig cfg_;
    };
}
