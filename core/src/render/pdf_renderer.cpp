#include <render/pdf_renderer.hpp>

#include <filesystem>
#include <system_error>

namespace pc {
    PdfMetadata make_pdf_metadata(const ProcessingOptions& options, const std::vector<ComposedSheet>& sheets) {
        size_t images = 0;
        for (const auto& s : sheets) images += s.images.size();

        PdfMetadata m;
        m.keywords = "aspect_ratio=" + options.aspect_ratio.name +
                     ", face_detection=" + (options.face_detection_enabled ? "true" : "false") +
                     ", sheets=" + std::to_string(sheets.size()) +
                     ", images=" + std::to_string(images);

        if (options.sheet_composition) {
            const auto& sc = *options.sheet_composition;
            m.keywords += ", grid_layout=" + sc.grid_layout.name;
            m.keywords += ", orientation=" + std::string(to_string(sc.orientation));
        }
        return m;
    }

    std::vector<std::string> missing_sheet_files(const std::vector<ComposedSheet>& sheets) {
        std::vector<std::string> missing;
        for (const auto& s : sheets) {
            std::error_code ec;
            if (!std::filesystem::is_regular_file(s.sheet_path, ec)) missing.push_back(s.sheet_path);
        }
        return missing;
    }
}
