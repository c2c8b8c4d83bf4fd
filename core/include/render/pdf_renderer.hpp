#pragma once

#include <string>
#include <vector>

#include <pipeline/types.hpp>

namespace pc {
    struct PdfMetadata {
        std::string title = "Composed Image Sheets";
        std::string author = "PrintCrop";
        std::string subject = "Processed images arranged in A4 sheets";
        std::string creator = "PrintCrop pipeline";
        std::string keywords;
    };

    // Title and keywords describing the job's ratio, layout and counts.
    PdfMetadata make_pdf_metadata(const ProcessingOptions& options, const std::vector<ComposedSheet>& sheets);

    // Paths of sheet files that do not exist on disk.
    std::vector<std::string> missing_sheet_files(const std::vector<ComposedSheet>& sheets);

    // One page per sheet, in order. Returns the written PDF path.
    class IPdfRenderer {
    public:
        virtual ~IPdfRenderer() = default;

        virtual std::string render(const std::vector<ComposedSheet>& sheets,
                                   const std::string& output_dir,
                                   const PdfMetadata& metadata) = 0;
    };
}
