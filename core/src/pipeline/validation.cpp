#include <pipeline/validation.hpp>

#include <stdexcept>

namespace pc {
    std::vector<std::string> validate_processing_options(const ProcessingOptions& options) {
        std::vector<std::string> errors;

        if (!is_valid_aspect_ratio(options.aspect_ratio)) {
            errors.push_back("Invalid aspect ratio configuration");
        }

        if (options.sheet_composition && options.sheet_composition->enabled) {
            const auto& g = options.sheet_composition->grid_layout;
            if (g.rows < 1 || g.rows > kMaxGridDimension ||
                g.columns < 1 || g.columns > kMaxGridDimension) {
                errors.push_back("Invalid grid layout configuration: " + std::to_string(g.rows) + "x" +
                                 std::to_string(g.columns) + " (rows and columns must be 1.." +
                                 std::to_string(kMaxGridDimension) + ")");
            }
        }
        return errors;
    }

    void validate_job_or_throw(const Job& job) {
        std::vector<std::string> errors = validate_processing_options(job.options);

        if (job.files.empty()) {
            errors.push_back("Job has no input files");
        }
        for (const auto& f : job.files) {
            if (f.upload_path.empty()) {
                errors.push_back("File " + (f.original_name.empty() ? f.id : f.original_name) + " has no path");
            }
        }

        if (errors.empty()) return;

        std::string msg = "Invalid processing options: ";
        for (size_t i = 0; i < errors.size(); ++i) {
            if (i) msg += "; ";
            msg += errors[i];
        }
        throw std::invalid_argument(msg);
    }
}
