#pragma once

#include <string>
#include <vector>

#include <pipeline/types.hpp>

namespace pc {
    inline constexpr int kMaxGridDimension = 10;

    // Every problem found, empty when the options are usable.
    std::vector<std::string> validate_processing_options(const ProcessingOptions& options);

    // Throws std::invalid_argument listing every problem with the job.
    void validate_job_or_throw(const Job& job);
}
