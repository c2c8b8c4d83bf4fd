#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>

#include <codec/image_codec.hpp>
#include <common/retry.hpp>
#include <cropping/crop_engine.hpp>
#include <inference/detector.hpp>
#include <layout/sheet_layout.hpp>
#include <pipeline/image_processor.hpp>
#include <pipeline/types.hpp>
#include <remote/processing_service.hpp>
#include <render/pdf_renderer.hpp>

namespace pc {
    enum class ProcessingStrategy {
        Remote,
        Local
    };

    const char* to_string(ProcessingStrategy s);

    using ProgressFn = std::function<void(const JobProgress&)>;

    // Drives one job through processing, composition and PDF generation.
    class PipelineOrchestrator {
    public:
        struct Options {
            std::string output_dir = "processed";
            std::string temp_dir = "temp";
            bool cleanup_on_error = true;

            // max_attempts per file, base_delay doubles per attempt
            RetryPolicy retry;

            float detection_confidence = 0.4f;
            CropOptions crop;
            ProgressFn progress;
        };

        // detector and remote may be null.
        PipelineOrchestrator(IImageCodec& codec,
                             IPdfRenderer& pdf,
                             IDetector* detector = nullptr,
                             IRemoteProcessingService* remote = nullptr,
                             PageDimensionsFn page_dimensions = a4_page_dimensions,
                             SheetLayoutConfig sheet = {});

        // Throws std::invalid_argument for an unusable job before doing any work, and
        // std::runtime_error when no image could be processed. Later stages degrade.
        ProcessingResults execute(Job& job, const Options& opt);

    private:
        ProcessingStrategy resolve_strategy_();

        PipelineStageResult<std::vector<ProcessedImagePtr>> process_images_(Job& job,
                                                                            const Options& opt,
                                                                            ProcessingStrategy strategy,
                                                                            std::vector<std::string>& errors);

        // nullopt when the batch call itself failed and per-image processing should run.
        std::optional<PipelineStageResult<std::vector<ProcessedImagePtr>>> try_batch_(Job& job,
                                                                                      const Options& opt,
                                                                                      std::vector<std::string>& errors);

        ProcessedImage process_one_(const FileMetadata& file, const ImageTask& task, ProcessingStrategy strategy);

        PipelineStageResult<std::vector<ComposedSheet>> compose_sheets_(const Job& job,
                                                                        const std::vector<ProcessedImagePtr>& images,
                                                                        const Options& opt,
                                                                        ProcessingStrategy strategy);

        std::vector<ComposedSheet> compose_remote_(const SheetCompositionOptions& sc,
                                                   const std::vector<ProcessedImagePtr>& images);

        PipelineStageResult<std::string> generate_pdf_(const Job& job,
                                                       const std::vector<ComposedSheet>& sheets,
                                                       const Options& opt);

        void cleanup_(const ProcessingResults& results);
        void report_(Job& job, const Options& opt, PipelineStage stage, int processed, int percentage);

        ImageTask task_for_(const Job& job, const Options& opt) const;

        IImageCodec& codec_;
        IPdfRenderer& pdf_;
        IDetector* detector_;
        IRemoteProcessingService* remote_;
        PageDimensionsFn page_dimensions_;
        SheetLayoutConfig sheet_cfg_;
    };
}
