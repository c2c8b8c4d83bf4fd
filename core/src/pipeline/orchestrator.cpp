#include <pipeline/orchestrator.hpp>

#include <cmath>
#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <system_error>
#include <utility>

#include <common/ids.hpp>
#include <pipeline/validation.hpp>

namespace pc {
    namespace {
        int percent_of(size_t done, size_t total) {
            if (total == 0) return 0;
            return static_cast<int>(std::lround(100.0 * static_cast<double>(done) / static_cast<double>(total)));
        }

        std::string join(const std::vector<std::string>& parts, const char* sep) {
            std::string out;
            for (size_t i = 0; i < parts.size(); ++i) {
                if (i) out += sep;
                out += parts[i];
            }
            return out;
        }

        std::string normalized(const std::string& p) {
            return std::filesystem::path(p).lexically_normal().string();
        }

        std::string file_label(const FileMetadata& f) {
            return f.original_name.empty() ? f.upload_path : f.original_name;
        }
    } // namespace

    const char* to_string(ProcessingStrategy s) {
        return s == ProcessingStrategy::Remote ? "remote" : "local";
    }

    PipelineOrchestrator::PipelineOrchestrator(IImageCodec& codec,
                                               IPdfRenderer& pdf,
                                               IDetector* detector,
                                               IRemoteProcessingService* remote,
                                               PageDimensionsFn page_dimensions,
                                               SheetLayoutConfig sheet)
        : codec_(codec),
          pdf_(pdf),
          detector_(detector),
          remote_(remote),
          page_dimensions_(std::move(page_dimensions)),
          sheet_cfg_(std::move(sheet)) {
        if (!page_dimensions_) page_dimensions_ = a4_page_dimensions;
    }

    ProcessingResults PipelineOrchestrator::execute(Job& job, const Options& opt) {
        validate_job_or_throw(job);

        ProcessingResults results;
        results.job_id = job.id;

        try {
            std::filesystem::create_directories(opt.output_dir);
            if (!opt.temp_dir.empty()) std::filesystem::create_directories(opt.temp_dir);

            job.status = JobStatus::Processing;
            std::cerr << "[Pipeline](execute) starting image processing for job " << job.id
                      << " (" << job.files.size() << " files, fallback "
                      << to_string(opt.crop.fallback_strategy) << ")\n";

            const ProcessingStrategy strategy = resolve_strategy_();
            auto stage1 = process_images_(job, opt, strategy, results.errors);
            if (!stage1.success) {
                throw std::runtime_error("Image processing failed: " + stage1.error);
            }
            results.processed_images = std::move(stage1.data);

            if (!results.errors.empty()) {
                std::cerr << "[Pipeline](execute) some images failed to process: "
                          << join(results.errors, "; ") << "\n";
            }

            const auto& sc = job.options.sheet_composition;
            if (sc && sc->enabled && !results.processed_images.empty()) {
                job.status = JobStatus::Composing;
                report_(job, opt, PipelineStage::Composing, static_cast<int>(results.processed_images.size()), 85);

                auto stage2 = compose_sheets_(job, results.processed_images, opt, strategy);
                if (!stage2.success) {
                    std::cerr << "[Pipeline](execute) sheet composition failed: " << stage2.error << "\n";
                } else {
                    results.composed_sheets = std::move(stage2.data);
                }
            }

            if (sc && sc->generate_pdf && !results.composed_sheets.empty()) {
                job.status = JobStatus::GeneratingPdf;
                report_(job, opt, PipelineStage::GeneratingPdf, static_cast<int>(results.processed_images.size()), 95);

                auto stage3 = generate_pdf_(job, results.composed_sheets, opt);
                if (!stage3.success) {
                    std::cerr << "[Pipeline](execute) PDF generation failed: " << stage3.error << "\n";
                } else {
                    results.pdf_path = std::move(stage3.data);
                }
            }

            job.status = JobStatus::Completed;
            job.completed_at = Clock::now();
            report_(job, opt, PipelineStage::Completed, static_cast<int>(results.processed_images.size()), 100);

            std::cerr << "[Pipeline](execute) job " << job.id << " completed: "
                      << results.processed_images.size() << " images, "
                      << results.composed_sheets.size() << " sheets"
                      << (results.pdf_path ? ", pdf" : "") << "\n";
            return results;
        } catch (const std::exception& e) {
            std::cerr << "[Pipeline](execute) job " << job.id << " failed: " << e.what() << "\n";
            job.status = JobStatus::Failed;
            job.error_message = e.what();
            if (opt.cleanup_on_error) cleanup_(results);
            throw;
        }
    }

    ProcessingStrategy PipelineOrchestrator::resolve_strategy_() {
        if (!remote_) return ProcessingStrategy::Local;

        try {
            const RemoteHealth h = remote_->health_check();
            if (h.healthy()) {
                std::cerr << "[Pipeline](resolve_strategy_) remote service healthy, using remote processing\n";
                return ProcessingStrategy::Remote;
            }
            std::cerr << "[Pipeline](resolve_strategy_) remote service reports '" << h.status
                      << "', using local processing\n";
        } catch (const std::exception& e) {
            std::cerr << "[Pipeline](resolve_strategy_) health check failed, using local processing: "
                      << e.what() << "\n";
        }
        return ProcessingStrategy::Local;
    }

    ImageTask PipelineOrchestrator::task_for_(const Job& job, const Options& opt) const {
        ImageTask t;
        t.target = job.options.aspect_ratio;
        t.detect = job.options.face_detection_enabled;
        t.detection_confidence = opt.detection_confidence;
        t.output_dir = opt.output_dir;
        t.crop = opt.crop;
        return t;
    }

    PipelineStageResult<std::vector<ProcessedImagePtr>> PipelineOrchestrator::process_images_(
        Job& job,
        const Options& opt,
        ProcessingStrategy strategy,
        std::vector<std::string>& errors) {
        if (strategy == ProcessingStrategy::Remote && job.files.size() > 1) {
            if (auto batch = try_batch_(job, opt, errors)) return std::move(*batch);
        }

        const ImageTask task = task_for_(job, opt);
        const size_t total = job.files.size();
        std::vector<ProcessedImagePtr> images;
        images.reserve(total);

        for (size_t i = 0; i < total; ++i) {
            const FileMetadata& file = job.files[i];
            std::string last_error;

            try {
                ProcessedImage img = with_retry(
                    opt.retry,
                    [&](int attempt) {
                        std::cerr << "[Pipeline](process_images_) image " << (i + 1) << "/" << total << ": "
                                  << file_label(file) << " (attempt " << attempt << ")\n";
                        return process_one_(file, task, strategy);
                    },
                    [&](int attempt, const std::exception& e) {
                        last_error = "Error processing " + file_label(file) + " (attempt " +
                                     std::to_string(attempt) + "): " + e.what();
                        std::cerr << "[Pipeline](process_images_) " << last_error << "\n";
                    });
                images.push_back(std::make_shared<const ProcessedImage>(std::move(img)));
            } catch (const std::exception& e) {
                errors.push_back(last_error.empty() ? std::string(e.what()) : last_error);
            }

            report_(job, opt, PipelineStage::Processing, static_cast<int>(i + 1), percent_of(i + 1, total));
        }

        if (images.empty()) {
            return PipelineStageResult<std::vector<ProcessedImagePtr>>::fail(
                "Failed to process any images. Errors: " + join(errors, "; "));
        }
        return PipelineStageResult<std::vector<ProcessedImagePtr>>::ok(std::move(images));
    }

    std::optional<PipelineStageResult<std::vector<ProcessedImagePtr>>> PipelineOrchestrator::try_batch_(
        Job& job,
        const Options& opt,
        std::vector<std::string>& errors) {
        const ImageTask task = task_for_(job, opt);

        RemoteBatchRequest req;
        req.target_aspect_ratio = task.target;
        req.crop_strategy = task.detect ? "center_faces" : "center";
        if (task.detect) req.detection_types = {DetectionType::Face, DetectionType::Person};
        req.images.reserve(job.files.size());
        for (const auto& f : job.files) req.images.push_back(f.upload_path);

        RemoteBatchResult batch;
        try {
            batch = remote_->process_batch(req);
        } catch (const std::exception& e) {
            std::cerr << "[Pipeline](try_batch_) batch processing failed, falling back to per-image: "
                      << e.what() << "\n";
            return std::nullopt;
        }

        if (batch.processed_images.empty() && batch.failed_images.empty()) {
            std::cerr << "[Pipeline](try_batch_) batch returned no results, falling back to per-image\n";
            return std::nullopt;
        }

        const size_t total = job.files.size();
        std::vector<ProcessedImagePtr> slots(total);
        std::vector<bool> reported(total, false);

        auto index_of = [&](const std::string& path) {
            const std::string want = normalized(path);
            for (size_t k = 0; k < total && !path.empty(); ++k) {
                if (normalized(job.files[k].upload_path) == want) return k;
            }
            return total;
        };

        for (size_t i = 0; i < batch.processed_images.size(); ++i) {
            const auto& p = batch.processed_images[i];

            size_t match = index_of(p.original_path);
            if (match == total && i < total) match = i;
            if (match == total) {
                std::cerr << "[Pipeline](try_batch_) no input file for batch item " << p.original_path << "\n";
                continue;
            }
            if (slots[match]) {
                std::cerr << "[Pipeline](try_batch_) duplicate batch item for " << file_label(job.files[match]) << "\n";
                continue;
            }

            try {
                slots[match] = std::make_shared<const ProcessedImage>(
                    from_remote(p, job.files[match], task.target, {}));
            } catch (const std::exception& e) {
                errors.push_back("Batch failed for " + file_label(job.files[match]) + ": " + e.what());
                reported[match] = true;
            }

            report_(job, opt, PipelineStage::Processing, static_cast<int>(i + 1), percent_of(i + 1, total));
        }

        for (const auto& f : batch.failed_images) {
            const size_t k = index_of(f.path);
            const std::string name = k < total ? file_label(job.files[k])
                : f.path.empty() ? "unknown" : std::filesystem::path(f.path).filename().string();
            errors.push_back("Batch failed for " + name + ": " + f.error);
            if (k < total) reported[k] = true;
        }

        for (size_t k = 0; k < total; ++k) {
            if (!slots[k] && !reported[k]) {
                errors.push_back("Batch returned no result for " + file_label(job.files[k]));
            }
        }

        std::vector<ProcessedImagePtr> images;
        images.reserve(total);
        for (auto& s : slots) {
            if (s) images.push_back(std::move(s));
        }

        if (images.empty()) {
            return PipelineStageResult<std::vector<ProcessedImagePtr>>::fail(
                "Batch processing returned no successful images. Errors: " + join(errors, "; "));
        }
        return PipelineStageResult<std::vector<ProcessedImagePtr>>::ok(std::move(images));
    }

    ProcessedImage PipelineOrchestrator::process_one_(const FileMetadata& file,
                                                      const ImageTask& task,
                                                      ProcessingStrategy strategy) {
        if (strategy == ProcessingStrategy::Remote && remote_) {
            try {
                return RemoteImageProcessor(*remote_).process(file, task);
            } catch (const RemoteServiceError& e) {
                std::cerr << "[Pipeline](process_one_) remote processing failed for " << file_label(file)
                          << " (status " << e.status() << "), using local path: " << e.what() << "\n";
            }
        }
        return LocalImageProcessor(codec_, detector_).process(file, task);
    }

    PipelineStageResult<std::vector<ComposedSheet>> PipelineOrchestrator::compose_sheets_(
        const Job& job,
        const std::vector<ProcessedImagePtr>& images,
        const Options& opt,
        ProcessingStrategy strategy) {
        const SheetCompositionOptions& sc = *job.options.sheet_composition;

        std::string remote_error;
        if (strategy == ProcessingStrategy::Remote && remote_) {
            try {
                return PipelineStageResult<std::vector<ComposedSheet>>::ok(compose_remote_(sc, images));
            } catch (const std::exception& e) {
                remote_error = e.what();
                std::cerr << "[Pipeline](compose_sheets_) remote composition failed, using local layout: "
                          << remote_error << "\n";
            }
        }

        try {
            SheetLayoutEngine engine(codec_, page_dimensions_, sheet_cfg_);
            return PipelineStageResult<std::vector<ComposedSheet>>::ok(
                engine.compose_sheets(images, sc.grid_layout, sc.orientation, opt.output_dir));
        } catch (const std::exception& e) {
            std::string msg = "local composition failed: " + std::string(e.what());
            if (!remote_error.empty()) msg = "remote composition failed: " + remote_error + "; " + msg;
            return PipelineStageResult<std::vector<ComposedSheet>>::fail(msg);
        }
    }

    std::vector<ComposedSheet> PipelineOrchestrator::compose_remote_(const SheetCompositionOptions& sc,
                                                                     const std::vector<ProcessedImagePtr>& images) {
        const int capacity = capacity_of(sc.grid_layout);
        std::vector<ComposedSheet> sheets;

        for (const auto& [begin, end] : paginate(images.size(), capacity)) {
            RemoteSheetRequest req;
            req.grid_layout = sc.grid_layout;
            req.sheet_orientation = sc.orientation;
            req.output_format = "image";

            ComposedSheet sheet;
            for (size_t i = begin; i < end; ++i) {
                req.processed_images.push_back(images[i]->processed_path);
                sheet.images.push_back(images[i]);
            }

            const RemoteComposedSheet r = remote_->compose_sheet(req);
            sheet.id = make_uuid();
            sheet.sheet_path = r.output_path;
            sheet.layout = sc.grid_layout;
            sheet.orientation = sc.orientation;
            sheet.empty_slots = capacity - static_cast<int>(end - begin);
            sheet.created_at = Clock::now();
            sheets.push_back(std::move(sheet));
        }
        return sheets;
    }

    PipelineStageResult<std::string> PipelineOrchestrator::generate_pdf_(const Job& job,
                                                                         const std::vector<ComposedSheet>& sheets,
                                                                         const Options& opt) {
        const auto missing = missing_sheet_files(sheets);
        if (!missing.empty()) {
            return PipelineStageResult<std::string>::fail("Missing sheet files: " + join(missing, ", "));
        }

        try {
            return PipelineStageResult<std::string>::ok(
                pdf_.render(sheets, opt.output_dir, make_pdf_metadata(job.options, sheets)));
        } catch (const std::exception& e) {
            return PipelineStageResult<std::string>::fail(std::string("PDF generation failed: ") + e.what());
        }
    }

    void PipelineOrchestrator::cleanup_(const ProcessingResults& results) {
        std::vector<std::string> paths;
        for (const auto& img : results.processed_images) paths.push_back(img->processed_path);
        for (const auto& s : results.composed_sheets) paths.push_back(s.sheet_path);
        if (results.pdf_path) paths.push_back(*results.pdf_path);

        for (const auto& p : paths) {
            std::error_code ec;
            if (!std::filesystem::exists(p, ec)) continue;
            if (std::filesystem::remove(p, ec)) {
                std::cerr << "[Pipeline](cleanup_) removed " << p << "\n";
            } else if (ec) {
                std::cerr << "[Pipeline](cleanup_) failed to remove " << p << ": " << ec.message() << "\n";
            }
        }
    }

    void PipelineOrchestrator::report_(Job& job,
                                       const Options& opt,
                                       PipelineStage stage,
                                       int processed,
                                       int percentage) {
        job.progress.current_stage = stage;
        job.progress.processed_images = processed;
        job.progress.total_images = static_cast<int>(job.files.size());
        job.progress.percentage = percentage;
        if (opt.progress) opt.progress(job.progress);
    }
}
