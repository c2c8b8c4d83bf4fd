#include <common/config.hpp>
#include <codec/opencv_codec.hpp>
#include <cropping/crop_engine.hpp>
#include <inference/yunet_detector.hpp>
#include <pipeline/orchestrator.hpp>
#include <remote/http_processing_client.hpp>
#include <render/cairo_pdf_renderer.hpp>

#include <yaml-cpp/exceptions.h>

#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

static std::unique_ptr<pc::YuNetDetector> make_detector(const pc::DetectorConfig& dc) {
    if (!dc.enabled) return nullptr;

    pc::YuNetDetectorConfig cfg;
    cfg.param_path = dc.param_path;
    cfg.bin_path = dc.bin_path;
    cfg.input_w = dc.input_w;
    cfg.input_h = dc.input_h;
    cfg.score_threshold = dc.score_threshold;
    cfg.nms_threshold = dc.nms_threshold;
    cfg.top_k = dc.top_k;
    cfg.ncnn_threads = dc.ncnn_threads;

    try {
        return std::make_unique<pc::YuNetDetector>(std::move(cfg));
    } catch (const std::exception& e) {
        std::cerr << "[main] face detector unavailable, crops will use the fallback strategy: "
                  << e.what() << "\n";
        return nullptr;
    }
}

static std::unique_ptr<pc::HttpProcessingClient> make_remote(const pc::RemoteConfig& rc) {
    if (!rc.enabled) return nullptr;

    pc::HttpProcessingClientConfig cfg;
    cfg.url = rc.url;
    cfg.timeout_ms = rc.timeout_ms;
    cfg.retry.max_attempts = rc.max_retries;
    cfg.retry.base_delay = std::chrono::milliseconds(rc.retry_delay_ms);
    return std::make_unique<pc::HttpProcessingClient>(std::move(cfg));
}

static pc::PipelineOrchestrator::Options make_options(const pc::AppConfig& cfg) {
    pc::PipelineOrchestrator::Options opt;
    opt.output_dir = cfg.pipeline.output_dir;
    opt.temp_dir = cfg.pipeline.temp_dir;
    opt.cleanup_on_error = cfg.pipeline.cleanup_on_error;
    opt.retry.max_attempts = cfg.pipeline.max_retries;
    opt.retry.base_delay = std::chrono::milliseconds(cfg.pipeline.retry_base_delay_ms);
    opt.detection_confidence = cfg.pipeline.detection_confidence;
    if (!pc::parse_fallback_strategy(cfg.crop.fallback_strategy, opt.crop.fallback_strategy)) {
        throw std::runtime_error("[Config] unknown crop.fallback_strategy: " + cfg.crop.fallback_strategy);
    }

    opt.progress = [](const pc::JobProgress& p) {
        std::cout << "[progress] " << pc::to_string(p.current_stage) << " "
                  << p.processed_images << "/" << p.total_images << " "
                  << p.percentage << "%\n";
    };
    return opt;
}

static void print_summary(const pc::Job& job, const pc::ProcessingResults& results) {
    const auto stats = pc::processing_stats(job, results);

    std::cout << "job " << job.id << ": " << pc::to_string(job.status) << "\n"
              << "  images:  " << stats.successful_images << "/" << stats.total_images
              << " (" << stats.failed_images << " failed)\n"
              << "  sheets:  " << stats.total_sheets << "\n"
              << "  time:    " << stats.processing_time_ms << " ms\n";

    for (const auto& img : results.processed_images) {
        std::cout << "  [" << pc::to_string(img->strategy) << "] " << img->processed_path << "\n";
    }
    for (const auto& s : results.composed_sheets) {
        std::cout << "  [sheet] " << s.sheet_path << " (" << s.empty_slots << " empty)\n";
    }
    if (results.pdf_path) std::cout << "  [pdf] " << *results.pdf_path << "\n";
    for (const auto& e : results.errors) std::cout << "  [error] " << e << "\n";
}

int main(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "usage: " << argv[0] << " <config.yaml> <job.yaml>\n";
        return 2;
    }

    pc::AppConfig cfg;
    pc::Job job;
    try {
        cfg = pc::load_config_yaml(argv[1]);
        job = pc::load_job_yaml(argv[2]);
    } catch (const YAML::Exception& e) {
        std::cerr << "Config error: " << e.what() << "\n";
        return 1;
    } catch (const std::runtime_error& e) {
        std::cerr << e.what() << "\n";
        return 1;
    }

    pc::OpenCvCodecConfig codec_cfg;
    codec_cfg.jpeg_quality = cfg.codec.jpeg_quality;
    codec_cfg.interp = cfg.codec.interp;
    pc::OpenCvCodec codec(codec_cfg);

    pc::CairoPdfRenderer pdf;
    auto detector = make_detector(cfg.detector);
    auto remote = make_remote(cfg.remote);

    pc::SheetLayoutConfig sheet_cfg;
    sheet_cfg.margin = cfg.sheet.margin;
    sheet_cfg.spacing = cfg.sheet.spacing;
    sheet_cfg.dense_spacing = cfg.sheet.dense_spacing;

    pc::PipelineOrchestrator orchestrator(codec,
                                          pdf,
                                          detector.get(),
                                          remote.get(),
                                          pc::a4_page_dimensions,
                                          sheet_cfg);

    try {
        const auto results = orchestrator.execute(job, make_options(cfg));
        print_summary(job, results);
    } catch (const std::invalid_argument& e) {
        std::cerr << "Invalid job: " << e.what() << "\n";
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "Job " << job.id << " failed: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
