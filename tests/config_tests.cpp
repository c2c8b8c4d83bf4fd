#include <common/config.hpp>
#include <pipeline/validation.hpp>

#include <chrono>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {
    int g_failures = 0;

    void check(bool condition, const std::string& message) {
        if (!condition) {
            ++g_failures;
            std::cerr << "[FAIL] " << message << "\n";
        }
    }

    std::string write_yaml_file(const std::string& prefix, const std::string& body) {
        namespace fs = std::filesystem;
        const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        const fs::path path = fs::temp_directory_path() /
                              (prefix + "_" + std::to_string(stamp) + ".yaml");

        std::ofstream out(path);
        if (!out.is_open()) {
            throw std::runtime_error("failed to open temp config file: " + path.string());
        }
        out << body;
        out.close();
        return path.string();
    }

    bool load_throws(const std::string& yaml) {
        const std::string path = write_yaml_file("pc_cfg", yaml);
        try {
            (void)pc::load_config_yaml(path);
            std::filesystem::remove(path);
            return false;
        } catch (const std::exception&) {
            std::filesystem::remove(path);
            return true;
        }
    }

    bool job_throws(const std::string& yaml) {
        const std::string path = write_yaml_file("pc_job", yaml);
        try {
            (void)pc::load_job_yaml(path);
            std::filesystem::remove(path);
            return false;
        } catch (const std::exception&) {
            std::filesystem::remove(path);
            return true;
        }
    }

    pc::Job load_job(const std::string& yaml) {
        const std::string path = write_yaml_file("pc_job_ok", yaml);
        try {
            auto job = pc::load_job_yaml(path);
            std::filesystem::remove(path);
            return job;
        } catch (const std::exception&) {
            std::filesystem::remove(path);
            throw;
        }
    }

    void test_empty_config_uses_defaults() {
        const std::string path = write_yaml_file("pc_cfg_empty", "{}\n");
        const auto cfg = pc::load_config_yaml(path);
        std::filesystem::remove(path);

        check(!cfg.remote.enabled, "remote service is off by default");
        check(cfg.detector.input_w == 640 && cfg.detector.input_h == 640, "detector input defaults to 640x640");
        check(cfg.codec.jpeg_quality == 95, "JPEG quality defaults to 95");
        check(cfg.pipeline.max_retries == 3, "three attempts per image by default");
        check(cfg.pipeline.retry_base_delay_ms == 1000, "retry base delay defaults to 1s");
        check(std::fabs(cfg.pipeline.detection_confidence - 0.4f) < 1e-6f, "detection confidence defaults to 0.4");
        check(cfg.crop.fallback_strategy == "smart", "fallback strategy defaults to smart");
        check(cfg.sheet.margin == 30 && cfg.sheet.spacing == 15 && cfg.sheet.dense_spacing == 10,
              "sheet spacing defaults should match the print layout");
    }

    void test_overrides_are_read() {
        const std::string yaml =
            "remote:\n"
            "  enabled: true\n"
            "  url: \"http://imaging:9000\"\n"
            "  timeout_ms: 5000\n"
            "pipeline:\n"
            "  output_dir: \"/tmp/pc_out\"\n"
            "  max_retries: 5\n"
            "  cleanup_on_error: false\n"
            "crop:\n"
            "  fallback_strategy: \"rule-of-thirds\"\n"
            "sheet:\n"
            "  margin: 40\n";

        const std::string path = write_yaml_file("pc_cfg_ok", yaml);
        const auto cfg = pc::load_config_yaml(path);
        std::filesystem::remove(path);

        check(cfg.remote.enabled && cfg.remote.url == "http://imaging:9000", "remote url should be read");
        check(cfg.remote.timeout_ms == 5000, "remote timeout should be read");
        check(cfg.pipeline.output_dir == "/tmp/pc_out", "output_dir should be read");
        check(cfg.pipeline.max_retries == 5, "max_retries should be read");
        check(!cfg.pipeline.cleanup_on_error, "cleanup_on_error should be read");
        check(cfg.crop.fallback_strategy == "rule-of-thirds", "fallback strategy should be read");
        check(cfg.sheet.margin == 40 && cfg.sheet.spacing == 15, "sheet margin override keeps other defaults");
    }

    void test_invalid_config_rejected() {
        check(load_throws("codec:\n  jpeg_quality: 0\n"), "jpeg_quality 0 should be rejected");
        check(load_throws("codec:\n  jpeg_quality: 101\n"), "jpeg_quality above 100 should be rejected");
        check(load_throws("crop:\n  fallback_strategy: \"golden\"\n"), "unknown fallback strategy should be rejected");
        check(load_throws("detector:\n  input_w: 500\n"), "detector input must be a multiple of 32");
        check(load_throws("pipeline:\n  max_retries: 0\n"), "zero attempts should be rejected");
        check(load_throws("pipeline:\n  detection_confidence: 1.5\n"), "confidence above 1 should be rejected");
        check(load_throws("remote:\n  enabled: true\n  url: \"\"\n"), "enabled remote needs a url");
        check(load_throws("sheet:\n  margin: -1\n"), "negative margin should be rejected");
    }

    void test_job_with_named_ratio_and_layout() {
        const auto job = load_job(
            "id: \"job-1\"\n"
            "files:\n"
            "  - \"/photos/beach.JPG\"\n"
            "  - id: \"f2\"\n"
            "    name: \"party.png\"\n"
            "    path: \"/photos/p.png\"\n"
            "options:\n"
            "  aspect_ratio: \"4x6\"\n"
            "  face_detection: false\n"
            "  sheet:\n"
            "    layout: \"2x2\"\n"
            "    orientation: \"landscape\"\n"
            "    pdf: true\n");

        check(job.id == "job-1", "job id should be read");
        check(job.files.size() == 2, "both files should be read");
        check(job.files[0].original_name == "beach.JPG", "scalar files take their name from the path");
        check(job.files[0].mime_type == "image/jpeg", "mime type should ignore extension case");
        check(!job.files[0].id.empty(), "scalar files get a generated id");
        check(job.files[1].id == "f2" && job.files[1].original_name == "party.png", "mapped files keep id and name");
        check(job.files[1].mime_type == "image/png", "png mime type expected");

        check(job.options.aspect_ratio.name == "4x6", "named ratio should resolve");
        check(job.options.aspect_ratio.orientation == pc::Orientation::Portrait, "4x6 is portrait");
        check(!job.options.face_detection_enabled, "face_detection should be read");

        check(job.options.sheet_composition.has_value(), "sheet block should enable composition");
        const auto& sc = *job.options.sheet_composition;
        check(sc.enabled, "sheet composition defaults to enabled");
        check(sc.grid_layout.rows == 2 && sc.grid_layout.columns == 2, "2x2 layout should resolve");
        check(sc.orientation == pc::SheetOrientation::Landscape, "orientation should be read");
        check(sc.generate_pdf, "pdf flag should be read");
        check(pc::validate_processing_options(job.options).empty(), "loaded options should validate");
    }

    void test_job_with_custom_ratio_and_grid() {
        const auto job = load_job(
            "files: [\"/photos/a.jpg\"]\n"
            "options:\n"
            "  aspect_ratio: { width: 3, height: 2, name: \"custom\" }\n"
            "  sheet:\n"
            "    layout: { rows: 4, columns: 5 }\n");

        check(!job.id.empty(), "missing job id should be generated");
        check(job.options.aspect_ratio.orientation == pc::Orientation::Landscape, "3:2 is landscape");
        check(job.options.face_detection_enabled, "face detection defaults to on");
        const auto& g = job.options.sheet_composition->grid_layout;
        check(g.rows == 4 && g.columns == 5 && g.name == "4x5", "custom grid should be read and named");
        check(!job.options.sheet_composition->generate_pdf, "pdf defaults to off");
    }

    void test_job_without_sheet_block() {
        const auto job = load_job(
            "files: [\"/photos/a.jpg\"]\n"
            "options:\n"
            "  aspect_ratio: \"Square\"\n");
        check(!job.options.sheet_composition.has_value(), "no sheet block means no composition");
    }

    void test_invalid_jobs_rejected() {
        check(job_throws("files: [\"/a.jpg\"]\n"), "options are required");
        check(job_throws("files: [\"/a.jpg\"]\noptions:\n  face_detection: true\n"), "aspect ratio is required");
        check(job_throws("files: [\"/a.jpg\"]\noptions:\n  aspect_ratio: \"7x11\"\n"), "unknown ratio names are rejected");
        check(job_throws("files: [\"/a.jpg\"]\noptions:\n  aspect_ratio: \"4x6\"\n  sheet:\n    layout: \"5x5\"\n"),
              "unknown layout names are rejected");
        check(job_throws("files: [\"/a.jpg\"]\noptions:\n  aspect_ratio: \"4x6\"\n  sheet:\n    orientation: \"diagonal\"\n"),
              "unknown orientations are rejected");
        check(job_throws("files:\n  - name: \"x.jpg\"\noptions:\n  aspect_ratio: \"4x6\"\n"),
              "files without a path are rejected");
        check(job_throws("files: \"/a.jpg\"\noptions:\n  aspect_ratio: \"4x6\"\n"), "files must be a list");
    }
}

int main() {
    try {
        test_empty_config_uses_defaults();
        test_overrides_are_read();
        test_invalid_config_rejected();
        test_job_with_named_ratio_and_layout();
        test_job_with_custom_ratio_and_grid();
        test_job_without_sheet_block();
        test_invalid_jobs_rejected();
    } catch (const std::exception& e) {
        std::cerr << "[FAIL] unexpected exception: " << e.what() << "\n";
        return 1;
    }

    if (g_failures != 0) {
        std::cerr << "[FAIL] total failures: " << g_failures << "\n";
        return 1;
    }

    std::cout << "[OK] all config tests passed\n";
    return 0;
}
