#include <pipeline/orchestrator.hpp>

#include <chrono>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace {
    namespace fs = std::filesystem;

    int g_failures = 0;

    void check(bool condition, const std::string& message) {
        if (!condition) {
            ++g_failures;
            std::cerr << "[FAIL] " << message << "\n";
        }
    }

    void touch(const std::string& path) {
        std::ofstream out(path, std::ios::binary);
        if (!out.is_open()) throw std::runtime_error("cannot write " + path);
        out << "x";
    }

    struct TempDir {
        fs::path path;

        TempDir() {
            static int counter = 0;
            const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
            path = fs::temp_directory_path() /
                   ("pc_pipeline_" + std::to_string(stamp) + "_" + std::to_string(counter++));
            fs::create_directories(path);
        }

        ~TempDir() {
            std::error_code ec;
            fs::remove_all(path, ec);
        }
    };

    class FakeCodec : public pc::IImageCodec {
    public:
        std::set<std::string> unreadable;
        std::map<std::string, int> probes;
        int crops = 0;
        bool write_sheets = true;

        pc::Dimensions probe(const std::string& path) override {
            ++probes[path];
            if (unreadable.count(path)) throw std::runtime_error("cannot decode " + path);
            return {1000, 800};
        }

        pc::Dimensions crop(const std::string&, const pc::BoundingBox& box, const std::string& out) override {
            ++crops;
            touch(out);
            return {box.width, box.height};
        }

        cv::Mat resize_to_fit(const std::string&, const pc::Dimensions& cell) override {
            const pc::Dimensions d = pc::fit_inside({533, 800}, cell);
            return cv::Mat(d.height, d.width, CV_8UC3, cv::Scalar(255, 255, 255));
        }

        std::string compose(const pc::Dimensions&,
                            const pc::Rgb&,
                            const std::vector<pc::Placement>&,
                            const std::string& out) override {
            if (write_sheets) touch(out);
            return out;
        }
    };

    class FakeDetector : public pc::IDetector {
    public:
        int calls = 0;

        std::vector<pc::Detection> detect(const std::string&,
                                          const std::vector<pc::DetectionType>&,
                                          float) override {
            ++calls;
            pc::FaceDetection f;
            f.box = {450, 350, 100, 100};
            f.confidence = 0.9f;
            return {f};
        }
    };

    class FakePdf : public pc::IPdfRenderer {
    public:
        int calls = 0;
        size_t pages = 0;
        std::string keywords;

        std::string render(const std::vector<pc::ComposedSheet>& sheets,
                           const std::string& output_dir,
                           const pc::PdfMetadata& metadata) override {
            ++calls;
            pages = sheets.size();
            keywords = metadata.keywords;
            const std::string path = (fs::path(output_dir) / "composed.pdf").string();
            touch(path);
            return path;
        }
    };

    class FakeRemote : public pc::IRemoteProcessingService {
    public:
        std::string health = "healthy";
        bool batch_throws = false;
        bool crop_throws = false;
        std::set<std::string> batch_failures;
        std::set<std::string> batch_omitted;
        bool zero_box = false;
        int batch_calls = 0;
        int crop_calls = 0;
        int compose_calls = 0;

        pc::RemoteHealth health_check() override {
            pc::RemoteHealth h;
            h.status = health;
            return h;
        }

        std::vector<pc::Detection> detect_objects(const pc::RemoteDetectRequest&) override {
            return {};
        }

        pc::RemoteProcessedImage crop_image(const pc::RemoteCropRequest& req) override {
            ++crop_calls;
            if (crop_throws) throw pc::RemoteServiceError(500, "crop failed");
            return processed(req.image_path);
        }

        pc::RemoteBatchResult process_batch(const pc::RemoteBatchRequest& req) override {
            ++batch_calls;
            if (batch_throws) throw pc::RemoteServiceError(503, "batch unavailable");

            pc::RemoteBatchResult r;
            // Reverse order so matching by path is exercised.
            for (auto it = req.images.rbegin(); it != req.images.rend(); ++it) {
                if (batch_omitted.count(*it)) continue;
                if (batch_failures.count(*it)) {
                    r.failed_images.push_back({*it, "decode error"});
                } else {
                    r.processed_images.push_back(processed(*it));
                }
            }
            return r;
        }

        pc::RemoteComposedSheet compose_sheet(const pc::RemoteSheetRequest&) override {
            ++compose_calls;
            throw pc::RemoteServiceError(500, "compose failed");
        }

    private:
        pc::RemoteProcessedImage processed(const std::string& path) const {
            pc::RemoteProcessedImage p;
            p.original_path = path;
            p.processed_path = path + ".processed.jpg";
            p.crop_coordinates = zero_box ? pc::BoundingBox{234, 0, 0, 800} : pc::BoundingBox{234, 0, 533, 800};
            p.final_dimensions = {533, 800};
            p.processing_time = 0.05;
            return p;
        }
    };

    pc::Job make_job(int files, bool sheets = false, bool pdf = false) {
        pc::Job job;
        job.id = "job-test";
        for (int i = 0; i < files; ++i) {
            pc::FileMetadata f;
            f.id = "f" + std::to_string(i);
            f.original_name = "in" + std::to_string(i) + ".jpg";
            f.upload_path = "/virtual/in" + std::to_string(i) + ".jpg";
            job.files.push_back(f);
        }
        pc::find_aspect_ratio("4x6", job.options.aspect_ratio);
        if (sheets) {
            pc::SheetCompositionOptions sc;
            sc.enabled = true;
            sc.grid_layout = *pc::find_grid_layout("2x2");
            sc.generate_pdf = pdf;
            job.options.sheet_composition = sc;
        }
        return job;
    }

    pc::PipelineOrchestrator::Options make_options(const TempDir& dir) {
        pc::PipelineOrchestrator::Options opt;
        opt.output_dir = (dir.path / "out").string();
        opt.temp_dir = (dir.path / "tmp").string();
        opt.retry.max_attempts = 3;
        opt.retry.base_delay = std::chrono::milliseconds(0);
        opt.retry.sleep = [](std::chrono::milliseconds) {};
        return opt;
    }

    bool starts_with(const std::string& s, const std::string& prefix) {
        return s.compare(0, prefix.size(), prefix) == 0;
    }

    void test_all_images_failing_fails_job() {
        TempDir dir;
        FakeCodec codec;
        FakePdf pdf;
        pc::Job job = make_job(2);
        for (const auto& f : job.files) codec.unreadable.insert(f.upload_path);

        pc::PipelineOrchestrator orch(codec, pdf);
        std::string error;
        try {
            (void)orch.execute(job, make_options(dir));
        } catch (const std::runtime_error& e) {
            error = e.what();
        }

        check(starts_with(error, "Image processing failed: Failed to process any images"),
              "all failures should abort with the aggregated error (got '" + error + "')");
        check(error.find("in0.jpg") != std::string::npos && error.find("in1.jpg") != std::string::npos,
              "aggregated error should name every failed file");
        check(job.status == pc::JobStatus::Failed, "job should be marked failed");
        check(job.error_message == error, "job should carry the failure message");
        check(codec.probes["/virtual/in0.jpg"] == 3, "each file should be attempted max_attempts times");
    }

    void test_partial_failure_keeps_successes() {
        TempDir dir;
        FakeCodec codec;
        FakePdf pdf;
        pc::Job job = make_job(3);
        codec.unreadable = {"/virtual/in0.jpg", "/virtual/in2.jpg"};

        pc::PipelineOrchestrator orch(codec, pdf);
        const auto results = orch.execute(job, make_options(dir));

        check(results.processed_images.size() == 1, "only the readable image should be processed");
        check(results.processed_images[0]->original_file_id == "f1", "the surviving image should be in1");
        check(results.errors.size() == 2, "both failures should be recorded");
        check(job.status == pc::JobStatus::Completed, "partial success completes the job");
        check(fs::exists(results.processed_images[0]->processed_path), "processed file should exist");
    }

    void test_invalid_job_rejected_before_work() {
        TempDir dir;
        FakeCodec codec;
        FakePdf pdf;
        pc::Job job = make_job(1, true);
        job.options.sheet_composition->grid_layout = {0, 11, "0x11"};

        pc::PipelineOrchestrator orch(codec, pdf);
        std::string error;
        try {
            (void)orch.execute(job, make_options(dir));
        } catch (const std::invalid_argument& e) {
            error = e.what();
        }

        check(starts_with(error, "Invalid processing options: "), "bad grid should be rejected");
        check(codec.probes.empty(), "no image should be touched");
        check(job.status == pc::JobStatus::Pending, "validation failure leaves the job status alone");

        pc::Job empty = make_job(0);
        bool threw = false;
        try {
            (void)orch.execute(empty, make_options(dir));
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        check(threw, "a job without files should be rejected");
    }

    void test_progress_sequence_and_detection() {
        TempDir dir;
        FakeCodec codec;
        FakePdf pdf;
        FakeDetector detector;
        pc::Job job = make_job(2);

        std::vector<pc::JobProgress> seen;
        auto opt = make_options(dir);
        opt.progress = [&](const pc::JobProgress& p) { seen.push_back(p); };

        pc::PipelineOrchestrator orch(codec, pdf, &detector);
        const auto results = orch.execute(job, opt);

        check(seen.size() == 3, "two processing updates and a completion expected");
        if (seen.size() == 3) {
            check(seen[0].current_stage == pc::PipelineStage::Processing && seen[0].percentage == 50,
                  "first file should report 50%");
            check(seen[1].processed_images == 2 && seen[1].percentage == 100, "second file should report 100%");
            check(seen[2].current_stage == pc::PipelineStage::Completed && seen[2].total_images == 2,
                  "completion should be reported last");
        }
        check(detector.calls == 2, "detector should run once per image");
        check(results.processed_images[0]->strategy == pc::CropStrategy::PeopleCentered,
              "detected faces should drive the crop");
        check(results.processed_images[0]->crop_area.x == 234, "crop should center on the detected face");
    }

    void test_crop_options_reach_processor() {
        TempDir dir;
        FakeCodec codec;
        FakePdf pdf;
        pc::Job job = make_job(1);
        job.options.face_detection_enabled = false;

        auto opt = make_options(dir);
        opt.crop.fallback_strategy = pc::FallbackStrategy::RuleOfThirds;

        pc::PipelineOrchestrator orch(codec, pdf);
        const auto results = orch.execute(job, opt);
        check(results.processed_images[0]->strategy == pc::CropStrategy::RuleOfThirds,
              "configured fallback strategy should be used");
    }

    void test_sheets_and_pdf() {
        TempDir dir;
        FakeCodec codec;
        FakePdf pdf;
        pc::Job job = make_job(5, true, true);

        std::vector<pc::PipelineStage> stages;
        auto opt = make_options(dir);
        opt.progress = [&](const pc::JobProgress& p) { stages.push_back(p.current_stage); };

        pc::PipelineOrchestrator orch(codec, pdf);
        const auto results = orch.execute(job, opt);

        check(results.composed_sheets.size() == 2, "5 images on 2x2 should compose 2 sheets");
        check(results.composed_sheets[1].empty_slots == 3, "last sheet should have 3 empty slots");
        check(results.pdf_path.has_value(), "pdf should be generated");
        check(pdf.calls == 1 && pdf.pages == 2, "pdf should get one page per sheet");
        check(pdf.keywords.find("grid_layout=2x2") != std::string::npos, "pdf keywords should name the layout");

        bool composing = false;
        bool generating = false;
        for (auto s : stages) {
            composing = composing || s == pc::PipelineStage::Composing;
            generating = generating || s == pc::PipelineStage::GeneratingPdf;
        }
        check(composing && generating, "composition and pdf stages should be reported");
        check(job.progress.percentage == 100, "final progress should be 100%");
    }

    void test_missing_sheet_skips_pdf() {
        TempDir dir;
        FakeCodec codec;
        codec.write_sheets = false;
        FakePdf pdf;
        pc::Job job = make_job(2, true, true);

        pc::PipelineOrchestrator orch(codec, pdf);
        const auto results = orch.execute(job, make_options(dir));

        check(results.composed_sheets.size() == 1, "sheet record should still be returned");
        check(!results.pdf_path.has_value(), "missing sheet files should skip the pdf");
        check(pdf.calls == 0, "renderer should not be called");
        check(job.status == pc::JobStatus::Completed, "pdf failure does not fail the job");
    }

    void test_remote_batch_matches_input_order() {
        TempDir dir;
        FakeCodec codec;
        FakePdf pdf;
        FakeRemote remote;
        remote.batch_failures = {"/virtual/in1.jpg"};
        pc::Job job = make_job(3);

        pc::PipelineOrchestrator orch(codec, pdf, nullptr, &remote);
        const auto results = orch.execute(job, make_options(dir));

        check(remote.batch_calls == 1, "multi-file remote jobs should use one batch call");
        check(results.processed_images.size() == 2, "one batch failure leaves two images");
        check(results.processed_images[0]->original_file_id == "f0" &&
              results.processed_images[1]->original_file_id == "f2",
              "batch results should follow input order");
        check(results.processed_images[0]->strategy == pc::CropStrategy::Remote, "remote crops are tagged remote");
        check(std::fabs(results.processed_images[0]->crop_area.confidence - pc::kRemoteCropConfidence) < 1e-6f,
              "remote crops carry the fixed confidence");
        check(results.errors.size() == 1 && results.errors[0] == "Batch failed for in1.jpg: decode error",
              "batch failures should be reported per file");
        check(codec.crops == 0, "no local cropping on the remote path");
    }

    void test_batch_failure_falls_back_per_image() {
        TempDir dir;
        FakeCodec codec;
        FakePdf pdf;
        FakeRemote remote;
        remote.batch_throws = true;
        pc::Job job = make_job(2);

        pc::PipelineOrchestrator orch(codec, pdf, nullptr, &remote);
        const auto results = orch.execute(job, make_options(dir));

        check(remote.crop_calls == 2, "each image should go through the remote crop");
        check(results.processed_images.size() == 2, "both images should be processed");
    }

    void test_remote_crop_failure_uses_local() {
        TempDir dir;
        FakeCodec codec;
        FakePdf pdf;
        FakeRemote remote;
        remote.crop_throws = true;
        pc::Job job = make_job(1, true);

        pc::PipelineOrchestrator orch(codec, pdf, nullptr, &remote);
        const auto results = orch.execute(job, make_options(dir));

        check(results.processed_images.size() == 1, "local processing should take over");
        check(results.processed_images[0]->strategy != pc::CropStrategy::Remote, "image should be cropped locally");
        check(codec.crops == 1, "local codec should crop once");
        check(remote.compose_calls == 1, "remote composition should be tried first");
        check(results.composed_sheets.size() == 1 && fs::exists(results.composed_sheets[0].sheet_path),
              "local layout should take over after a remote composition failure");
    }

    void test_batch_omission_is_reported() {
        TempDir dir;
        FakeCodec codec;
        FakePdf pdf;
        FakeRemote remote;
        remote.batch_omitted = {"/virtual/in1.jpg"};
        pc::Job job = make_job(3);

        pc::PipelineOrchestrator orch(codec, pdf, nullptr, &remote);
        const auto results = orch.execute(job, make_options(dir));

        check(results.processed_images.size() == 2, "the two returned images should be kept");
        check(results.errors.size() == 1 && results.errors[0] == "Batch returned no result for in1.jpg",
              "an image missing from the batch response should be reported");
    }

    void test_batch_omission_and_failure_both_reported() {
        TempDir dir;
        FakeCodec codec;
        FakePdf pdf;
        FakeRemote remote;
        remote.batch_omitted = {"/virtual/in0.jpg"};
        remote.batch_failures = {"/virtual/in1.jpg", "/virtual/in2.jpg"};
        pc::Job job = make_job(3);

        pc::PipelineOrchestrator orch(codec, pdf, nullptr, &remote);
        std::string error;
        try {
            (void)orch.execute(job, make_options(dir));
        } catch (const std::runtime_error& e) {
            error = e.what();
        }

        check(error.find("Batch returned no result for in0.jpg") != std::string::npos,
              "the aggregated error should name the missing image (got '" + error + "')");
        check(error.find("Batch failed for in2.jpg: decode error") != std::string::npos,
              "the aggregated error should keep the reported failures");
        check(job.status == pc::JobStatus::Failed, "no usable batch result fails the job");
    }

    void test_empty_batch_falls_back_per_image() {
        TempDir dir;
        FakeCodec codec;
        FakePdf pdf;
        FakeRemote remote;
        remote.batch_omitted = {"/virtual/in0.jpg", "/virtual/in1.jpg"};
        pc::Job job = make_job(2);

        pc::PipelineOrchestrator orch(codec, pdf, nullptr, &remote);
        const auto results = orch.execute(job, make_options(dir));

        check(remote.batch_calls == 1, "the batch should be tried once");
        check(remote.crop_calls == 2, "an empty batch response should fall back to per-image crops");
        check(results.processed_images.size() == 2 && results.errors.empty(),
              "both images should be processed without errors");
    }

    void test_invalid_remote_crop_box_uses_local() {
        TempDir dir;
        FakeCodec codec;
        FakePdf pdf;
        FakeRemote remote;
        remote.zero_box = true;
        pc::Job job = make_job(1);

        pc::PipelineOrchestrator orch(codec, pdf, nullptr, &remote);
        const auto results = orch.execute(job, make_options(dir));

        check(remote.crop_calls == 1, "the remote crop should be tried");
        check(codec.crops == 1, "a zero-width remote crop box should be redone locally");
        check(results.processed_images.size() == 1 &&
              results.processed_images[0]->strategy != pc::CropStrategy::Remote,
              "the kept image should carry the local strategy");
        check(results.processed_images[0]->crop_area.width > 0, "the local crop box should be non-empty");
    }

    void test_output_dir_failure_marks_job_failed() {
        TempDir dir;
        FakeCodec codec;
        FakePdf pdf;
        pc::Job job = make_job(1);
        touch((dir.path / "blocker").string());

        auto opt = make_options(dir);
        opt.output_dir = (dir.path / "blocker" / "out").string();

        pc::PipelineOrchestrator orch(codec, pdf);
        bool threw = false;
        try {
            (void)orch.execute(job, opt);
        } catch (const std::exception&) {
            threw = true;
        }

        check(threw, "an output directory under a regular file should fail the job");
        check(job.status == pc::JobStatus::Failed, "job should be marked failed, not left pending");
        check(!job.error_message.empty(), "job should carry the directory error");
        check(codec.probes.empty(), "no image should be touched");
    }

    void test_unhealthy_remote_uses_local() {
        TempDir dir;
        FakeCodec codec;
        FakePdf pdf;
        FakeRemote remote;
        remote.health = "degraded";
        pc::Job job = make_job(2);

        pc::PipelineOrchestrator orch(codec, pdf, nullptr, &remote);
        const auto results = orch.execute(job, make_options(dir));

        check(remote.batch_calls == 0 && remote.crop_calls == 0, "unhealthy service should not be used");
        check(codec.crops == 2, "images should be cropped locally");
        check(results.processed_images.size() == 2, "both images should be processed");
    }

    void test_failure_after_processing_cleans_up() {
        TempDir dir;
        FakeCodec codec;
        FakePdf pdf;
        pc::Job job = make_job(2, true);

        auto opt = make_options(dir);
        opt.progress = [](const pc::JobProgress& p) {
            if (p.current_stage == pc::PipelineStage::Composing) throw std::runtime_error("progress sink closed");
        };

        pc::PipelineOrchestrator orch(codec, pdf);
        bool threw = false;
        try {
            (void)orch.execute(job, opt);
        } catch (const std::runtime_error&) {
            threw = true;
        }

        check(threw, "errors after processing should propagate");
        check(job.status == pc::JobStatus::Failed, "job should be marked failed");
        check(fs::is_empty(dir.path / "out"), "processed files should be removed on error");
    }
}

int main() {
    try {
        test_all_images_failing_fails_job();
        test_partial_failure_keeps_successes();
        test_invalid_job_rejected_before_work();
        test_progress_sequence_and_detection();
        test_crop_options_reach_processor();
        test_sheets_and_pdf();
        test_missing_sheet_skips_pdf();
        test_remote_batch_matches_input_order();
        test_batch_failure_falls_back_per_image();
        test_remote_crop_failure_uses_local();
        test_batch_omission_is_reported();
        test_batch_omission_and_failure_both_reported();
        test_empty_batch_falls_back_per_image();
        test_invalid_remote_crop_box_uses_local();
        test_output_dir_failure_marks_job_failed();
        test_unhealthy_remote_uses_local();
        test_failure_after_processing_cleans_up();
    } catch (const std::exception& e) {
        std::cerr << "[FAIL] unexpected exception: " << e.what() << "\n";
        return 1;
    }

    if (g_failures != 0) {
        std::cerr << "[FAIL] total failures: " << g_failures << "\n";
        return 1;
    }

    std::cout << "[OK] all pipeline tests passed\n";
    return 0;
}
