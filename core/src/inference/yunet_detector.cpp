#include <inference/yunet_detector.hpp>

#include <algorithm>
#include <array>
#include <cmath>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include <opencv2/imgcodecs.hpp>

#include <ncnn/allocator.h>
#include <ncnn/net.h>

namespace pc {
    namespace {
        constexpr int kLandmarks = 5;

        struct Candidate {
            float x = 0.0f;
            float y = 0.0f;
            float w = 0.0f;
            float h = 0.0f;
            float score = 0.0f;
            std::array<Point, kLandmarks> landmarks{};
        };

        // out0-2 cls, out3-5 obj, out6-8 bbox, out9-11 landmarks; one per stride.
        constexpr int kLevels = 3;
        constexpr int kStrides[kLevels] = {8, 16, 32};
        constexpr const char* kBlobNames[4 * kLevels] = {
            "out0", "out1", "out2", "out3", "out4", "out5",
            "out6", "out7", "out8", "out9", "out10", "out11"
        };

        struct LevelBlobs {
            const float* cls = nullptr;
            const float* obj = nullptr;
            const float* bbox = nullptr;
            const float* kps = nullptr;
        };

        // Maps network-input coordinates back onto the source image.
        struct Scale {
            float sx = 1.0f;
            float sy = 1.0f;
            float max_x = 0.0f;
            float max_y = 0.0f;
        };

        float overlap(const Candidate& a, const Candidate& b) {
            const float ix = std::min(a.x + a.w, b.x + b.w) - std::max(a.x, b.x);
            const float iy = std::min(a.y + a.h, b.y + b.h) - std::max(a.y, b.y);
            if (ix <= 0.0f || iy <= 0.0f) return 0.0f;

            const float inter = ix * iy;
            const float uni = a.w * a.h + b.w * b.h - inter;
            return uni > 0.0f ? inter / uni : 0.0f;
        }

        void decode_level(const LevelBlobs& blobs,
                          int stride,
                          const YuNetDetectorConfig& cfg,
                          const Scale& scale,
                          std::vector<Candidate>& out) {
            if (!blobs.cls || !blobs.obj || !blobs.bbox) return;

            const int grid_w = cfg.input_w / stride;
            const int grid_h = cfg.input_h / stride;
            const float step = static_cast<float>(stride);

            for (int row = 0; row < grid_h; ++row) {
                for (int col = 0; col < grid_w; ++col) {
                    const int cell = row * grid_w + col;
                    const float cls = std::clamp(blobs.cls[cell], 0.0f, 1.0f);
                    const float obj = std::clamp(blobs.obj[cell], 0.0f, 1.0f);
                    const float score = std::sqrt(cls * obj);
                    if (score < cfg.score_threshold) continue;

                    const float* d = blobs.bbox + cell * 4;
                    const float half_w = 0.5f * std::exp(d[2]) * step;
                    const float half_h = 0.5f * std::exp(d[3]) * step;
                    const float cx = (static_cast<float>(col) + d[0]) * step;
                    const float cy = (static_cast<float>(row) + d[1]) * step;

                    const float left = std::max(0.0f, (cx - half_w) * scale.sx);
                    const float top = std::max(0.0f, (cy - half_h) * scale.sy);
                    const float right = std::min(scale.max_x, (cx + half_w) * scale.sx);
                    const float bottom = std::min(scale.max_y, (cy + half_h) * scale.sy);
                    if (right <= left || bottom <= top) continue;

                    Candidate c;
                    c.x = left;
                    c.y = top;
                    c.w = right - left;
                    c.h = bottom - top;
                    c.score = score;

                    if (blobs.kps) {
                        const float* k = blobs.kps + cell * 2 * kLandmarks;
                        for (size_t i = 0; i < c.landmarks.size(); ++i) {
                            c.landmarks[i].x = (static_cast<float>(col) + k[2 * i]) * step * scale.sx;
                            c.landmarks[i].y = (static_cast<float>(row) + k[2 * i + 1]) * step * scale.sy;
                        }
                    }
                    out.push_back(c);
                }
            }
        }

        // Greedy NMS over the top_k best candidates.
        std::vector<Candidate> suppress(std::vector<Candidate> candidates, int top_k, float iou_threshold) {
            std::stable_sort(candidates.begin(), candidates.end(), [](const Candidate& a, const Candidate& b) {
                return a.score > b.score;
            });
            if (top_k > 0 && candidates.size() > static_cast<size_t>(top_k)) {
                candidates.resize(static_cast<size_t>(top_k));
            }

            std::vector<Candidate> kept;
            for (const auto& c : candidates) {
                const bool overlaps = std::any_of(kept.begin(), kept.end(), [&](const Candidate& k) {
                    return overlap(c, k) > iou_threshold;
                });
                if (!overlaps) kept.push_back(c);
            }
            return kept;
        }

        std::string existing_model_file(const std::string& p) {
            namespace fs = std::filesystem;
            std::error_code ec;
            if (fs::is_regular_file(p, ec)) return p;
            throw std::runtime_error("[Detector] model file not found: " + p);
        }

        FaceDetection to_face(const Candidate& c) {
            FaceDetection f;
            f.box.x = static_cast<int>(std::lround(c.x));
            f.box.y = static_cast<int>(std::lround(c.y));
            f.box.width = std::max(1, static_cast<int>(std::lround(c.w)));
            f.box.height = std::max(1, static_cast<int>(std::lround(c.h)));
            f.confidence = c.score;
            f.landmarks.assign(c.landmarks.begin(), c.landmarks.end());
            return f;
        }
    } // namespace

    class YuNetDetector::Impl {
    public:
        explicit Impl(const YuNetDetectorConfig& cfg) {
            net_.opt.use_vulkan_compute = false;
            net_.opt.num_threads = std::max(1, cfg.ncnn_threads);
            workspace_allocator_.set_size_compare_ratio(0.0f);

            const std::string param = existing_model_file(cfg.param_path);
            const std::string weights = existing_model_file(cfg.bin_path);
            if (net_.load_param(param.c_str()) != 0) {
                throw std::runtime_error("[Detector] failed to load param: " + param);
            }
            if (net_.load_model(weights.c_str()) != 0) {
                throw std::runtime_error("[Detector] failed to load weights: " + weights);
            }
        }

        std::vector<Candidate> run(const cv::Mat& bgr, const YuNetDetectorConfig& cfg) const {
            if (bgr.empty()) return {};

            const ncnn::Mat input = ncnn::Mat::from_pixels_resize(
                bgr.data, ncnn::Mat::PIXEL_BGR, bgr.cols, bgr.rows, cfg.input_w, cfg.input_h);

            thread_local ncnn::UnlockedPoolAllocator blob_allocator;
            thread_local bool blob_allocator_ready = false;
            if (!blob_allocator_ready) {
                blob_allocator.set_size_compare_ratio(0.0f);
                blob_allocator_ready = true;
            }

            ncnn::Extractor ex = net_.create_extractor();
            ex.set_light_mode(true);
            ex.set_blob_allocator(&blob_allocator);
            ex.set_workspace_allocator(&workspace_allocator_);
            if (ex.input("in0", input) != 0) {
                throw std::runtime_error("[Detector] network rejected the input blob");
            }

            std::array<ncnn::Mat, 4 * kLevels> blobs{};
            for (size_t i = 0; i < blobs.size(); ++i) {
                if (ex.extract(kBlobNames[i], blobs[i]) != 0) {
                    throw std::runtime_error(std::string("[Detector] missing output ") + kBlobNames[i]);
                }
            }

            Scale scale;
            scale.sx = static_cast<float>(bgr.cols) / static_cast<float>(cfg.input_w);
            scale.sy = static_cast<float>(bgr.rows) / static_cast<float>(cfg.input_h);
            scale.max_x = static_cast<float>(bgr.cols);
            scale.max_y = static_cast<float>(bgr.rows);

            std::vector<Candidate> candidates;
            for (int level = 0; level < kLevels; ++level) {
                LevelBlobs lb;
                lb.cls = static_cast<const float*>(blobs[static_cast<size_t>(level)].data);
                lb.obj = static_cast<const float*>(blobs[static_cast<size_t>(kLevels + level)].data);
                lb.bbox = static_cast<const float*>(blobs[static_cast<size_t>(2 * kLevels + level)].data);
                lb.kps = static_cast<const float*>(blobs[static_cast<size_t>(3 * kLevels + level)].data);
                decode_level(lb, kStrides[level], cfg, scale, candidates);
            }
            return suppress(std::move(candidates), cfg.top_k, cfg.nms_threshold);
        }

    private:
        ncnn::Net net_;
        mutable ncnn::PoolAllocator workspace_allocator_;
    };

    YuNetDetector::YuNetDetector(YuNetDetectorConfig cfg)
        : cfg_(std::move(cfg)),
          impl_(std::make_unique<Impl>(cfg_)) {}

    YuNetDetector::~YuNetDetector() = default;
    YuNetDetector::YuNetDetector(YuNetDetector&&) noexcept = default;
    YuNetDetector& YuNetDetector::operator=(YuNetDetector&&) noexcept = default;

    std::vector<FaceDetection> YuNetDetector::detect_faces(const cv::Mat& bgr, float confidence_threshold) const {
        std::vector<FaceDetection> faces;
        for (const auto& c : impl_->run(bgr, cfg_)) {
            if (c.score < confidence_threshold) continue;
            faces.push_back(to_face(c));
        }
        return faces;
    }

    std::vector<Detection> YuNetDetector::detect(const std::string& image_path,
                                                 const std::vector<DetectionType>& types,
                                                 float confidence_threshold) {
        if (!wants(types, DetectionType::Face)) return {};

        const cv::Mat bgr = cv::imread(image_path, cv::IMREAD_COLOR);
        if (bgr.empty()) {
            throw std::runtime_error("Unable to read image for detection: " + image_path);
        }

        std::vector<Detection> out;
        for (auto& f : detect_faces(bgr, confidence_threshold)) {
            out.emplace_back(std::move(f));
        }
        return out;
    }
}
