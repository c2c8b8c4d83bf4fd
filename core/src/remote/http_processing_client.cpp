#include <remote/http_processing_client.hpp>

#include <algorithm>
#include <chrono>
#include <iostream>
#include <mutex>
#include <string>
#include <utility>

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <remote/wire.hpp>

namespace pc {
    namespace {
        using nlohmann::json;

        constexpr int kMalformedResponse = 502;

        std::string error_message_from(const httplib::Response& res) {
            const json body = json::parse(res.body, nullptr, false);
            if (!body.is_discarded() && body.is_object()) {
                for (const char* key : {"message", "detail"}) {
                    if (!body.contains(key)) continue;
                    const auto& v = body.at(key);
                    return v.is_string() ? v.get<std::string>() : v.dump();
                }
            }
            return "HTTP " + std::to_string(res.status) + " error";
        }
    } // namespace

    bool is_retryable_remote_error(const std::exception& e) {
        const auto* re = dynamic_cast<const RemoteServiceError*>(&e);
        if (!re) return true;
        return re->status() != 400 && re->status() != 404;
    }

    class HttpProcessingClient::Impl {
    public:
        explicit Impl(const HttpProcessingClientConfig& cfg)
            : cli_(cfg.url) {
            const auto timeout = std::chrono::milliseconds(std::max(1, cfg.timeout_ms));
            cli_.set_connection_timeout(timeout);
            cli_.set_read_timeout(timeout);
            cli_.set_write_timeout(timeout);
            cli_.set_keep_alive(true);
        }

        json get(const std::string& path) {
            std::lock_guard lk(mtx_);
            return handle_("GET", path, cli_.Get(path));
        }

        json post(const std::string& path, const json& body) {
            const std::string payload = body.dump();
            std::lock_guard lk(mtx_);
            return handle_("POST", path, cli_.Post(path, payload, "application/json"));
        }

    private:
        json handle_(const char* method, const std::string& path, const httplib::Result& res) {
            if (!res) {
                const auto err = res.error();
                int status = 0;
                if (err == httplib::Error::Connection) status = 503;
                else if (err == httplib::Error::Read) status = 408;
                throw RemoteServiceError(status, std::string(method) + " " + path + " failed: " +
                                                 httplib::to_string(err));
            }
            if (res->status >= 400) {
                throw RemoteServiceError(res->status, std::string(method) + " " + path + ": " +
                                                      error_message_from(*res));
            }

            json out = json::parse(res->body, nullptr, false);
            if (out.is_discarded()) {
                throw RemoteServiceError(kMalformedResponse, std::string(method) + " " + path +
                                                             ": response is not JSON");
            }
            return out;
        }

        std::mutex mtx_;
        httplib::Client cli_;
    };

    HttpProcessingClient::HttpProcessingClient(HttpProcessingClientConfig cfg)
        : cfg_(std::move(cfg)),
          impl_(std::make_unique<Impl>(cfg_)) {}

    HttpProcessingClient::~HttpProcessingClient() = default;

    namespace {
        // Retries request() with the client policy; a body that does not map is a 502.
        template <class Request, class Parse>
        auto call_remote(const RetryPolicy& policy, const char* op, Request&& request, Parse&& parse)
            -> decltype(parse(std::declval<const json&>())) {
            return with_retry(
                policy,
                [&](int) {
                    const json body = request();
                    try {
                        return parse(body);
                    } catch (const std::exception& e) {
                        throw RemoteServiceError(kMalformedResponse,
                                                 std::string(op) + ": unexpected response: " + e.what());
                    }
                },
                [op, &policy](int attempt, const std::exception& e) {
                    std::cerr << "[Remote](" << op << ") attempt " << attempt << "/" << policy.max_attempts
                              << " failed: " << e.what() << "\n";
                },
                is_retryable_remote_error);
        }
    } // namespace

    RemoteHealth HttpProcessingClient::health_check() {
        const json body = impl_->get("/health");
        try {
            return health_from_json(body);
        } catch (const std::exception& e) {
            throw RemoteServiceError(kMalformedResponse, std::string("health_check: ") + e.what());
        }
    }

    std::vector<Detection> HttpProcessingClient::detect_objects(const RemoteDetectRequest& req) {
        return call_remote(
            cfg_.retry, "detect_objects",
            [&] { return impl_->post("/api/v1/detect", to_json(req)); },
            [](const json& j) { return detections_from_json(j); });
    }

    RemoteProcessedImage HttpProcessingClient::crop_image(const RemoteCropRequest& req) {
        return call_remote(
            cfg_.retry, "crop_image",
            [&] { return impl_->post("/api/v1/crop", to_json(req)); },
            [](const json& j) { return processed_image_from_json(j); });
    }

    RemoteBatchResult HttpProcessingClient::process_batch(const RemoteBatchRequest& req) {
        return call_remote(
            cfg_.retry, "process_batch",
            [&] { return impl_->post("/api/v1/process-batch", to_json(req)); },
            [](const json& j) { return batch_result_from_json(j); });
    }

    RemoteComposedSheet HttpProcessingClient::compose_sheet(const RemoteSheetRequest& req) {
        return call_remote(
            cfg_.retry, "compose_sheet",
            [&] { return impl_->post("/api/v1/compose-sheet", to_json(req)); },
            [](const json& j) { return composed_sheet_from_json(j); });
    }
}
