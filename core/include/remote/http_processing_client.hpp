#pragma once

#include <memory>
#include <string>

#include <common/retry.hpp>
#include <remote/processing_service.hpp>

namespace pc {
    struct HttpProcessingClientConfig {
        std::string url = "http://localhost:8000";
        int timeout_ms = 30000;
        RetryPolicy retry; // base_delay doubles per attempt
    };

    // IRemoteProcessingService over HTTP+JSON.
    class HttpProcessingClient : public IRemoteProcessingService {
    public:
        explicit HttpProcessingClient(HttpProcessingClientConfig cfg);
        ~HttpProcessingClient() override;

        HttpProcessingClient(const HttpProcessingClient&) = delete;
        HttpProcessingClient& operator=(const HttpProcessingClient&) = delete;

        RemoteHealth health_check() override;
        std::vector<Detection> detect_objects(const RemoteDetectRequest& req) override;
        RemoteProcessedImage crop_image(const RemoteCropRequest& req) override;
        RemoteBatchResult process_batch(const RemoteBatchRequest& req) override;
        RemoteComposedSheet compose_sheet(const RemoteSheetRequest& req) override;

        const HttpProcessingClientConfig& config() const { return cfg_; }

    private:
        HttpProcessingClientConfig cfg_;
        class Impl;
        std::unique_ptr<Impl> impl_;
    };

    // 400 and 404 are final; everything else may be retried.
    bool is_retryable_remote_error(const std::exception& e);
}
