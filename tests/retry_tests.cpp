#include <common/retry.hpp>
#include <remote/http_processing_client.hpp>
#include <remote/processing_service.hpp>

#include <chrono>
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

    struct RecordingSleep {
        std::vector<long long> delays_ms;

        pc::RetryPolicy policy(int attempts, int base_ms) {
            pc::RetryPolicy p;
            p.max_attempts = attempts;
            p.base_delay = std::chrono::milliseconds(base_ms);
            p.sleep = [this](std::chrono::milliseconds d) { delays_ms.push_back(d.count()); };
            return p;
        }
    };

    void test_backoff_doubles() {
        pc::RetryPolicy p;
        p.base_delay = std::chrono::milliseconds(1000);
        check(pc::backoff_delay(p, 1).count() == 1000, "first retry waits the base delay");
        check(pc::backoff_delay(p, 2).count() == 2000, "second retry waits twice the base");
        check(pc::backoff_delay(p, 3).count() == 4000, "third retry waits four times the base");
    }

    void test_succeeds_after_failures() {
        RecordingSleep sleep;
        int calls = 0;
        std::vector<int> failed_attempts;

        const int v = pc::with_retry(
            sleep.policy(3, 100),
            [&](int attempt) {
                ++calls;
                if (attempt < 3) throw std::runtime_error("flaky");
                return 42;
            },
            [&](int attempt, const std::exception&) { failed_attempts.push_back(attempt); });

        check(v == 42, "with_retry should return the eventual value");
        check(calls == 3, "with_retry should call until success");
        check(failed_attempts == std::vector<int>({1, 2}), "failure callback should see attempts 1 and 2");
        check(sleep.delays_ms == std::vector<long long>({100, 200}), "delays should double between attempts");
    }

    void test_rethrows_last_error() {
        RecordingSleep sleep;
        int calls = 0;
        bool threw = false;
        try {
            (void)pc::with_retry(sleep.policy(2, 0), [&](int attempt) -> int {
                ++calls;
                throw std::runtime_error("boom " + std::to_string(attempt));
            });
        } catch (const std::runtime_error& e) {
            threw = std::string(e.what()) == "boom 2";
        }
        check(threw, "with_retry should rethrow the last attempt's error");
        check(calls == 2, "with_retry should stop at max_attempts");
        check(sleep.delays_ms.empty(), "zero base delay should not sleep");
    }

    void test_non_retryable_stops_immediately() {
        RecordingSleep sleep;
        int calls = 0;
        bool status_kept = false;
        try {
            (void)pc::with_retry(
                sleep.policy(5, 10),
                [&](int) -> int {
                    ++calls;
                    throw pc::RemoteServiceError(404, "not found");
                },
                {},
                pc::is_retryable_remote_error);
        } catch (const pc::RemoteServiceError& e) {
            status_kept = e.status() == 404;
        }
        check(calls == 1, "404 should not be retried");
        check(status_kept, "remote status should survive the rethrow");
    }

    void test_retryable_classification() {
        check(!pc::is_retryable_remote_error(pc::RemoteServiceError(400, "bad")), "400 is final");
        check(!pc::is_retryable_remote_error(pc::RemoteServiceError(404, "missing")), "404 is final");
        check(pc::is_retryable_remote_error(pc::RemoteServiceError(503, "down")), "503 is retried");
        check(pc::is_retryable_remote_error(pc::RemoteServiceError(408, "slow")), "408 is retried");
        check(pc::is_retryable_remote_error(pc::RemoteServiceError(0, "reset")), "transport errors are retried");
        check(pc::is_retryable_remote_error(std::runtime_error("other")), "plain errors are retried");
    }

    void test_single_attempt_policy() {
        RecordingSleep sleep;
        int calls = 0;
        bool threw = false;
        try {
            (void)pc::with_retry(sleep.policy(0, 10), [&](int) -> int {
                ++calls;
                throw std::runtime_error("x");
            });
        } catch (const std::runtime_error&) {
            threw = true;
        }
        check(threw && calls == 1, "max_attempts below 1 still runs once");
    }
}

int main() {
    test_backoff_doubles();
    test_succeeds_after_failures();
    test_rethrows_last_error();
    test_non_retryable_stops_immediately();
    test_retryable_classification();
    test_single_attempt_policy();

    if (g_failures != 0) {
        std::cerr << "[FAIL] total failures: " << g_failures << "\n";
        return 1;
    }

    std::cout << "[OK] all retry tests passed\n";
    return 0;
}
