/**
 * @file scripted_http_client.h
 * @brief http_client_interface replaying queued responses for unit tests
 */

#ifndef KCENON_STAGE_TRANSFER_TESTS_MOCKS_SCRIPTED_HTTP_CLIENT_H
#define KCENON_STAGE_TRANSFER_TESTS_MOCKS_SCRIPTED_HTTP_CLIENT_H

#include <kcenon/stage_transfer/cloud/cloud_http_client.h>

#include <deque>
#include <mutex>
#include <string>
#include <vector>

namespace kcenon::stage_transfer::test {

/**
 * @brief Request captured by scripted_http_client
 */
struct recorded_request {
    std::string method;
    std::string url;
    http_headers headers;
    std::string body;

    [[nodiscard]] auto header(const std::string& name) const -> std::string {
        auto it = headers.find(name);
        return it == headers.end() ? std::string{} : it->second;
    }
};

/**
 * @brief Returns queued responses in order, then 200 with an empty body
 */
class scripted_http_client : public http_client_interface {
public:
    void respond(int status, std::string body = {}, http_headers headers = {}) {
        std::lock_guard lock(mutex_);
        http_response response;
        response.status_code = status;
        response.body.assign(body.begin(), body.end());
        response.headers = std::move(headers);
        replies_.push_back(std::move(response));
    }

    void fail_connection(std::string message) {
        std::lock_guard lock(mutex_);
        replies_.push_back(unexpected{error{error_code::transient_network, std::move(message)}});
    }

    [[nodiscard]] auto requests() const -> std::vector<recorded_request> {
        std::lock_guard lock(mutex_);
        return requests_;
    }

    [[nodiscard]] auto last() const -> recorded_request {
        std::lock_guard lock(mutex_);
        return requests_.empty() ? recorded_request{} : requests_.back();
    }

    auto get(const std::string& url,
             const std::map<std::string, std::string>& query,
             const http_headers& headers) -> result<http_response> override {
        std::string full = url;
        if (!query.empty()) {
            char separator = url.find('?') == std::string::npos ? '?' : '&';
            for (const auto& [name, value] : query) {
                full += separator + name + "=" + value;
                separator = '&';
            }
        }
        return record("GET", full, headers, {});
    }

    auto post(const std::string& url,
              const std::string& body,
              const http_headers& headers) -> result<http_response> override {
        return record("POST", url, headers, body);
    }

    auto put(const std::string& url,
             const std::vector<uint8_t>& body,
             const http_headers& headers) -> result<http_response> override {
        return record("PUT", url, headers, std::string(body.begin(), body.end()));
    }

    auto del(const std::string& url, const http_headers& headers)
        -> result<http_response> override {
        return record("DELETE", url, headers, {});
    }

    auto head(const std::string& url, const http_headers& headers)
        -> result<http_response> override {
        return record("HEAD", url, headers, {});
    }

private:
    auto record(const char* method, const std::string& url, const http_headers& headers,
                std::string body) -> result<http_response> {
        std::lock_guard lock(mutex_);
        requests_.push_back({method, url, headers, std::move(body)});
        if (replies_.empty()) {
            http_response ok;
            ok.status_code = 200;
            return ok;
        }
        auto reply = std::move(replies_.front());
        replies_.pop_front();
        return reply;
    }

    mutable std::mutex mutex_;
    std::deque<result<http_response>> replies_;
    std::vector<recorded_request> requests_;
};

}  // namespace kcenon::stage_transfer::test

#endif  // KCENON_STAGE_TRANSFER_TESTS_MOCKS_SCRIPTED_HTTP_CLIENT_H
