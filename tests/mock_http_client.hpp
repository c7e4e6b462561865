#pragma once
#include "http.hpp"
#include <mutex>

namespace costgate {

class MockHttpClient : public HttpClient {
public:
    HttpResponse next_response;
    std::vector<HttpResponse> response_queue;
    std::string last_url;
    std::string last_body;
    std::vector<Header> last_headers;
    int call_count = 0;

    HttpResponse post(const std::string& url,
                      const std::string& body,
                      const std::vector<Header>& headers,
                      long /*timeout_seconds*/) override {
        std::lock_guard<std::mutex> lock(mutex_);
        call_count++;
        last_url = url;
        last_body = body;
        last_headers = headers;
        if (!response_queue.empty()) {
            auto resp = response_queue.front();
            response_queue.erase(response_queue.begin());
            return resp;
        }
        return next_response;
    }

private:
    std::mutex mutex_;
};

// Minimal chat-completions reply body.
inline std::string chat_reply(const std::string& content,
                              uint32_t prompt_tokens = 10,
                              uint32_t completion_tokens = 5) {
    return std::string(R"({"choices":[{"message":{"role":"assistant","content":")") +
           content + R"("}}],"usage":{"prompt_tokens":)" + std::to_string(prompt_tokens) +
           R"(,"completion_tokens":)" + std::to_string(completion_tokens) +
           R"(,"total_tokens":)" + std::to_string(prompt_tokens + completion_tokens) + "}}";
}

} // namespace costgate
