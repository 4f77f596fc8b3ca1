#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace verirag {

struct HttpRequest {
    std::string method = "GET";
    std::string url;
    std::vector<std::string> headers;
    std::string body;
    long timeout_seconds = 30;
};

struct HttpResponse {
    long status = 0;
    std::string body;
};

// Raised when no HTTP response was obtained at all (DNS, connect, timeout).
class HttpTransportError : public std::runtime_error {
public:
    HttpTransportError(const std::string& message, bool timed_out)
        : std::runtime_error(message), timed_out_(timed_out) {}

    bool timed_out() const noexcept { return timed_out_; }

private:
    bool timed_out_;
};

// Blocking request; safe to call from several threads at once.
HttpResponse perform_http_request(const HttpRequest& request);

// Shortens a response body for inclusion in error messages.
std::string body_preview(const std::string& body, std::size_t limit = 512);

}  // namespace verirag
