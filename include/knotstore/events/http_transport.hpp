#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace knotstore::events {

    struct HttpRequest {
        std::string url;
        std::vector<std::string> headers;
        std::string body;
        std::uint32_t timeout_secs{10};
    };

    struct HttpResponse {
        long status{0};
        std::string body;
        /// Transport-level failure (timeout, refused connection); empty when a response arrived
        std::string error;

        bool ok() const { return error.empty() && status >= 200 && status < 300; }
    };

    /// HTTP POST seam shared by the cluster-event and webhook publishers
    class HttpTransport {
      public:
        virtual ~HttpTransport() = default;
        virtual HttpResponse post(const HttpRequest &request) = 0;
    };

    /// libcurl-backed transport; one easy handle per request
    class CurlTransport : public HttpTransport {
      public:
        CurlTransport();
        HttpResponse post(const HttpRequest &request) override;
    };

} // namespace knotstore::events
