#include <knotstore/events/http_transport.hpp>

#include <curl/curl.h>
#include <memory>
#include <mutex>

namespace knotstore::events {

    namespace {

        std::once_flag curl_init_flag;

        std::size_t appendBody(char *data, std::size_t size, std::size_t nmemb, void *userdata) {
            auto *body = static_cast<std::string *>(userdata);
            body->append(data, size * nmemb);
            return size * nmemb;
        }

        struct EasyDeleter {
            void operator()(CURL *handle) const { curl_easy_cleanup(handle); }
        };

        struct ListDeleter {
            void operator()(curl_slist *list) const { curl_slist_free_all(list); }
        };

    } // namespace

    CurlTransport::CurlTransport() {
        std::call_once(curl_init_flag, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
    }

    HttpResponse CurlTransport::post(const HttpRequest &request) {
        HttpResponse response;

        std::unique_ptr<CURL, EasyDeleter> handle(curl_easy_init());
        if (!handle) {
            response.error = "curl_easy_init failed";
            return response;
        }

        curl_slist *raw_headers = nullptr;
        for (const auto &header : request.headers)
            raw_headers = curl_slist_append(raw_headers, header.c_str());
        std::unique_ptr<curl_slist, ListDeleter> headers(raw_headers);

        CURL *h = handle.get();
        curl_easy_setopt(h, CURLOPT_URL, request.url.c_str());
        curl_easy_setopt(h, CURLOPT_POST, 1L);
        curl_easy_setopt(h, CURLOPT_POSTFIELDS, request.body.c_str());
        curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, headers.get());
        curl_easy_setopt(h, CURLOPT_TIMEOUT, static_cast<long>(request.timeout_secs));
        curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT, static_cast<long>(request.timeout_secs));
        curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, appendBody);
        curl_easy_setopt(h, CURLOPT_WRITEDATA, &response.body);

        CURLcode rc = curl_easy_perform(h);
        if (rc != CURLE_OK) {
            response.error = curl_easy_strerror(rc);
            return response;
        }
        curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &response.status);
        return response;
    }

} // namespace knotstore::events
