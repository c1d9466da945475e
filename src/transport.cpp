#include "canopy/transport.hpp"
#include "canopy/types.hpp"

#include <curl/curl.h>
#include <spdlog/spdlog.h>

#include <memory>

namespace canopy {

    namespace {
        size_t writeCallback(void *contents, size_t size, size_t nmemb, std::string *userp) {
            size_t total = size * nmemb;
            userp->append(static_cast<char *>(contents), total);
            return total;
        }

        struct CurlDeleter {
            void operator()(CURL *curl) const {
                if (curl)
                    curl_easy_cleanup(curl);
            }
        };
        using CurlPtr = std::unique_ptr<CURL, CurlDeleter>;

        struct SlistDeleter {
            void operator()(curl_slist *list) const {
                if (list)
                    curl_slist_free_all(list);
            }
        };
        using SlistPtr = std::unique_ptr<curl_slist, SlistDeleter>;
    } // namespace

    CurlTransport::CurlTransport(const CurlOptions &options) : options_(options) {
        curl_global_init(CURL_GLOBAL_DEFAULT);
    }

    CurlTransport::~CurlTransport() { curl_global_cleanup(); }

    HttpResponse CurlTransport::post(const std::string &url, const std::string &body, const std::string &contentType) {
        CurlPtr curl(curl_easy_init());
        if (!curl)
            throw TransportError("canopy::CurlTransport::post(): failed to initialize CURL");

        std::string header = "Content-Type: " + contentType;
        SlistPtr headers(curl_slist_append(nullptr, header.c_str()));

        HttpResponse response;
        curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
        curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
        curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, writeCallback);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
        curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, options_.userAgent.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, options_.connectTimeoutSeconds);
        curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, options_.timeoutSeconds);
        curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);

        CURLcode res = curl_easy_perform(curl.get());
        if (res != CURLE_OK) {
            throw TransportError(std::string("canopy::CurlTransport::post(): ") + curl_easy_strerror(res));
        }

        curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
        spdlog::debug("CurlTransport: POST {} -> {} ({} bytes)", url, response.status, response.body.size());
        return response;
    }

} // namespace canopy
