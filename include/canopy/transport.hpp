#pragma once

#include <string>

namespace canopy {

    struct HttpResponse {
        long status = 0;
        std::string body;

        bool ok() const { return status >= 200 && status < 300; }
    };

    // Blocking HTTP POST. Implementations throw TransportError when no response was received
    // and must be safe to call from several threads at once.
    class HttpTransport {
      public:
        virtual ~HttpTransport() = default;

        virtual HttpResponse post(const std::string &url, const std::string &body, const std::string &contentType) = 0;
    };

    struct CurlOptions {
        std::string userAgent = "canopy/1.0";
        long connectTimeoutSeconds = 10;
        long timeoutSeconds = 30; // 0 disables the client-side limit
    };

    class CurlTransport : public HttpTransport {
      private:
        CurlOptions options_;

      public:
        explicit CurlTransport(const CurlOptions &options = CurlOptions{});
        ~CurlTransport() override;

        CurlTransport(const CurlTransport &) = delete;
        CurlTransport &operator=(const CurlTransport &) = delete;

        HttpResponse post(const std::string &url, const std::string &body, const std::string &contentType) override;
    };

} // namespace canopy
