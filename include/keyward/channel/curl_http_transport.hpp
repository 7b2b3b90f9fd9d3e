#pragma once
#include "keyward/interfaces/i_http_transport.hpp"

namespace keyward::channel {

/// libcurl-backed GET. Each request uses its own easy handle, so one
/// instance can serve several threads. TLS peers are always verified.
class CurlHttpTransport final : public interfaces::IHttpTransport {
public:
    CurlHttpTransport();

    [[nodiscard]] Result<interfaces::HttpResponse, KeywardFailure> Get(
        const std::string& url,
        std::chrono::milliseconds timeout) override;
};

} // namespace keyward::channel
