#pragma once
#include "keyward/core/result.hpp"
#include "keyward/core/failures.hpp"
#include <chrono>
#include <string>

namespace keyward::interfaces {

struct HttpResponse {
    long status_code = 0;
    std::string body;
};

/// Minimal HTTP GET capability. A transport time-out must be reported as
/// FetchTimeout; other transport errors as Network. Non-2xx responses are
/// returned as Ok with their status code.
class IHttpTransport {
public:
    virtual ~IHttpTransport() = default;
    [[nodiscard]] virtual Result<HttpResponse, KeywardFailure> Get(
        const std::string& url,
        std::chrono::milliseconds timeout) = 0;
};

}
