#pragma once

#include "keyward/core/result.hpp"
#include "keyward/core/failures.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace keyward::codec {

struct PemLabel {
    static constexpr std::string_view PUBLIC_KEY = "PUBLIC KEY";
    static constexpr std::string_view RSA_PUBLIC_KEY = "RSA PUBLIC KEY";
    static constexpr std::string_view PRIVATE_KEY = "PRIVATE KEY";
    static constexpr std::string_view RSA_PRIVATE_KEY = "RSA PRIVATE KEY";
};

struct PemBlock {
    std::string label;
    std::vector<uint8_t> der;
};

class Pem {
public:
    /// Base64 body wrapped at 64 characters, trailing newline after the footer.
    static std::string Encode(std::string_view label, std::span<const uint8_t> der);

    /// Decodes the first block. Text before BEGIN and after END is ignored.
    static Result<PemBlock, KeywardFailure> Decode(std::string_view text);

private:
    Pem() = delete;
};

} // namespace keyward::codec
