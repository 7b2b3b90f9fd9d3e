#include "keyward/codec/pem.hpp"
#include "keyward/crypto/sodium_interop.hpp"
#include "keyward/core/constants.hpp"
#include "keyward/core/format.hpp"

namespace keyward::codec {

using crypto::SodiumInterop;

namespace {
    constexpr std::string_view kBeginPrefix = "-----BEGIN ";
    constexpr std::string_view kEndPrefix = "-----END ";
    constexpr std::string_view kDashes = "-----";
}

std::string Pem::Encode(std::string_view label, std::span<const uint8_t> der) {
    const std::string body = SodiumInterop::ToBase64(der);
    std::string out;
    out.reserve(body.size() + body.size() / RsaConstants::PEM_LINE_WIDTH + 2 * label.size() + 40);
    out.append(kBeginPrefix).append(label).append(kDashes).push_back('\n');
    for (size_t pos = 0; pos < body.size(); pos += RsaConstants::PEM_LINE_WIDTH) {
        out.append(body, pos, RsaConstants::PEM_LINE_WIDTH);
        out.push_back('\n');
    }
    out.append(kEndPrefix).append(label).append(kDashes).push_back('\n');
    return out;
}

Result<PemBlock, KeywardFailure> Pem::Decode(std::string_view text) {
    const size_t begin = text.find(kBeginPrefix);
    if (begin == std::string_view::npos) {
        return Result<PemBlock, KeywardFailure>::Err(
            KeywardFailure::KeyFormat("pemHeader", "PEM BEGIN marker not found"));
    }
    const size_t label_start = begin + kBeginPrefix.size();
    const size_t label_end = text.find(kDashes, label_start);
    if (label_end == std::string_view::npos) {
        return Result<PemBlock, KeywardFailure>::Err(
            KeywardFailure::KeyFormat("pemHeader", "PEM BEGIN marker is not terminated"));
    }
    const std::string_view label = text.substr(label_start, label_end - label_start);
    if (label.empty() || label.find('\n') != std::string_view::npos) {
        return Result<PemBlock, KeywardFailure>::Err(
            KeywardFailure::KeyFormat("pemHeader", "PEM label is malformed"));
    }

    const std::string footer = std::string(kEndPrefix) + std::string(label) + std::string(kDashes);
    const size_t body_start = label_end + kDashes.size();
    const size_t footer_pos = text.find(footer, body_start);
    if (footer_pos == std::string_view::npos) {
        return Result<PemBlock, KeywardFailure>::Err(
            KeywardFailure::KeyFormat("pemFooter",
                compat::format("PEM END marker for '{}' not found", label)));
    }

    const std::string_view body = text.substr(body_start, footer_pos - body_start);
    if (body.find(':') != std::string_view::npos) {
        return Result<PemBlock, KeywardFailure>::Err(
            KeywardFailure::KeyFormat("pemBody", "Encrypted or annotated PEM bodies are not supported"));
    }
    auto der = SodiumInterop::FromBase64(body);
    if (der.IsErr()) {
        return Result<PemBlock, KeywardFailure>::Err(
            KeywardFailure::KeyFormat("pemBody", "PEM body is not valid base64"));
    }
    if (der.Unwrap().empty()) {
        return Result<PemBlock, KeywardFailure>::Err(
            KeywardFailure::KeyFormat("pemBody", "PEM body is empty"));
    }
    return Result<PemBlock, KeywardFailure>::Ok(
        PemBlock{std::string(label), std::move(der).Unwrap()});
}

} // namespace keyward::codec
