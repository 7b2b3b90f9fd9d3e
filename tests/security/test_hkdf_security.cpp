#include <catch2/catch_test_macros.hpp>
#include "keyward/crypto/hkdf.hpp"
#include "keyward/crypto/sodium_interop.hpp"
#include "keyward/identity/key_agreement.hpp"
#include "keyward/core/constants.hpp"
#include <array>
#include <string>
#include <thread>
#include <vector>

using namespace keyward;
using namespace keyward::crypto;

TEST_CASE("HKDF RFC 5869 Test Vectors", "[security][hkdf][conformance]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const std::vector<uint8_t> ikm(22, 0x0b);

    SECTION("RFC 5869 Test Case 1 - Basic test case with SHA-256") {
        const std::vector<uint8_t> salt = {
            0x00, 0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07,
            0x08, 0x09, 0x0a, 0x0b, 0x0c
        };
        const std::vector<uint8_t> info = {
            0xf0, 0xf1, 0xf2, 0xf3, 0xf4, 0xf5, 0xf6, 0xf7,
            0xf8, 0xf9
        };
        auto okm = Hkdf::DeriveKeyBytes(ikm, 42, salt, info);
        REQUIRE(okm.IsOk());
        REQUIRE(SodiumInterop::ToHex(okm.Unwrap()) ==
            "3cb25f25faacd57a90434f64d0362f2a2d2d0a90cf1a5a4c5db02d56ecc4c5bf34007208d5b887185865");
    }

    SECTION("RFC 5869 Test Case 3 - Zero-length salt and info") {
        auto okm = Hkdf::DeriveKeyBytes(ikm, 42);
        REQUIRE(okm.IsOk());
        REQUIRE(SodiumInterop::ToHex(okm.Unwrap()) ==
            "8da4e775a563c18f715f802a063c5a31b8a11f5c5ee1879ec3454e5f3c738d2d9d201395faa4b61a96c8");
    }
}

TEST_CASE("HKDF Input Validation", "[security][hkdf]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const std::vector<uint8_t> ikm(32, 0x42);

    SECTION("Empty IKM must fail") {
        auto result = Hkdf::DeriveKeyBytes({}, 32);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == FailureType::InvalidInput);
    }

    SECTION("Zero output length must fail") {
        std::vector<uint8_t> output;
        REQUIRE(Hkdf::DeriveKey(ikm, output).IsErr());
    }

    SECTION("Maximum allowed output length (255 * 32 = 8160 bytes)") {
        auto result = Hkdf::DeriveKeyBytes(ikm, Hkdf::MAX_OUTPUT_LEN);
        REQUIRE(result.IsOk());
        REQUIRE(result.Unwrap().size() == Hkdf::MAX_OUTPUT_LEN);
    }

    SECTION("Output length exceeding maximum must fail") {
        auto result = Hkdf::DeriveKeyBytes(ikm, Hkdf::MAX_OUTPUT_LEN + 1);
        REQUIRE(result.IsErr());
    }
}

TEST_CASE("HKDF Context Separation", "[security][hkdf]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const std::vector<uint8_t> shared(Constants::SHARED_SECRET_SIZE, 0x5A);

    SECTION("Conversation ids separate keys") {
        auto a = identity::KeyAgreement::DeriveConversationKey(shared, "conversation-a");
        auto b = identity::KeyAgreement::DeriveConversationKey(shared, "conversation-b");
        REQUIRE(a.IsOk());
        REQUIRE(b.IsOk());
        REQUIRE(a.Unwrap().size() == Constants::AES_KEY_SIZE);
        REQUIRE(a.Unwrap() != b.Unwrap());
    }

    SECTION("Conversation key is HKDF with the conversation id as salt") {
        const std::string conversation = "conversation-a";
        const std::string info(Constants::CONVERSATION_KEY_INFO);
        auto expected = Hkdf::DeriveKeyBytes(
            shared, 32,
            std::vector<uint8_t>(conversation.begin(), conversation.end()),
            std::vector<uint8_t>(info.begin(), info.end()));
        auto actual = identity::KeyAgreement::DeriveConversationKey(shared, conversation);
        REQUIRE(expected.IsOk());
        REQUIRE(actual.IsOk());
        REQUIRE(actual.Unwrap() == expected.Unwrap());
    }

    SECTION("Empty conversation id is rejected") {
        auto result = identity::KeyAgreement::DeriveConversationKey(shared, "");
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == FailureType::InvalidInput);
    }
}

TEST_CASE("HKDF Concurrent Derivation Safety", "[security][hkdf][concurrency]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const std::vector<uint8_t> ikm(32, 0x17);
    auto reference = Hkdf::DeriveKeyBytes(ikm, 32);
    REQUIRE(reference.IsOk());
    std::vector<std::vector<uint8_t>> outputs(8);
    std::vector<std::thread> threads;
    for (size_t i = 0; i < outputs.size(); ++i) {
        threads.emplace_back([&, i] {
            auto result = Hkdf::DeriveKeyBytes(ikm, 32);
            if (result.IsOk()) {
                outputs[i] = result.Unwrap();
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }
    for (const auto& output : outputs) {
        REQUIRE(output == reference.Unwrap());
    }
}
