#pragma once
#include "keyward/crypto/sodium_interop.hpp"
#include <filesystem>
#include <system_error>

namespace keyward::test_helpers {

/// Unique directory under the system temp path, removed on destruction.
class TempDirectory {
public:
    TempDirectory()
        : path_(std::filesystem::temp_directory_path()
            / ("keyward-test-" + crypto::SodiumInterop::ToHex(crypto::SodiumInterop::GetRandomBytes(8)))) {
    }

    ~TempDirectory() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDirectory(const TempDirectory&) = delete;
    TempDirectory& operator=(const TempDirectory&) = delete;

    [[nodiscard]] const std::filesystem::path& Path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
};

} // namespace keyward::test_helpers
