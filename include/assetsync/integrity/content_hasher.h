#pragma once

#include <assetsync/core/types.h>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace assetsync::integrity {

enum class HashAlgorithm { Md5, Sha1, Sha224, Sha256, Sha384, Sha512 };

// Algorithm implied by the length of a hex digest; nullopt for unknown lengths or non-hex
std::optional<HashAlgorithm> detectAlgorithm(std::string_view hexDigest);

std::string_view algorithmName(HashAlgorithm algo);

bool digestsEqual(std::string_view a, std::string_view b);

/**
 * @brief Streaming message digest over OpenSSL EVP.
 *
 * init() is called by the constructor and again after every finalize(), so one hasher can
 * digest many inputs in sequence. Not thread-safe; use one instance per thread.
 */
class ContentHasher {
public:
    using ProgressCallback = std::function<void(std::uint64_t, std::uint64_t)>;

    explicit ContentHasher(HashAlgorithm algo = HashAlgorithm::Md5);
    ~ContentHasher();

    ContentHasher(const ContentHasher&) = delete;
    ContentHasher& operator=(const ContentHasher&) = delete;
    ContentHasher(ContentHasher&&) noexcept;
    ContentHasher& operator=(ContentHasher&&) noexcept;

    HashAlgorithm algorithm() const;

    void init();
    void update(std::span<const std::byte> data);
    // Lower-case hex digest
    std::string finalize();

    // FileNotFound / IoError on read problems, OperationCancelled when cancel fires
    Result<std::string> hashFile(const std::filesystem::path& path,
                                 const ShouldCancel& shouldCancel = {});

    void setProgressCallback(ProgressCallback callback);

    static std::string hash(HashAlgorithm algo, std::span<const std::byte> data);

    // Hash a file with the algorithm implied by expectedHex
    static Result<std::string> hashFileFor(const std::filesystem::path& path,
                                           std::string_view expectedHex,
                                           const ShouldCancel& shouldCancel = {});

private:
    struct Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace assetsync::integrity
