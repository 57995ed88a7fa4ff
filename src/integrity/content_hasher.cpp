#include <assetsync/integrity/content_hasher.h>

#include <openssl/evp.h>
#include <spdlog/spdlog.h>

#include <array>
#include <cctype>
#include <fstream>
#include <stdexcept>
#include <system_error>
#include <vector>

namespace assetsync::integrity {

namespace {

constexpr std::size_t kReadBufferSize = 64 * 1024;

const EVP_MD* resolve_algo(HashAlgorithm algo) {
    switch (algo) {
        case HashAlgorithm::Md5: return EVP_md5();
        case HashAlgorithm::Sha1: return EVP_sha1();
        case HashAlgorithm::Sha224: return EVP_sha224();
        case HashAlgorithm::Sha256: return EVP_sha256();
        case HashAlgorithm::Sha384: return EVP_sha384();
        case HashAlgorithm::Sha512: return EVP_sha512();
    }
    return EVP_md5();
}

std::string to_hex_lower(const unsigned char* bytes, std::size_t len) {
    static constexpr char kHex[] = "0123456789abcdef";
    std::string out;
    out.resize(len * 2);
    for (std::size_t i = 0; i < len; ++i) {
        unsigned v = bytes[i];
        out[2 * i + 0] = kHex[(v >> 4) & 0xF];
        out[2 * i + 1] = kHex[(v >> 0) & 0xF];
    }
    return out;
}

} // namespace

std::optional<HashAlgorithm> detectAlgorithm(std::string_view hexDigest) {
    for (unsigned char c : hexDigest) {
        if (!std::isxdigit(c))
            return std::nullopt;
    }
    switch (hexDigest.size()) {
        case 32: return HashAlgorithm::Md5;
        case 40: return HashAlgorithm::Sha1;
        case 56: return HashAlgorithm::Sha224;
        case 64: return HashAlgorithm::Sha256;
        case 96: return HashAlgorithm::Sha384;
        case 128: return HashAlgorithm::Sha512;
        default: return std::nullopt;
    }
}

std::string_view algorithmName(HashAlgorithm algo) {
    switch (algo) {
        case HashAlgorithm::Md5: return "md5";
        case HashAlgorithm::Sha1: return "sha1";
        case HashAlgorithm::Sha224: return "sha224";
        case HashAlgorithm::Sha256: return "sha256";
        case HashAlgorithm::Sha384: return "sha384";
        case HashAlgorithm::Sha512: return "sha512";
    }
    return "md5";
}

bool digestsEqual(std::string_view a, std::string_view b) {
    if (a.size() != b.size())
        return false;
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i])))
            return false;
    }
    return true;
}

struct ContentHasher::Impl {
    EVP_MD_CTX* ctx = nullptr;
    HashAlgorithm algo;
    ProgressCallback progressCallback;

    explicit Impl(HashAlgorithm a) : ctx(EVP_MD_CTX_new()), algo(a) {
        if (!ctx) {
            throw std::runtime_error("Failed to create EVP_MD_CTX");
        }
    }

    ~Impl() {
        if (ctx) {
            EVP_MD_CTX_free(ctx);
        }
    }

    Impl(const Impl&) = delete;
    Impl& operator=(const Impl&) = delete;
};

ContentHasher::ContentHasher(HashAlgorithm algo) : pImpl(std::make_unique<Impl>(algo)) {
    init();
}

ContentHasher::~ContentHasher() = default;

ContentHasher::ContentHasher(ContentHasher&&) noexcept = default;
ContentHasher& ContentHasher::operator=(ContentHasher&&) noexcept = default;

HashAlgorithm ContentHasher::algorithm() const {
    return pImpl->algo;
}

void ContentHasher::init() {
    if (EVP_DigestInit_ex(pImpl->ctx, resolve_algo(pImpl->algo), nullptr) != 1) {
        throw std::runtime_error("Failed to initialize digest " +
                                 std::string(algorithmName(pImpl->algo)));
    }
}

void ContentHasher::update(std::span<const std::byte> data) {
    if (data.empty())
        return;
    if (EVP_DigestUpdate(pImpl->ctx, data.data(), data.size()) != 1) {
        throw std::runtime_error("Failed to update digest");
    }
}

std::string ContentHasher::finalize() {
    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int digestLen = 0;

    if (EVP_DigestFinal_ex(pImpl->ctx, digest.data(), &digestLen) != 1) {
        throw std::runtime_error("Failed to finalize digest");
    }
    auto out = to_hex_lower(digest.data(), digestLen);

    // Reset for potential reuse
    init();
    return out;
}

Result<std::string> ContentHasher::hashFile(const std::filesystem::path& path,
                                            const ShouldCancel& shouldCancel) {
    std::error_code ec;
    const auto fileSize = std::filesystem::file_size(path, ec);
    if (ec) {
        return Error{ErrorCode::FileNotFound, "cannot stat " + path.string() + ": " + ec.message()};
    }
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return Error{ErrorCode::IoError, "failed to open file: " + path.string()};
    }

    try {
        init();
        std::vector<std::byte> buffer(kReadBufferSize);
        std::uint64_t processed = 0;
        while (file) {
            if (shouldCancel && shouldCancel()) {
                init();
                return Error{ErrorCode::OperationCancelled, "hashing cancelled"};
            }
            file.read(reinterpret_cast<char*>(buffer.data()),
                      static_cast<std::streamsize>(buffer.size()));
            auto bytesRead = file.gcount();
            if (bytesRead > 0) {
                update(std::span{buffer.data(), static_cast<std::size_t>(bytesRead)});
                processed += static_cast<std::uint64_t>(bytesRead);
                if (pImpl->progressCallback) {
                    pImpl->progressCallback(processed, fileSize);
                }
            }
        }
        if (file.bad()) {
            init();
            return Error{ErrorCode::IoError, "read error while hashing " + path.string()};
        }
        return finalize();
    } catch (const std::runtime_error& e) {
        spdlog::error("Failed to hash file {}: {}", path.string(), e.what());
        return Error{ErrorCode::InternalError, e.what()};
    }
}

void ContentHasher::setProgressCallback(ProgressCallback callback) {
    pImpl->progressCallback = std::move(callback);
}

std::string ContentHasher::hash(HashAlgorithm algo, std::span<const std::byte> data) {
    ContentHasher hasher(algo);
    hasher.update(data);
    return hasher.finalize();
}

Result<std::string> ContentHasher::hashFileFor(const std::filesystem::path& path,
                                               std::string_view expectedHex,
                                               const ShouldCancel& shouldCancel) {
    auto algo = detectAlgorithm(expectedHex);
    if (!algo) {
        return Error{ErrorCode::InvalidArgument,
                     "unrecognised digest length " + std::to_string(expectedHex.size())};
    }
    ContentHasher hasher(*algo);
    return hasher.hashFile(path, shouldCancel);
}

} // namespace assetsync::integrity
