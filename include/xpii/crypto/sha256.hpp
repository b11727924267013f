#pragma once
#include <xpii/schema/primitives.hpp>

#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <string_view>

#include <openssl/evp.h>

namespace xpii::crypto {

/// Read size used when streaming files through the hasher.
inline constexpr auto kStreamChunkSize = std::size_t{8192};

/// Incremental SHA-256 over an OpenSSL digest context.
class sha256_hasher final {
 public:
  sha256_hasher();

  sha256_hasher(const sha256_hasher&) = delete;
  sha256_hasher& operator=(const sha256_hasher&) = delete;
  sha256_hasher(sha256_hasher&&) = default;
  sha256_hasher& operator=(sha256_hasher&&) = default;

  sha256_hasher& update(const xpii::schema::bytes_view_t& bytes);
  sha256_hasher& update(const std::string_view& str);

  /// Produce the digest. The hasher is reset and may be reused.
  xpii::schema::hash32_t finalize();

 private:
  std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> context_;
};

xpii::schema::hash32_t sha256(const std::string_view& str);
xpii::schema::hash32_t sha256(const xpii::schema::bytes_view_t& bytes);

/// Hex digest convenience used wherever a fingerprint string is stored.
xpii::schema::hex_digest_t sha256_hex(const std::string_view& str);
xpii::schema::hex_digest_t sha256_hex(const xpii::schema::bytes_view_t& bytes);

/// Stream a file in kStreamChunkSize reads. std::nullopt when unreadable.
std::optional<xpii::schema::hash32_t> sha256_file(
    const std::filesystem::path& path);

}  // namespace xpii::crypto
