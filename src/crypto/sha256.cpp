#include <xpii/common/critical.hpp>
#include <xpii/crypto/sha256.hpp>

#include <array>
#include <fstream>

namespace xpii::crypto {

namespace {

void init_context(EVP_MD_CTX* context) {
  if (EVP_DigestInit_ex(context, EVP_sha256(), nullptr) != 1) {
    xpii::common::critical("EVP_DigestInit_ex failed for SHA-256");
  }
}

}  // namespace

sha256_hasher::sha256_hasher() : context_{EVP_MD_CTX_new(), EVP_MD_CTX_free} {
  if (!context_) {
    xpii::common::critical("EVP_MD_CTX_new failed");
  }
  init_context(context_.get());
}

sha256_hasher& sha256_hasher::update(const xpii::schema::bytes_view_t& bytes) {
  if (EVP_DigestUpdate(context_.get(), bytes.data(), bytes.size()) != 1) {
    xpii::common::critical("EVP_DigestUpdate failed");
  }
  return *this;
}

sha256_hasher& sha256_hasher::update(const std::string_view& str) {
  return update(xpii::schema::make_bytes_view(str));
}

xpii::schema::hash32_t sha256_hasher::finalize() {
  auto output = xpii::schema::hash32_t{};
  auto length = 0u;
  if (EVP_DigestFinal_ex(context_.get(), output.data(), &length) != 1 ||
      length != output.size()) {
    xpii::common::critical("EVP_DigestFinal_ex failed");
  }
  init_context(context_.get());
  return output;
}

xpii::schema::hash32_t sha256(const std::string_view& str) {
  return sha256_hasher{}.update(str).finalize();
}

xpii::schema::hash32_t sha256(const xpii::schema::bytes_view_t& bytes) {
  return sha256_hasher{}.update(bytes).finalize();
}

xpii::schema::hex_digest_t sha256_hex(const std::string_view& str) {
  return xpii::schema::to_hex(sha256(str));
}

xpii::schema::hex_digest_t sha256_hex(
    const xpii::schema::bytes_view_t& bytes) {
  return xpii::schema::to_hex(sha256(bytes));
}

std::optional<xpii::schema::hash32_t> sha256_file(
    const std::filesystem::path& path) {
  auto stream = std::ifstream{path, std::ios::binary};
  if (!stream) {
    return std::nullopt;
  }
  auto hasher = sha256_hasher{};
  auto buffer = std::array<char, kStreamChunkSize>{};
  while (stream) {
    stream.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    auto count = stream.gcount();
    if (count > 0) {
      hasher.update(std::string_view{buffer.data(),
                                     static_cast<std::size_t>(count)});
    }
  }
  if (stream.bad()) {
    return std::nullopt;
  }
  return hasher.finalize();
}

}  // namespace xpii::crypto
