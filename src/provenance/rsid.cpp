#include <xpii/crypto/sha256.hpp>
#include <xpii/provenance/rsid.hpp>

#include <algorithm>
#include <cctype>

namespace xpii::provenance {

namespace {

inline constexpr auto kRsidLength = std::size_t{8};

}  // namespace

std::string derive_rsid(const std::string_view session_id) {
  auto rsid = xpii::crypto::sha256_hex(session_id).substr(0, kRsidLength);
  std::ranges::transform(rsid, std::begin(rsid), [](const unsigned char c) {
    return static_cast<char>(std::toupper(c));
  });
  return rsid;
}

}  // namespace xpii::provenance
