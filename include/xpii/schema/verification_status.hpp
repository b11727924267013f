#pragma once

#include <xpii/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace xpii::schema {

enum class verification_status_t : uint8_t {
  verified = 0,
  no_metadata = 1,
  no_provenance = 2,
  malformed_archive = 3,
};

inline constexpr auto kVerificationStatusMappings = std::array{
    std::pair<std::string_view, verification_status_t>{
        "VERIFIED", verification_status_t::verified},
    std::pair<std::string_view, verification_status_t>{
        "NO_METADATA", verification_status_t::no_metadata},
    std::pair<std::string_view, verification_status_t>{
        "NO_PROVENANCE", verification_status_t::no_provenance},
    std::pair<std::string_view, verification_status_t>{
        "MALFORMED_ARCHIVE", verification_status_t::malformed_archive},
};

inline constexpr std::string_view to_string(const verification_status_t value) {
  return to_string(value, kVerificationStatusMappings).value_or("UNKNOWN");
}

}  // namespace xpii::schema
