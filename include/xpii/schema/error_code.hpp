#pragma once

#include <xpii/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: error code.
// Pipeline taxonomy: classifies every failure surfaced by the codec,
// provenance and governance layers. Zero is success.
namespace xpii::schema {

enum class error_code : uint32_t {
  ok = 0,
  archive_error = 1,
  malformed_archive = 2,
  no_metadata = 3,
  no_provenance = 4,
  operation_blocked = 5,
  policy_denied = 6,
  io_error = 7,
};

inline constexpr auto kErrorCodeMappings = std::array{
    std::pair<std::string_view, error_code>{"ok", error_code::ok},
    std::pair<std::string_view, error_code>{"archive_error",
                                            error_code::archive_error},
    std::pair<std::string_view, error_code>{"malformed_archive",
                                            error_code::malformed_archive},
    std::pair<std::string_view, error_code>{"no_metadata",
                                            error_code::no_metadata},
    std::pair<std::string_view, error_code>{"no_provenance",
                                            error_code::no_provenance},
    std::pair<std::string_view, error_code>{"operation_blocked",
                                            error_code::operation_blocked},
    std::pair<std::string_view, error_code>{"policy_denied",
                                            error_code::policy_denied},
    std::pair<std::string_view, error_code>{"io_error", error_code::io_error},
};

inline constexpr std::string_view to_string(const error_code value) {
  return to_string(value, kErrorCodeMappings).value_or("unknown");
}

}  // namespace xpii::schema
