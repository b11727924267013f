#pragma once

#include <map>
#include <string>
#include <string_view>

// dc:description provenance payload.
// "XPII-CHAIN-PROVENANCE: <session_id> | XPII-CHAIN-SHA256: <fingerprint>"
namespace xpii::provenance {

inline constexpr auto kProvenanceKey = std::string_view{"XPII-CHAIN-PROVENANCE"};
inline constexpr auto kFingerprintKey = std::string_view{"XPII-CHAIN-SHA256"};

std::string format_description(std::string_view session_id,
                               std::string_view fingerprint);

/// Key/value pairs of a description. Segments are separated by `|` and split
/// on their first `": "`; keys and values are trimmed. Segments without a
/// separator are skipped, except a bare `KEY:` which maps to an empty value.
std::map<std::string, std::string> parse_description(std::string_view text);

/// True when `text` carries the `XPII-CHAIN-PROVENANCE:` marker.
bool has_provenance_marker(std::string_view text);

}  // namespace xpii::provenance
