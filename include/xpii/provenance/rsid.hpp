#pragma once

#include <string>
#include <string_view>

namespace xpii::provenance {

/// Revision-save id for a session: the first eight hex characters of
/// SHA-256(session_id), uppercased.
std::string derive_rsid(std::string_view session_id);

}  // namespace xpii::provenance
