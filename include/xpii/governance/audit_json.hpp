#pragma once

#include <xpii/common/error.hpp>
#include <xpii/schema/audit_entry.hpp>

#include <filesystem>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace xpii::governance {

/// One object per entry with keys action, agent_id, context, entry_hash,
/// outcome, prev_hash, seq, timestamp.
nlohmann::json to_json(const xpii::schema::audit_entry_t& entry);
nlohmann::json to_json(const std::vector<xpii::schema::audit_entry_t>& entries);

/// Compact JSON of `to_json(entry)` without `entry_hash`, keys sorted,
/// UTF-8 with invalid sequences replaced. This is what entry hashes cover.
std::string canonical_text(const xpii::schema::audit_entry_t& entry);

/// Write the export array, indented, to `path`. Fails with `io_error`.
bool export_json(const std::vector<xpii::schema::audit_entry_t>& entries,
                 const std::filesystem::path& path,
                 xpii::common::error& error);

}  // namespace xpii::governance
