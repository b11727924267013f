#pragma once

#include <xpii/schema/primitives.hpp>
#include <cstdint>
#include <string>
#include <string_view>

// Schema type: audit entry.
// Governance workflow: one immutable row of the hash-chained action ledger.
namespace xpii::schema {

inline constexpr auto kGenesisHash = std::string_view{"GENESIS"};

template <uint16_t Version>
struct audit_entry;

template <>
struct audit_entry<1> final {
  uint16_t version{1};
  uint64_t seq{};
  timestamp_t timestamp;
  std::string agent_id;
  std::string action;
  context_t context;
  std::string outcome;
  std::string prev_hash;
  hex_digest_t entry_hash;
};

using audit_entry_t = audit_entry<1>;

}  // namespace xpii::schema
