#pragma once

#include <xpii/governance/audit_log.hpp>
#include <xpii/schema/audit_entry.hpp>
#include <xpii/storage/rocksdb/storage.hpp>

#include <optional>
#include <string_view>
#include <vector>

// RocksDB persistence for the audit ledger.
// Entries are SCALE-encoded under "AUDIT|ENTRY|" + SCALE(seq).
namespace xpii::storage {

inline constexpr auto kAuditEntryPrefix = std::string_view{"AUDIT|ENTRY|"};

using audit_storage_t = storage<rocksdb_storage_tag>;

xpii::schema::bytes_t make_audit_entry_key(uint64_t seq);

void persist_audit_entry(audit_storage_t& store,
                         const xpii::schema::audit_entry_t& entry);

std::optional<xpii::schema::audit_entry_t> load_audit_entry(
    audit_storage_t& store,
    uint64_t seq);

/// Every stored entry ordered by seq. Chain integrity is the caller's check.
std::vector<xpii::schema::audit_entry_t> load_audit_entries(
    const audit_storage_t& store);

/// Sink for audit_log::set_sink that persists each appended entry. `store`
/// must outlive the log it is attached to.
xpii::governance::audit_sink_t make_audit_sink(audit_storage_t& store);

}  // namespace xpii::storage
