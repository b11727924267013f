#include <spdlog/spdlog.h>
#include <xpii/storage/audit_store.hpp>

#include <algorithm>
#include <iterator>

using namespace xpii::schema;

namespace xpii::storage {

namespace {

using encoder_t = xpii::schema::encoding::scale_encoder_t;

}  // namespace

bytes_t make_audit_entry_key(const uint64_t seq) {
  auto encoder = encoder_t{};
  auto key = make_bytes(kAuditEntryPrefix);
  encoder.encode(seq, key);
  return key;
}

void persist_audit_entry(audit_storage_t& store, const audit_entry_t& entry) {
  auto encoder = encoder_t{};
  auto key = make_audit_entry_key(entry.seq);
  store.put(encoder, make_bytes_view(key), entry);
  spdlog::debug("Persisted audit entry #{}", entry.seq);
}

std::optional<audit_entry_t> load_audit_entry(audit_storage_t& store,
                                              const uint64_t seq) {
  auto encoder = encoder_t{};
  auto key = make_audit_entry_key(seq);
  return store.get<audit_entry_t>(encoder, make_bytes_view(key));
}

std::vector<audit_entry_t> load_audit_entries(const audit_storage_t& store) {
  auto encoder = encoder_t{};
  auto entries = std::vector<audit_entry_t>{};
  for (const auto& [key, value] :
       store.list_by_prefix(make_bytes_view(kAuditEntryPrefix))) {
    auto entry = encoder.try_decode<audit_entry_t>(make_bytes_view(value));
    if (!entry) {
      xpii::common::critical("failed to decode persisted audit entry ({} bytes)",
                             value.size());
    }
    entries.push_back(std::move(entry.value()));
  }
  std::ranges::sort(entries, {}, &audit_entry_t::seq);
  spdlog::info("Loaded {} audit entries", entries.size());
  return entries;
}

xpii::governance::audit_sink_t make_audit_sink(audit_storage_t& store) {
  return [&store](const audit_entry_t& entry) {
    persist_audit_entry(store, entry);
  };
}

}  // namespace xpii::storage
