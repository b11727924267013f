#include <spdlog/spdlog.h>
#include <xpii/crypto/sha256.hpp>
#include <xpii/governance/audit_json.hpp>
#include <xpii/governance/audit_log.hpp>

#include <utility>

using namespace xpii::schema;

namespace xpii::governance {

hex_digest_t compute_entry_hash(const audit_entry_t& entry) {
  return xpii::crypto::sha256_hex(make_bytes_view(canonical_text(entry)));
}

bool verify_chain(const std::vector<audit_entry_t>& entries) {
  auto prev_hash = std::string{kGenesisHash};
  for (const auto& entry : entries) {
    if (entry.prev_hash != prev_hash) {
      spdlog::warn("Audit chain link broken at seq {}", entry.seq);
      return false;
    }
    if (compute_entry_hash(entry) != entry.entry_hash) {
      spdlog::warn("Audit entry hash mismatch at seq {}", entry.seq);
      return false;
    }
    prev_hash = entry.entry_hash;
  }
  return true;
}

audit_log::audit_log(std::string agent_id, xpii::common::clock_fn clock)
    : agent_id_{std::move(agent_id)},
      clock_{std::move(clock)},
      chain_hash_{kGenesisHash} {}

audit_entry_t audit_log::record(const std::string_view action,
                                context_t context,
                                const std::string_view outcome) {
  auto lock = std::scoped_lock{mutex_};
  auto entry = audit_entry_t{};
  entry.seq = entries_.empty() ? 0 : entries_.back().seq + 1;
  entry.timestamp = xpii::common::format_rfc3339_millis(clock_());
  entry.agent_id = agent_id_;
  entry.action = std::string{action};
  entry.context = std::move(context);
  entry.outcome = std::string{outcome};
  entry.prev_hash = chain_hash_;
  entry.entry_hash = compute_entry_hash(entry);

  chain_hash_ = entry.entry_hash;
  entries_.push_back(entry);
  spdlog::debug("audit #{} {} -> {}", entry.seq, entry.action, entry.outcome);
  if (sink_) {
    sink_(entry);
  }
  return entry;
}

bool audit_log::verify_chain() const {
  auto lock = std::scoped_lock{mutex_};
  return xpii::governance::verify_chain(entries_);
}

std::vector<audit_entry_t> audit_log::export_entries() const {
  auto lock = std::scoped_lock{mutex_};
  return entries_;
}

bool audit_log::restore(std::vector<audit_entry_t> history) {
  auto lock = std::scoped_lock{mutex_};
  if (!entries_.empty()) {
    spdlog::error("Cannot restore audit history into a non-empty log");
    return false;
  }
  if (!xpii::governance::verify_chain(history)) {
    spdlog::error("Refusing to restore audit history: chain does not verify");
    return false;
  }
  for (auto i = std::size_t{0}; i < history.size(); ++i) {
    if (history[i].seq != i) {
      spdlog::error("Refusing to restore audit history: gap at seq {}", i);
      return false;
    }
  }
  entries_ = std::move(history);
  chain_hash_ = entries_.empty() ? std::string{kGenesisHash}
                                 : entries_.back().entry_hash;
  spdlog::info("Restored {} audit entries", entries_.size());
  return true;
}

void audit_log::set_sink(audit_sink_t sink) {
  auto lock = std::scoped_lock{mutex_};
  sink_ = std::move(sink);
}

std::size_t audit_log::size() const {
  auto lock = std::scoped_lock{mutex_};
  return entries_.size();
}

std::string audit_log::last_hash() const {
  auto lock = std::scoped_lock{mutex_};
  return chain_hash_;
}

}  // namespace xpii::governance
