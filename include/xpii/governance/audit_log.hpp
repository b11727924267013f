#pragma once

#include <xpii/common/clock.hpp>
#include <xpii/schema/audit_entry.hpp>

#include <cstddef>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace xpii::governance {

inline constexpr auto kOutcomeOk = std::string_view{"OK"};

/// Receives every entry right after it is appended.
using audit_sink_t = std::function<void(const xpii::schema::audit_entry_t&)>;

/// Append-only, hash-chained action ledger.
///
/// Every entry's `entry_hash` covers its own fields and the previous entry's
/// hash, so any edit to a stored entry breaks verify_chain(). All members
/// are safe to call concurrently.
class audit_log final {
 public:
  explicit audit_log(
      std::string agent_id,
      xpii::common::clock_fn clock = xpii::common::system_clock());

  audit_log(const audit_log&) = delete;
  audit_log& operator=(const audit_log&) = delete;

  /// Append an entry and return a copy of it.
  xpii::schema::audit_entry_t record(std::string_view action,
                                     xpii::schema::context_t context = {},
                                     std::string_view outcome = kOutcomeOk);

  bool verify_chain() const;

  /// Snapshot copy of all entries in seq order.
  std::vector<xpii::schema::audit_entry_t> export_entries() const;

  /// Continue the chain from previously persisted entries. Refused when the
  /// log already has entries or `history` does not verify.
  bool restore(std::vector<xpii::schema::audit_entry_t> history);

  /// Invoked under the log mutex; the sink must not call back into the log.
  void set_sink(audit_sink_t sink);

  std::size_t size() const;
  std::string last_hash() const;
  const std::string& agent_id() const { return agent_id_; }

 private:
  mutable std::mutex mutex_;
  std::string agent_id_;
  xpii::common::clock_fn clock_;
  std::vector<xpii::schema::audit_entry_t> entries_;
  std::string chain_hash_;
  audit_sink_t sink_;
};

/// SHA-256 over canonical_text(), so the hash can be recomputed from the
/// JSON export alone.
xpii::schema::hex_digest_t compute_entry_hash(
    const xpii::schema::audit_entry_t& entry);

/// Replay `entries` from GENESIS, checking each hash and each link.
bool verify_chain(const std::vector<xpii::schema::audit_entry_t>& entries);

}  // namespace xpii::governance
