#pragma once

#include <xpii/common/clock.hpp>
#include <xpii/schema/identity_descriptor.hpp>

#include <atomic>
#include <string>
#include <string_view>

namespace xpii::governance {

inline constexpr auto kAgentPrefix = std::string_view{"AGENT"};
inline constexpr auto kDefaultAgentName = std::string_view{"XPII-STAPLER"};

/// Per-session actor identity.
///
/// `identity_id` is `AGENT:` followed by the first 16 hex characters of
/// SHA-256("AGENT:<name>:<seed>") where the seed is 128 random bits.
/// Revocation is one-way.
class agent_identity final {
 public:
  explicit agent_identity(
      std::string name = std::string{kDefaultAgentName},
      const xpii::common::clock_fn& clock = xpii::common::system_clock());

  agent_identity(const agent_identity&) = delete;
  agent_identity& operator=(const agent_identity&) = delete;

  const std::string& identity_id() const { return identity_id_; }
  const std::string& name() const { return name_; }
  const xpii::schema::timestamp_t& created_at() const { return created_at_; }

  bool is_revoked() const;
  void revoke();

  /// False once revoked or when the stored hash no longer matches the name
  /// and seed.
  bool verify() const;

  xpii::schema::identity_descriptor_t describe() const;

 private:
  static xpii::schema::hex_digest_t compute_hash(std::string_view name,
                                                 std::string_view seed);

  std::string name_;
  std::string seed_;
  xpii::schema::hex_digest_t identity_hash_;
  std::string identity_id_;
  xpii::schema::timestamp_t created_at_;
  std::atomic<bool> revoked_{false};
};

}  // namespace xpii::governance
