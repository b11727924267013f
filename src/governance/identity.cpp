#include <spdlog/spdlog.h>
#include <xpii/crypto/random.hpp>
#include <xpii/crypto/sha256.hpp>
#include <xpii/governance/identity.hpp>

#include <utility>

using namespace xpii::schema;

namespace xpii::governance {

namespace {

inline constexpr auto kSeedBytes = std::size_t{16};
inline constexpr auto kIdentityHashPrefix = std::size_t{16};

}  // namespace

agent_identity::agent_identity(std::string name,
                               const xpii::common::clock_fn& clock)
    : name_{std::move(name)},
      seed_{to_hex(make_bytes_view(xpii::crypto::random_bytes(kSeedBytes)))},
      identity_hash_{compute_hash(name_, seed_)},
      created_at_{xpii::common::format_rfc3339_millis(clock())} {
  identity_id_ = std::string{kAgentPrefix};
  identity_id_.push_back(':');
  identity_id_.append(identity_hash_.substr(0, kIdentityHashPrefix));
  spdlog::info("Agent identity {} created for '{}'", identity_id_, name_);
}

bool agent_identity::is_revoked() const {
  return revoked_.load();
}

void agent_identity::revoke() {
  if (!revoked_.exchange(true)) {
    spdlog::warn("Agent identity {} revoked", identity_id_);
  }
}

bool agent_identity::verify() const {
  if (revoked_.load()) {
    return false;
  }
  return compute_hash(name_, seed_) == identity_hash_;
}

identity_descriptor_t agent_identity::describe() const {
  auto descriptor = identity_descriptor_t{};
  descriptor.identity_id = identity_id_;
  descriptor.name = name_;
  descriptor.created_at = created_at_;
  descriptor.revoked = revoked_.load();
  return descriptor;
}

hex_digest_t agent_identity::compute_hash(const std::string_view name,
                                          const std::string_view seed) {
  auto hasher = xpii::crypto::sha256_hasher{};
  hasher.update(kAgentPrefix).update(std::string_view{":"});
  hasher.update(name).update(std::string_view{":"}).update(seed);
  return to_hex(hasher.finalize());
}

}  // namespace xpii::governance
