#pragma once

#include <xpii/governance/audit_log.hpp>
#include <xpii/governance/identity.hpp>

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace xpii::governance {

using policy_fields_t = std::map<std::string, std::string, std::less<>>;

/// What a policy sees: the acting identity and the request fields
/// (`author`, `input_path`, `output_path`, ...).
struct policy_context final {
  std::shared_ptr<const agent_identity> identity;
  policy_fields_t fields;

  /// Field value, or empty when the field is not set.
  std::string_view field(std::string_view key) const;
};

struct policy_verdict final {
  bool allowed{};
  std::string reason;
};

/// Pure predicate over a context. Must not touch the audit log.
using policy_t = std::function<policy_verdict(const policy_context&)>;

struct evaluation_result final {
  bool allowed{};
  /// `[POLICY:<name>] <reason>` for every denying policy, in order.
  std::vector<std::string> failures;
};

/// Ordered registry of named policies; every evaluation is audited.
class policy_engine final {
 public:
  /// Registers the built-in policies.
  explicit policy_engine(audit_log& audit);

  /// Add a policy, or replace one in place when `name` is taken.
  void register_policy(std::string name, policy_t policy);

  /// Run every policy in registration order and record a single
  /// `policy_evaluate:<action>` entry with outcome ALLOWED or DENIED.
  evaluation_result evaluate(std::string_view action,
                             const policy_context& context);

  std::size_t policy_count() const;
  std::vector<std::string> policy_names() const;

 private:
  audit_log& audit_;
  mutable std::mutex mutex_;
  std::vector<std::pair<std::string, policy_t>> policies_;
};

inline constexpr auto kPolicyIdentityMustBeValid =
    std::string_view{"identity_must_be_valid"};
inline constexpr auto kPolicyNoEmptyAuthor = std::string_view{"no_empty_author"};
inline constexpr auto kPolicyNoPathTraversal =
    std::string_view{"no_path_traversal"};

policy_verdict identity_must_be_valid(const policy_context& context);
policy_verdict no_empty_author(const policy_context& context);
policy_verdict no_path_traversal(const policy_context& context);

}  // namespace xpii::governance
