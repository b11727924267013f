#include <spdlog/spdlog.h>
#include <xpii/common/strings.hpp>
#include <xpii/governance/policy_engine.hpp>

#include <algorithm>
#include <array>
#include <iterator>

using namespace xpii::schema;

namespace xpii::governance {

namespace {

inline constexpr auto kOutcomeAllowed = std::string_view{"ALLOWED"};
inline constexpr auto kOutcomeDenied = std::string_view{"DENIED"};
inline constexpr auto kTraversalKeys =
    std::array<std::string_view, 2>{"input_path", "output_path"};

std::string format_failure(const std::string_view name,
                           const std::string_view reason) {
  auto failure = std::string{"[POLICY:"};
  failure.append(name);
  failure.append("] ");
  failure.append(reason);
  return failure;
}

}  // namespace

std::string_view policy_context::field(const std::string_view key) const {
  auto found = fields.find(key);
  return found == std::end(fields) ? std::string_view{}
                                   : std::string_view{found->second};
}

policy_verdict identity_must_be_valid(const policy_context& context) {
  if (!context.identity) {
    return {false, "No agent identity present in context."};
  }
  if (!context.identity->verify()) {
    return {false, fmt::format("Agent identity '{}' is invalid or revoked.",
                               context.identity->identity_id())};
  }
  return {true, "Identity verified."};
}

policy_verdict no_empty_author(const policy_context& context) {
  if (xpii::common::trim(context.field("author")).empty()) {
    return {false, "Author field must not be empty."};
  }
  return {true, "Author field present."};
}

policy_verdict no_path_traversal(const policy_context& context) {
  for (const auto key : kTraversalKeys) {
    auto path = context.field(key);
    if (path.find("..") != std::string_view::npos) {
      return {false,
              fmt::format("Path traversal detected in '{}': '{}'.", key, path)};
    }
  }
  return {true, "No path traversal detected."};
}

policy_engine::policy_engine(audit_log& audit) : audit_{audit} {
  register_policy(std::string{kPolicyIdentityMustBeValid},
                  identity_must_be_valid);
  register_policy(std::string{kPolicyNoEmptyAuthor}, no_empty_author);
  register_policy(std::string{kPolicyNoPathTraversal}, no_path_traversal);
}

void policy_engine::register_policy(std::string name, policy_t policy) {
  auto lock = std::scoped_lock{mutex_};
  auto existing = std::ranges::find_if(
      policies_, [&](const auto& entry) { return entry.first == name; });
  if (existing != std::end(policies_)) {
    spdlog::debug("Replacing policy '{}'", name);
    existing->second = std::move(policy);
    return;
  }
  spdlog::debug("Registering policy '{}'", name);
  policies_.emplace_back(std::move(name), std::move(policy));
}

evaluation_result policy_engine::evaluate(const std::string_view action,
                                          const policy_context& context) {
  auto policies = std::vector<std::pair<std::string, policy_t>>{};
  {
    auto lock = std::scoped_lock{mutex_};
    policies = policies_;
  }

  auto result = evaluation_result{};
  for (const auto& [name, policy] : policies) {
    auto verdict = policy(context);
    if (!verdict.allowed) {
      result.failures.push_back(format_failure(name, verdict.reason));
    }
  }
  result.allowed = result.failures.empty();

  auto audit_action = std::string{"policy_evaluate:"};
  audit_action.append(action);
  audit_.record(audit_action,
                context_t{
                    {"policy_count", static_cast<int64_t>(policies.size())},
                    {"failures", result.failures},
                },
                result.allowed ? kOutcomeAllowed : kOutcomeDenied);

  if (!result.allowed) {
    for (const auto& failure : result.failures) {
      spdlog::warn("{} denied: {}", action, failure);
    }
  }
  return result;
}

std::size_t policy_engine::policy_count() const {
  auto lock = std::scoped_lock{mutex_};
  return policies_.size();
}

std::vector<std::string> policy_engine::policy_names() const {
  auto lock = std::scoped_lock{mutex_};
  auto names = std::vector<std::string>{};
  names.reserve(policies_.size());
  for (const auto& [name, policy] : policies_) {
    names.push_back(name);
  }
  return names;
}

}  // namespace xpii::governance
