#pragma once

#include <xpii/common/clock.hpp>
#include <xpii/governance/audit_log.hpp>
#include <xpii/governance/identity.hpp>
#include <xpii/governance/operator_control.hpp>
#include <xpii/governance/policy_engine.hpp>

#include <memory>
#include <string>

namespace xpii::governance {

/// Identity, audit log, policy engine and operator control for one agent
/// session, all bound to the same log.
class governance_stack final {
 public:
  explicit governance_stack(
      std::string agent_name = std::string{kDefaultAgentName},
      const xpii::common::clock_fn& clock = xpii::common::system_clock(),
      halt_signal_t signal = make_halt_signal());

  governance_stack(const governance_stack&) = delete;
  governance_stack& operator=(const governance_stack&) = delete;
  governance_stack(governance_stack&&) = delete;
  governance_stack& operator=(governance_stack&&) = delete;

  std::shared_ptr<agent_identity> identity() const { return identity_; }
  audit_log& audit() { return audit_; }
  const audit_log& audit() const { return audit_; }
  policy_engine& policies() { return policies_; }
  operator_control& control() { return control_; }

 private:
  std::shared_ptr<agent_identity> identity_;
  audit_log audit_;
  policy_engine policies_;
  operator_control control_;
};

}  // namespace xpii::governance
