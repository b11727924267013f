#include <xpii/governance/stack.hpp>

#include <utility>

namespace xpii::governance {

governance_stack::governance_stack(std::string agent_name,
                                   const xpii::common::clock_fn& clock,
                                   halt_signal_t signal)
    : identity_{std::make_shared<agent_identity>(std::move(agent_name), clock)},
      audit_{identity_->identity_id(), clock},
      policies_{audit_},
      control_{audit_, std::move(signal)} {}

}  // namespace xpii::governance
