#include <spdlog/spdlog.h>
#include <xpii/governance/operator_control.hpp>

#include <utility>

using namespace xpii::schema;

namespace xpii::governance {

namespace {

inline constexpr auto kExternalHaltReason =
    std::string_view{"External halt signal"};

}  // namespace

halt_signal_t make_halt_signal() {
  return std::make_shared<std::atomic<bool>>(false);
}

operator_control::operator_control(audit_log& audit, halt_signal_t signal)
    : audit_{audit}, signal_{std::move(signal)} {
  if (!signal_) {
    signal_ = make_halt_signal();
  }
}

void operator_control::halt(const std::string_view reason) {
  {
    auto lock = std::scoped_lock{reason_mutex_};
    reason_ = std::string{reason};
  }
  signal_->store(true);
  spdlog::warn("Operator halt: {}", reason);
  audit_.record("operator_halt", context_t{{"reason", std::string{reason}}},
                "HALTED");
}

void operator_control::resume(const std::string_view reason) {
  signal_->store(false);
  {
    auto lock = std::scoped_lock{reason_mutex_};
    reason_.clear();
  }
  spdlog::info("Operator resume: {}", reason);
  audit_.record("operator_resume", context_t{{"reason", std::string{reason}}},
                "RESUMED");
}

xpii::common::error operator_control::assert_active() {
  if (!signal_->load()) {
    return {};
  }
  auto halt_reason = reason();
  spdlog::warn("{} ({})", kBlockedMessage, halt_reason);
  audit_.record("operator_blocked", context_t{{"reason", halt_reason}},
                "BLOCKED");
  return xpii::common::make_error(error_code::operation_blocked,
                                  std::string{kBlockedMessage});
}

bool operator_control::is_halted() const {
  return signal_->load();
}

std::string operator_control::reason() const {
  auto lock = std::scoped_lock{reason_mutex_};
  return reason_.empty() ? std::string{kExternalHaltReason} : reason_;
}

}  // namespace xpii::governance
