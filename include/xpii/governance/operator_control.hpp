#pragma once

#include <xpii/common/error.hpp>
#include <xpii/governance/audit_log.hpp>

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

namespace xpii::governance {

/// Shared kill-switch flag. Any holder may set or clear it from any thread.
using halt_signal_t = std::shared_ptr<std::atomic<bool>>;

halt_signal_t make_halt_signal();

inline constexpr auto kDefaultHaltReason =
    std::string_view{"Operator emergency stop"};
inline constexpr auto kDefaultResumeReason =
    std::string_view{"Operator resumed operations"};
inline constexpr auto kBlockedMessage = std::string_view{
    "Operation blocked: operator kill-switch is active. Human authorization "
    "required to resume."};

/// External halt/resume gate consulted before every governed action.
class operator_control final {
 public:
  explicit operator_control(audit_log& audit,
                            halt_signal_t signal = make_halt_signal());

  /// Set the flag and record `operator_halt`.
  void halt(std::string_view reason = kDefaultHaltReason);

  /// Clear the flag and record `operator_resume`.
  void resume(std::string_view reason = kDefaultResumeReason);

  /// `operation_blocked` while halted, after recording `operator_blocked`.
  xpii::common::error assert_active();

  bool is_halted() const;

  /// The flag itself, for handing to other threads or components.
  halt_signal_t signal() const { return signal_; }

 private:
  std::string reason() const;

  audit_log& audit_;
  halt_signal_t signal_;
  mutable std::mutex reason_mutex_;
  std::string reason_;
};

}  // namespace xpii::governance
