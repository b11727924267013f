#pragma once

#include <xpii/common/clock.hpp>
#include <xpii/common/error.hpp>
#include <xpii/governance/stack.hpp>
#include <xpii/provenance/injector.hpp>
#include <xpii/schema/provenance_record.hpp>
#include <xpii/schema/verification_result.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace xpii::pipeline {

inline constexpr auto kStapleCodespace = std::string_view{"xpii.staple"};
inline constexpr auto kVerifyCodespace = std::string_view{"xpii.verify"};

struct staple_request final {
  std::filesystem::path input_path;
  std::filesystem::path output_path;
  std::string author;
  /// Empty selects a local-time session id.
  std::string session_id;
};

struct staple_result final {
  xpii::schema::error_code code{xpii::schema::error_code::ok};
  std::string log;
  std::string codespace{kStapleCodespace};
  std::vector<std::string> failures;
  std::optional<xpii::schema::provenance_record_t> record;
  std::string rsid;
  /// SHA-256 of the written package; informational only.
  xpii::schema::hex_digest_t output_fingerprint;

  bool ok() const { return code == xpii::schema::error_code::ok; }
};

struct verify_request final {
  std::filesystem::path package_path;
  std::string requested_by;
};

struct verify_result final {
  xpii::schema::error_code code{xpii::schema::error_code::ok};
  std::string log;
  std::string codespace{kVerifyCodespace};
  std::vector<std::string> failures;
  xpii::schema::verification_result_t verification;

  bool ok() const { return code == xpii::schema::error_code::ok; }
};

struct stapler_options final {
  /// Extraction directory. Empty derives a per-instance directory under the
  /// system temp directory.
  std::filesystem::path workspace_root;
  xpii::common::clock_fn clock{xpii::common::system_clock()};
};

/// Unpack-edit-pack pipeline gated by a governance stack.
///
/// Each call checks the kill switch, evaluates policies, then runs its
/// phases, checking the kill switch again before every phase and recording
/// every phase in the audit log. Calls on one instance must not overlap.
class stapler final {
 public:
  explicit stapler(xpii::governance::governance_stack& governance,
                   stapler_options options = {});

  staple_result staple(const staple_request& request);
  verify_result verify(const verify_request& request);

  const std::filesystem::path& workspace_root() const {
    return workspace_root_;
  }

 private:
  xpii::governance::governance_stack& governance_;
  std::filesystem::path workspace_root_;
  xpii::provenance::injector injector_;
};

}  // namespace xpii::pipeline
