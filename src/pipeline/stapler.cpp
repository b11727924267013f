#include <spdlog/spdlog.h>
#include <xpii/package/codec.hpp>
#include <xpii/pipeline/stapler.hpp>
#include <xpii/provenance/rsid.hpp>
#include <xpii/provenance/verifier.hpp>

#include <atomic>
#include <utility>

using namespace xpii::schema;

namespace xpii::pipeline {

namespace {

inline constexpr auto kWorkspacePrefix = std::string_view{"temp_unpack"};

std::filesystem::path default_workspace_root(
    const xpii::governance::agent_identity& identity) {
  static auto next_instance = std::atomic<uint64_t>{0};
  auto name = std::string{kWorkspacePrefix};
  name.push_back('_');
  auto id = std::string_view{identity.identity_id()};
  name.append(id.substr(id.find(':') + 1));
  name.push_back('_');
  name.append(std::to_string(next_instance.fetch_add(1)));
  return std::filesystem::temp_directory_path() / name;
}

template <typename Result>
Result fail(Result result, const xpii::common::error& error) {
  result.code = error.code;
  result.log = error.message;
  result.failures = error.failures;
  return result;
}

std::string outcome_of(const xpii::common::error& error) {
  return error.ok() ? std::string{xpii::governance::kOutcomeOk}
                    : error.message;
}

}  // namespace

stapler::stapler(xpii::governance::governance_stack& governance,
                 stapler_options options)
    : governance_{governance},
      workspace_root_{options.workspace_root.empty()
                          ? default_workspace_root(*governance.identity())
                          : std::move(options.workspace_root)},
      injector_{std::move(options.clock)} {}

staple_result stapler::staple(const staple_request& request) {
  auto result = staple_result{};
  auto& control = governance_.control();
  auto& audit = governance_.audit();

  if (auto blocked = control.assert_active(); !blocked.ok()) {
    return fail(std::move(result), blocked);
  }

  auto context = xpii::governance::policy_context{};
  context.identity = governance_.identity();
  context.fields = {{"author", request.author},
                    {"input_path", request.input_path.string()},
                    {"output_path", request.output_path.string()}};
  auto evaluation = governance_.policies().evaluate("staple", context);
  if (!evaluation.allowed) {
    result.code = error_code::policy_denied;
    result.log = "staple denied by policy";
    result.failures = std::move(evaluation.failures);
    return result;
  }

  if (auto blocked = control.assert_active(); !blocked.ok()) {
    return fail(std::move(result), blocked);
  }
  auto error = xpii::common::error{};
  auto unpacked =
      xpii::package::unpack(request.input_path, workspace_root_, error);
  audit.record("unpack",
               context_t{{"input_path", request.input_path.string()},
                         {"sha256", unpacked ? unpacked->fingerprint : ""}},
               outcome_of(error));
  if (!unpacked) {
    return fail(std::move(result), error);
  }

  if (auto blocked = control.assert_active(); !blocked.ok()) {
    return fail(std::move(result), blocked);
  }
  auto record = injector_.inject(unpacked->files, request.author,
                                 request.session_id, unpacked->fingerprint,
                                 error);
  result.rsid =
      record ? xpii::provenance::derive_rsid(record->session_id) : "";
  audit.record("inject_metadata",
               context_t{{"session_id", record ? record->session_id : ""},
                         {"author", request.author},
                         {"rsid", result.rsid},
                         {"sha256", unpacked->fingerprint}},
               outcome_of(error));
  if (!record) {
    return fail(std::move(result), error);
  }
  result.record = std::move(record);

  if (auto blocked = control.assert_active(); !blocked.ok()) {
    return fail(std::move(result), blocked);
  }
  auto output_fingerprint = xpii::package::pack(
      std::move(unpacked->files), request.output_path, error);
  audit.record("pack",
               context_t{{"output_path", request.output_path.string()},
                         {"output_sha256", output_fingerprint.value_or("")}},
               outcome_of(error));
  if (!output_fingerprint) {
    return fail(std::move(result), error);
  }

  result.output_fingerprint = std::move(*output_fingerprint);
  result.log = "stapled";
  spdlog::info("Stapled '{}' -> '{}' (session {}, rsid {})",
               request.input_path.string(), request.output_path.string(),
               result.record->session_id, result.rsid);
  return result;
}

verify_result stapler::verify(const verify_request& request) {
  auto result = verify_result{};

  if (auto blocked = governance_.control().assert_active(); !blocked.ok()) {
    return fail(std::move(result), blocked);
  }

  auto context = xpii::governance::policy_context{};
  context.identity = governance_.identity();
  context.fields = {{"author", request.requested_by},
                    {"input_path", request.package_path.string()}};
  auto evaluation = governance_.policies().evaluate("verify", context);
  if (!evaluation.allowed) {
    result.code = error_code::policy_denied;
    result.log = "verify denied by policy";
    result.failures = std::move(evaluation.failures);
    return result;
  }

  result.verification = xpii::provenance::verify(request.package_path);
  auto status = std::string{to_string(result.verification.status)};
  governance_.audit().record(
      "verify", context_t{{"package_path", request.package_path.string()},
                          {"status", status}});

  switch (result.verification.status) {
    case verification_status_t::verified:
      result.log = status;
      break;
    case verification_status_t::no_metadata:
      result.code = error_code::no_metadata;
      result.log = status;
      break;
    case verification_status_t::no_provenance:
      result.code = error_code::no_provenance;
      result.log = status;
      break;
    case verification_status_t::malformed_archive:
      result.code = error_code::malformed_archive;
      result.log = result.verification.error;
      break;
  }
  return result;
}

}  // namespace xpii::pipeline
