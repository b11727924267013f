#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <xpii/governance/audit_json.hpp>
#include <xpii/governance/stack.hpp>
#include <xpii/pipeline/stapler.hpp>
#include <xpii/storage/audit_store.hpp>

#include <csignal>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>

namespace {

namespace po = boost::program_options;

inline constexpr auto kDefaultAuthor = "XPII-CHAIN";
inline constexpr auto kOutputPrefix = "stapled_";
// sysexits codes, clear of the error_code range.
inline constexpr auto kUsageExitCode = 64;
inline constexpr auto kBrokenAuditChainExitCode = 65;

/// Ctrl-C trips the kill switch; the pipeline stops before its next phase.
xpii::governance::halt_signal_t& halt_signal() {
  static auto signal = xpii::governance::make_halt_signal();
  return signal;
}

void signal_handler(int) {
  halt_signal()->store(true);
}

void configure_logging(const bool verbose) {
  spdlog::init_thread_pool(8192, 1);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");

  auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  auto file_sink =
      std::make_shared<spdlog::sinks::basic_file_sink_mt>("xpii.log", false);

  auto logger = std::make_shared<spdlog::async_logger>(
      "xpii", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);

  spdlog::set_default_logger(logger);
  spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::info);
}

std::filesystem::path default_output(const std::filesystem::path& input) {
  return input.parent_path() /
         (std::string{kOutputPrefix} + input.filename().string());
}

void print_help(const po::options_description& options) {
  std::cout << "Usage:\n"
            << "  xpii_stapler staple --input FILE [--output FILE] "
               "[--author NAME] [--session ID]\n"
            << "  xpii_stapler verify --input FILE [--requested-by NAME]\n\n";
  std::cout << options << '\n';
}

int exit_code(const xpii::schema::error_code code) {
  return static_cast<int>(code);
}

int run_staple(xpii::pipeline::stapler& stapler, const po::variables_map& vm) {
  auto request = xpii::pipeline::staple_request{};
  request.input_path = vm["input"].as<std::string>();
  request.output_path = vm.contains("output")
                            ? std::filesystem::path{vm["output"].as<std::string>()}
                            : default_output(request.input_path);
  request.author = vm["author"].as<std::string>();
  request.session_id = vm["session"].as<std::string>();

  auto result = stapler.staple(request);
  if (!result.ok()) {
    spdlog::error("staple failed [{}:{}]: {}", result.codespace,
                  xpii::schema::to_string(result.code), result.log);
    for (const auto& failure : result.failures) {
      spdlog::error("  {}", failure);
    }
    return exit_code(result.code);
  }
  std::cout << "output: " << request.output_path.string() << '\n'
            << "author: " << result.record->author << '\n'
            << "session_id: " << result.record->session_id << '\n'
            << "rsid: " << result.rsid << '\n'
            << "sha256: " << result.record->fingerprint << '\n'
            << "output_sha256: " << result.output_fingerprint << '\n';
  return 0;
}

int run_verify(xpii::pipeline::stapler& stapler, const po::variables_map& vm) {
  auto request = xpii::pipeline::verify_request{};
  request.package_path = vm["input"].as<std::string>();
  request.requested_by = vm["requested-by"].as<std::string>();

  auto result = stapler.verify(request);
  if (result.code == xpii::schema::error_code::operation_blocked ||
      result.code == xpii::schema::error_code::policy_denied) {
    spdlog::error("verify refused [{}:{}]: {}", result.codespace,
                  xpii::schema::to_string(result.code), result.log);
    for (const auto& failure : result.failures) {
      spdlog::error("  {}", failure);
    }
    return exit_code(result.code);
  }

  const auto& verification = result.verification;
  std::cout << "status: " << xpii::schema::to_string(verification.status)
            << '\n';
  if (verification.record) {
    std::cout << "author: " << verification.record->author << '\n'
              << "session_id: " << verification.record->session_id << '\n'
              << "sha256: " << verification.record->fingerprint << '\n'
              << "modified: " << verification.record->modified_at << '\n';
  }
  if (!verification.error.empty()) {
    std::cout << "error: " << verification.error << '\n';
  }
  return exit_code(result.code);
}

}  // namespace

int main(int argc, const char** argv) {
  auto command = std::string{};
  auto options = po::options_description{"xpii_stapler options"};
  options.add_options()("help,h", "show help")(
      "command", po::value<std::string>(&command), "staple|verify")(
      "input,i", po::value<std::string>(), "source .docx package")(
      "output,o", po::value<std::string>(),
      "stapled package (default stapled_<input filename>)")(
      "author,a", po::value<std::string>()->default_value(kDefaultAuthor),
      "author embedded in dc:creator")(
      "session,s", po::value<std::string>()->default_value(""),
      "session id (default local time YYYYMMDDHHMMSS)")(
      "requested-by", po::value<std::string>()->default_value(kDefaultAuthor),
      "actor requesting verification")(
      "agent-name",
      po::value<std::string>()->default_value(
          std::string{xpii::governance::kDefaultAgentName}),
      "agent identity name")("workspace", po::value<std::string>(),
                             "extraction directory")(
      "audit-db", po::value<std::string>(),
      "RocksDB directory persisting the audit log")(
      "audit-json", po::value<std::string>(),
      "write the session audit log as JSON on exit")(
      "verbose,v", "enable debug logging");

  auto positional = po::positional_options_description{};
  positional.add("command", 1);
  auto vm = po::variables_map{};
  try {
    po::store(po::command_line_parser(argc, argv)
                  .options(options)
                  .positional(positional)
                  .run(),
              vm);
    po::notify(vm);
  } catch (const po::error& e) {
    std::cerr << e.what() << '\n';
    print_help(options);
    return kUsageExitCode;
  }

  if (vm.contains("help") || command.empty()) {
    print_help(options);
    return 0;
  }
  if (command != "staple" && command != "verify") {
    print_help(options);
    return kUsageExitCode;
  }
  if (!vm.contains("input")) {
    std::cerr << command << " requires --input\n";
    return kUsageExitCode;
  }

  configure_logging(vm.contains("verbose"));
  std::signal(SIGINT, signal_handler);

  auto store = std::optional<xpii::storage::audit_storage_t>{};
  auto governance = xpii::governance::governance_stack{
      vm["agent-name"].as<std::string>(), xpii::common::system_clock(),
      halt_signal()};

  if (vm.contains("audit-db")) {
    store.emplace(xpii::storage::make_storage<xpii::storage::rocksdb_storage_tag>(
        vm["audit-db"].as<std::string>()));
    if (!governance.audit().restore(xpii::storage::load_audit_entries(*store))) {
      spdlog::critical("Persisted audit chain failed verification");
      spdlog::shutdown();
      return kBrokenAuditChainExitCode;
    }
    governance.audit().set_sink(xpii::storage::make_audit_sink(*store));
  }

  auto options_for_stapler = xpii::pipeline::stapler_options{};
  if (vm.contains("workspace")) {
    options_for_stapler.workspace_root = vm["workspace"].as<std::string>();
  }
  auto stapler =
      xpii::pipeline::stapler{governance, std::move(options_for_stapler)};

  auto status = command == "staple" ? run_staple(stapler, vm)
                                    : run_verify(stapler, vm);

  if (vm.contains("audit-json")) {
    auto error = xpii::common::error{};
    if (!xpii::governance::export_json(governance.audit().export_entries(),
                                       vm["audit-json"].as<std::string>(),
                                       error) &&
        status == 0) {
      status = exit_code(error.code);
    }
  }

  spdlog::shutdown();
  return status;
}
