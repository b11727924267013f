#include <spdlog/spdlog.h>
#include <xpii/governance/audit_json.hpp>

#include <fstream>
#include <utility>
#include <variant>

using namespace xpii::schema;

namespace xpii::governance {

nlohmann::json to_json(const audit_entry_t& entry) {
  auto context = nlohmann::json::object();
  for (const auto& [key, value] : entry.context) {
    std::visit(overloaded{
                   [&](const std::string& text) { context[key] = text; },
                   [&](const int64_t number) { context[key] = number; },
                   [&](const std::vector<std::string>& items) {
                     context[key] = items;
                   },
               },
               value);
  }
  return nlohmann::json{
      {"action", entry.action},       {"agent_id", entry.agent_id},
      {"context", std::move(context)}, {"entry_hash", entry.entry_hash},
      {"outcome", entry.outcome},     {"prev_hash", entry.prev_hash},
      {"seq", entry.seq},             {"timestamp", entry.timestamp},
  };
}

nlohmann::json to_json(const std::vector<audit_entry_t>& entries) {
  auto document = nlohmann::json::array();
  for (const auto& entry : entries) {
    document.push_back(to_json(entry));
  }
  return document;
}

std::string canonical_text(const audit_entry_t& entry) {
  auto object = to_json(entry);
  object.erase("entry_hash");
  return object.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

bool export_json(const std::vector<audit_entry_t>& entries,
                 const std::filesystem::path& path,
                 xpii::common::error& error) {
  auto stream = std::ofstream{path, std::ios::trunc};
  if (stream) {
    stream << to_json(entries).dump(2, ' ', false,
                                    nlohmann::json::error_handler_t::replace)
           << '\n';
  }
  if (!stream) {
    auto message = fmt::format("cannot write audit export '{}'", path.string());
    spdlog::error("{}", message);
    error = xpii::common::make_error(error_code::io_error, std::move(message));
    return false;
  }
  spdlog::info("Exported {} audit entries to '{}'", entries.size(),
               path.string());
  return true;
}

}  // namespace xpii::governance
