#include <spdlog/spdlog.h>
#include <xpii/package/workspace.hpp>

#include <system_error>
#include <utility>

namespace xpii::package {

workspace::workspace(std::filesystem::path root) : root_{std::move(root)} {}

workspace::~workspace() {
  remove();
}

workspace::workspace(workspace&& other)
    : root_{std::move(other.root_)}, owned_{other.owned_} {
  other.owned_ = false;
}

workspace& workspace::operator=(workspace&& other) {
  if (this != &other) {
    remove();
    root_ = std::move(other.root_);
    owned_ = other.owned_;
    other.owned_ = false;
  }
  return *this;
}

std::filesystem::path workspace::part_path(const std::string_view part) const {
  return root_ / std::filesystem::path{std::string{part}}.relative_path();
}

bool workspace::contains(const std::string_view part) const {
  auto ec = std::error_code{};
  return std::filesystem::is_regular_file(part_path(part), ec);
}

std::filesystem::path workspace::release() {
  owned_ = false;
  return root_;
}

void workspace::remove() {
  if (!owned_ || root_.empty()) {
    return;
  }
  owned_ = false;
  auto ec = std::error_code{};
  std::filesystem::remove_all(root_, ec);
  if (ec) {
    spdlog::warn("Failed to remove workspace '{}': {}", root_.string(),
                 ec.message());
  } else {
    spdlog::debug("Removed workspace '{}'", root_.string());
  }
}

}  // namespace xpii::package
