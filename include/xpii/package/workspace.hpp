#pragma once

#include <filesystem>
#include <string_view>

namespace xpii::package {

/// Exclusively owned extraction directory for one pipeline run.
///
/// The directory tree is removed when the handle is destroyed unless it has
/// been released. Handles are move-only; a moved-from handle owns nothing.
class workspace final {
 public:
  explicit workspace(std::filesystem::path root);
  ~workspace();

  workspace(const workspace&) = delete;
  workspace& operator=(const workspace&) = delete;
  workspace(workspace&& other);
  workspace& operator=(workspace&& other);

  const std::filesystem::path& root() const { return root_; }

  /// Absolute path of a `/`-separated package part inside the workspace.
  std::filesystem::path part_path(std::string_view part) const;

  /// True when the part exists as a regular file.
  bool contains(std::string_view part) const;

  /// Stop owning the directory; it will no longer be removed.
  std::filesystem::path release();

 private:
  void remove();

  std::filesystem::path root_;
  bool owned_{true};
};

}  // namespace xpii::package
