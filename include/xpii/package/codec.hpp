#pragma once

#include <xpii/common/error.hpp>
#include <xpii/package/workspace.hpp>
#include <xpii/schema/primitives.hpp>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// OOXML container codec.
// Unpack a .docx zip into an owned workspace and pack a workspace back into a
// reproducible zip.
namespace xpii::package {

/// Member every OOXML package carries.
inline constexpr auto kContentTypesPart = std::string_view{"[Content_Types].xml"};

/// Modification time stamped on every packed member (1980-01-01T12:00:00Z).
inline constexpr auto kFixedMemberTime = int64_t{315576000};

struct unpacked_package final {
  workspace files;
  /// SHA-256 of the source archive bytes exactly as read.
  xpii::schema::hex_digest_t fingerprint;
  std::size_t entry_count{};
};

/// Extract `source` into a fresh directory at `workspace_root`.
///
/// Anything already at `workspace_root` is removed first. On failure the
/// partially written directory is removed and `error` carries
/// `archive_error` (unreadable input, not a zip, missing
/// `[Content_Types].xml`, unsafe member name, damaged member) or `io_error`
/// (workspace not writable).
std::optional<unpacked_package> unpack(
    const std::filesystem::path& source,
    const std::filesystem::path& workspace_root,
    xpii::common::error& error);

/// Write every regular file under `files` into a DEFLATE zip at `output`.
///
/// Members are ordered by relative path and carry kFixedMemberTime, so equal
/// workspaces produce equal archives. The workspace is consumed. Returns the
/// SHA-256 of the written archive.
std::optional<xpii::schema::hex_digest_t> pack(
    workspace files,
    const std::filesystem::path& output,
    xpii::common::error& error);

/// Read one member without extracting the archive. `out` is left empty when
/// the member does not exist.
bool read_member(const std::filesystem::path& package,
                 std::string_view member,
                 std::optional<xpii::schema::bytes_t>& out,
                 xpii::common::error& error);

/// Member names in central directory order.
std::optional<std::vector<std::string>> list_members(
    const std::filesystem::path& package,
    xpii::common::error& error);

/// False for absolute names and names with a `..` segment.
bool is_safe_member_name(std::string_view name);

}  // namespace xpii::package
