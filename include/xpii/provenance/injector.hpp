#pragma once

#include <xpii/common/clock.hpp>
#include <xpii/common/error.hpp>
#include <xpii/package/workspace.hpp>
#include <xpii/schema/provenance_record.hpp>

#include <optional>
#include <string>
#include <string_view>

#include <tinyxml2.h>

namespace xpii::provenance {

inline constexpr auto kCorePropertiesPart = std::string_view{"docProps/core.xml"};
inline constexpr auto kSettingsPart = std::string_view{"word/settings.xml"};
inline constexpr auto kDocumentPart = std::string_view{"word/document.xml"};

/// Rewrites the metadata parts of an unpacked package.
///
/// `docProps/core.xml` receives the author, the provenance description and a
/// W3CDTF modification time; `word/settings.xml` receives the session RSID;
/// `word/document.xml` is re-serialized. Absent parts are skipped.
class injector final {
 public:
  explicit injector(xpii::common::clock_fn clock = xpii::common::system_clock());

  /// `fingerprint` is the source package hash captured at unpack time. An
  /// empty `session_id` is replaced by the local time as `YYYYMMDDHHMMSS`.
  std::optional<xpii::schema::provenance_record_t> inject(
      const xpii::package::workspace& files,
      std::string_view author,
      std::string_view session_id,
      std::string_view fingerprint,
      xpii::common::error& error) const;

 private:
  xpii::common::clock_fn clock_;
};

/// Apply the core-properties edit to a parsed part.
void apply_core_properties(tinyxml2::XMLDocument& document,
                           const xpii::schema::provenance_record_t& record);

/// Add `rsid` to the settings part unless it is already listed. Returns true
/// when a marker was added.
bool apply_rsid(tinyxml2::XMLDocument& document, std::string_view rsid);

}  // namespace xpii::provenance
