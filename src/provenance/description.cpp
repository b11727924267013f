#include <xpii/common/strings.hpp>
#include <xpii/provenance/description.hpp>

using xpii::common::trim;

namespace xpii::provenance {

namespace {

inline constexpr auto kSegmentSeparator = '|';
inline constexpr auto kKeySeparator = std::string_view{": "};

}  // namespace

std::string format_description(const std::string_view session_id,
                               const std::string_view fingerprint) {
  auto text = std::string{kProvenanceKey};
  text.append(kKeySeparator);
  text.append(session_id);
  text.append(" | ");
  text.append(kFingerprintKey);
  text.append(kKeySeparator);
  text.append(fingerprint);
  return text;
}

std::map<std::string, std::string> parse_description(
    const std::string_view text) {
  auto fields = std::map<std::string, std::string>{};
  auto start = std::size_t{0};
  while (start <= text.size()) {
    auto end = text.find(kSegmentSeparator, start);
    if (end == std::string_view::npos) {
      end = text.size();
    }
    auto segment = text.substr(start, end - start);
    start = end + 1;

    auto separator = segment.find(kKeySeparator);
    if (separator != std::string_view::npos) {
      auto key = trim(segment.substr(0, separator));
      if (!key.empty()) {
        fields.insert_or_assign(
            std::string{key},
            std::string{trim(segment.substr(separator + kKeySeparator.size()))});
      }
      continue;
    }
    auto bare = trim(segment);
    if (bare.size() > 1 && bare.back() == ':') {
      fields.insert_or_assign(
          std::string{trim(bare.substr(0, bare.size() - 1))}, std::string{});
    }
  }
  return fields;
}

bool has_provenance_marker(const std::string_view text) {
  auto marker = std::string{kProvenanceKey};
  marker.push_back(':');
  return text.find(marker) != std::string_view::npos;
}

}  // namespace xpii::provenance
