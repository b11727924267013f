#include <spdlog/spdlog.h>
#include <xpii/common/strings.hpp>
#include <xpii/package/codec.hpp>
#include <xpii/package/xml.hpp>
#include <xpii/provenance/description.hpp>
#include <xpii/provenance/injector.hpp>
#include <xpii/provenance/verifier.hpp>

using namespace xpii::schema;
namespace xml = xpii::package::xml;

namespace xpii::provenance {

namespace {

std::optional<std::string> child_text(const tinyxml2::XMLElement& root,
                                      const std::optional<std::string>& prefix,
                                      const std::string_view local) {
  if (!prefix) {
    return std::nullopt;
  }
  const auto* child =
      root.FirstChildElement(xml::qualify(*prefix, local).c_str());
  if (child == nullptr || child->GetText() == nullptr) {
    return std::nullopt;
  }
  return xml::text_of(*child);
}

}  // namespace

verification_result_t verify(const std::filesystem::path& package_path) {
  auto result = verification_result_t{};
  auto error = xpii::common::error{};

  auto core = std::optional<bytes_t>{};
  if (!xpii::package::read_member(package_path, kCorePropertiesPart, core,
                                  error)) {
    result.status = verification_status_t::malformed_archive;
    result.error = error.message;
    return result;
  }
  if (!core) {
    spdlog::info("'{}' has no {}", package_path.string(), kCorePropertiesPart);
    result.status = verification_status_t::no_metadata;
    return result;
  }

  auto document = xml::make_document();
  if (!xml::parse(*document, make_string_view(*core), kCorePropertiesPart,
                  error)) {
    result.status = verification_status_t::malformed_archive;
    result.error = error.message;
    return result;
  }

  const auto& root = *document->RootElement();
  auto dc = xml::find_prefix(root, xml::kDublinCoreNamespace);
  auto dcterms = xml::find_prefix(root, xml::kDublinCoreTermsNamespace);

  auto description = child_text(root, dc, "description").value_or("");
  if (xpii::common::trim(description).empty() || !has_provenance_marker(description)) {
    spdlog::info("'{}' carries no provenance description",
                 package_path.string());
    result.status = verification_status_t::no_provenance;
    return result;
  }

  result.fields = parse_description(description);
  auto field = [&](const std::string_view key) {
    auto found = result.fields.find(std::string{key});
    return found == std::end(result.fields) ? std::string{} : found->second;
  };

  auto record = provenance_record_t{};
  record.author = child_text(root, dc, "creator")
                      .value_or(std::string{kUnknownField});
  record.session_id = field(kProvenanceKey);
  record.fingerprint = field(kFingerprintKey);
  record.modified_at = child_text(root, dcterms, "modified")
                           .value_or(std::string{kUnknownField});
  result.record = std::move(record);
  result.status = verification_status_t::verified;
  spdlog::info("Verified '{}' (session {}, author {})", package_path.string(),
               result.record->session_id, result.record->author);
  return result;
}

}  // namespace xpii::provenance
