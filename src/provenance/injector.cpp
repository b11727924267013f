#include <spdlog/spdlog.h>
#include <xpii/package/xml.hpp>
#include <xpii/provenance/description.hpp>
#include <xpii/provenance/injector.hpp>
#include <xpii/provenance/rsid.hpp>

#include <algorithm>
#include <array>
#include <functional>
#include <utility>

using namespace xpii::schema;
namespace xml = xpii::package::xml;

namespace xpii::provenance {

namespace {

// CT_Settings children in the WordprocessingML namespace that follow w:rsids
// in schema order.
inline constexpr auto kSettingsAfterRsids = std::array<std::string_view, 13>{
    "attachedSchema",
    "themeFontLang",
    "clrSchemeMapping",
    "doNotIncludeSubdocsInStats",
    "doNotAutoCompressPictures",
    "forceUpgrade",
    "captions",
    "readModeInkLockDown",
    "smartTagType",
    "shapeDefaults",
    "doNotEmbedSmartTags",
    "decimalSymbol",
    "listSeparator",
};

bool follows_rsids(const tinyxml2::XMLElement& child) {
  auto uri = xml::namespace_of(child);
  if (!uri) {
    return false;
  }
  auto local = xml::local_name(child);
  if (*uri == xml::kWordprocessingNamespace) {
    return std::ranges::find(kSettingsAfterRsids, local) !=
           std::end(kSettingsAfterRsids);
  }
  if (*uri == xml::kMathNamespace) {
    return local == "mathPr";
  }
  if (*uri == xml::kSchemaLibraryNamespace) {
    return local == "schemaLibrary";
  }
  // w14/w15/w16 extension elements close the sequence.
  return true;
}

tinyxml2::XMLElement* make_rsids(tinyxml2::XMLElement& settings,
                                 const std::string& name) {
  auto* rsids = settings.GetDocument()->NewElement(name.c_str());
  for (auto* child = settings.FirstChildElement(); child != nullptr;
       child = child->NextSiblingElement()) {
    if (!follows_rsids(*child)) {
      continue;
    }
    if (auto* previous = child->PreviousSibling()) {
      settings.InsertAfterChild(previous, rsids);
    } else {
      settings.InsertFirstChild(rsids);
    }
    return rsids;
  }
  settings.InsertEndChild(rsids);
  return rsids;
}

bool edit_part(const xpii::package::workspace& files,
               const std::string_view part,
               const std::function<void(tinyxml2::XMLDocument&)>& edit,
               xpii::common::error& error) {
  if (!files.contains(part)) {
    spdlog::debug("{} absent, skipping", part);
    return true;
  }
  auto path = files.part_path(part);
  auto document = xml::make_document();
  if (!xml::load(*document, path, part, error)) {
    return false;
  }
  edit(*document);
  return xml::save(*document, path, error);
}

}  // namespace

void apply_core_properties(tinyxml2::XMLDocument& document,
                           const provenance_record_t& record) {
  auto& root = *document.RootElement();
  auto dc = xml::ensure_prefix(root, xml::kDublinCoreNamespace, "dc");
  auto dcterms =
      xml::ensure_prefix(root, xml::kDublinCoreTermsNamespace, "dcterms");
  auto xsi = xml::ensure_prefix(root, xml::kSchemaInstanceNamespace, "xsi");

  xml::ensure_child(root, xml::qualify(dc, "creator"))
      ->SetText(record.author.c_str());
  xml::ensure_child(root, xml::qualify(dc, "description"))
      ->SetText(
          format_description(record.session_id, record.fingerprint).c_str());

  auto* modified = xml::ensure_child(root, xml::qualify(dcterms, "modified"));
  modified->SetAttribute(xml::qualify(xsi, "type").c_str(),
                         xml::qualify(dcterms, "W3CDTF").c_str());
  modified->SetText(record.modified_at.c_str());
}

bool apply_rsid(tinyxml2::XMLDocument& document, const std::string_view rsid) {
  auto& root = *document.RootElement();
  auto w = xml::ensure_prefix(root, xml::kWordprocessingNamespace, "w");
  auto rsids_name = xml::qualify(w, "rsids");
  auto rsid_name = xml::qualify(w, "rsid");
  auto val_name = xml::qualify(w, "val");

  auto* rsids = root.FirstChildElement(rsids_name.c_str());
  if (rsids == nullptr) {
    rsids = make_rsids(root, rsids_name);
  }
  for (auto* existing = rsids->FirstChildElement(rsid_name.c_str());
       existing != nullptr;
       existing = existing->NextSiblingElement(rsid_name.c_str())) {
    const auto* value = existing->Attribute(val_name.c_str());
    if (value != nullptr && rsid == value) {
      return false;
    }
  }
  auto* marker = document.NewElement(rsid_name.c_str());
  marker->SetAttribute(val_name.c_str(), std::string{rsid}.c_str());
  rsids->InsertEndChild(marker);
  return true;
}

injector::injector(xpii::common::clock_fn clock) : clock_{std::move(clock)} {}

std::optional<provenance_record_t> injector::inject(
    const xpii::package::workspace& files,
    const std::string_view author,
    const std::string_view session_id,
    const std::string_view fingerprint,
    xpii::common::error& error) const {
  auto now = clock_();
  auto record = provenance_record_t{};
  record.author = std::string{author};
  record.session_id = session_id.empty()
                          ? xpii::common::format_local_compact(now)
                          : std::string{session_id};
  record.fingerprint = std::string{fingerprint};
  record.modified_at = xpii::common::format_w3cdtf(now);

  auto core = [&](tinyxml2::XMLDocument& document) {
    apply_core_properties(document, record);
  };
  if (!edit_part(files, kCorePropertiesPart, core, error)) {
    return std::nullopt;
  }

  auto rsid = derive_rsid(record.session_id);
  auto settings = [&](tinyxml2::XMLDocument& document) {
    if (!apply_rsid(document, rsid)) {
      spdlog::debug("RSID {} already present", rsid);
    }
  };
  if (!edit_part(files, kSettingsPart, settings, error)) {
    return std::nullopt;
  }

  if (!edit_part(files, kDocumentPart, [](tinyxml2::XMLDocument&) {}, error)) {
    return std::nullopt;
  }

  spdlog::info("Injected provenance for session {} (rsid {}, sha256 {})",
               record.session_id, rsid, record.fingerprint);
  return record;
}

}  // namespace xpii::provenance
