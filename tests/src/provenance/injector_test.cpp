#include <gtest/gtest.h>
#include <xpii/package/codec.hpp>
#include <xpii/package/xml.hpp>
#include <xpii/provenance/description.hpp>
#include <xpii/provenance/injector.hpp>
#include <xpii/provenance/rsid.hpp>
#include <xpii/testing/common.hpp>

#include <filesystem>
#include <string>
#include <vector>

namespace xml = xpii::package::xml;

namespace {

constexpr auto kSession = "2026-XPII-001";
constexpr auto kFingerprint =
    "0123456789abcdef0123456789abcdef0123456789abcdef0123456789abcdef";

class injector : public ::testing::Test {
 protected:
  void SetUp() override {
    root_ = xpii::testing::make_temp_path("xpii_injector");
    std::filesystem::create_directories(root_);
  }

  void TearDown() override { xpii::testing::remove_path(root_); }

  std::optional<xpii::package::unpacked_package> unpack(
      const xpii::testing::members_t& members) {
    auto source = root_ / "input.docx";
    EXPECT_TRUE(xpii::testing::write_zip(source, members));
    auto error = xpii::common::error{};
    auto unpacked = xpii::package::unpack(source, root_ / "work", error);
    EXPECT_TRUE(unpacked.has_value()) << error.message;
    return unpacked;
  }

  std::unique_ptr<tinyxml2::XMLDocument> load(
      const xpii::package::workspace& files,
      const std::string_view part) {
    auto document = xml::make_document();
    auto error = xpii::common::error{};
    EXPECT_TRUE(xml::load(*document, files.part_path(part), part, error))
        << error.message;
    return document;
  }

  std::vector<std::string> rsids(const xpii::package::workspace& files) {
    auto document = load(files, xpii::provenance::kSettingsPart);
    auto values = std::vector<std::string>{};
    auto* list = document->RootElement()->FirstChildElement("w:rsids");
    if (list == nullptr) {
      return values;
    }
    for (auto* rsid = list->FirstChildElement("w:rsid"); rsid != nullptr;
         rsid = rsid->NextSiblingElement("w:rsid")) {
      values.emplace_back(rsid->Attribute("w:val"));
    }
    return values;
  }

  std::filesystem::path root_;
  xpii::provenance::injector injector_{xpii::testing::fixed_clock()};
};

xpii::testing::members_t with_part(xpii::testing::members_t members,
                                   const std::string& name,
                                   const std::string& contents) {
  for (auto& [member, body] : members) {
    if (member == name) {
      body = contents;
    }
  }
  return members;
}

xpii::testing::members_t without_part(xpii::testing::members_t members,
                                      const std::string& name) {
  std::erase_if(members,
                [&](const auto& member) { return member.first == name; });
  return members;
}

}  // namespace

TEST_F(injector, rewrites_core_properties) {
  auto unpacked = unpack(xpii::testing::make_docx_members());
  ASSERT_TRUE(unpacked.has_value());

  auto error = xpii::common::error{};
  auto record =
      injector_.inject(unpacked->files, "Axiom", kSession, kFingerprint, error);
  ASSERT_TRUE(record.has_value()) << error.message;
  EXPECT_EQ(record->author, "Axiom");
  EXPECT_EQ(record->session_id, kSession);
  EXPECT_EQ(record->fingerprint, kFingerprint);
  EXPECT_EQ(record->modified_at, xpii::testing::kFixedClockW3cdtf);

  auto core = load(unpacked->files, xpii::provenance::kCorePropertiesPart);
  auto* root = core->RootElement();
  EXPECT_STREQ(root->FirstChildElement("dc:creator")->GetText(), "Axiom");
  EXPECT_EQ(root->FirstChildElement("dc:description")->GetText(),
            xpii::provenance::format_description(kSession, kFingerprint));
  auto* modified = root->FirstChildElement("dcterms:modified");
  ASSERT_NE(modified, nullptr);
  EXPECT_STREQ(modified->Attribute("xsi:type"), "dcterms:W3CDTF");
  EXPECT_EQ(modified->GetText(), std::string{xpii::testing::kFixedClockW3cdtf});
  EXPECT_STREQ(root->FirstChildElement("dc:title")->GetText(),
               "Quarterly report");

  auto text = xpii::testing::read_file(
      unpacked->files.part_path(xpii::provenance::kCorePropertiesPart));
  EXPECT_TRUE(text.starts_with(
      R"(<?xml version="1.0" encoding="UTF-8" standalone="yes"?>)"));
}

TEST_F(injector, creates_missing_core_elements_with_document_prefixes) {
  auto core = std::string{
      R"(<?xml version="1.0" encoding="UTF-8"?>)"
      R"(<props xmlns="http://schemas.openxmlformats.org/package/2006/metadata/core-properties" )"
      R"(xmlns:purl="http://purl.org/dc/elements/1.1/"><purl:title>t</purl:title></props>)"};
  auto unpacked = unpack(
      with_part(xpii::testing::make_docx_members(), "docProps/core.xml", core));
  ASSERT_TRUE(unpacked.has_value());

  auto error = xpii::common::error{};
  ASSERT_TRUE(
      injector_.inject(unpacked->files, "Axiom", kSession, kFingerprint, error))
      << error.message;

  auto document = load(unpacked->files, xpii::provenance::kCorePropertiesPart);
  auto* root = document->RootElement();
  EXPECT_STREQ(root->FirstChildElement("purl:creator")->GetText(), "Axiom");
  EXPECT_NE(root->FirstChildElement("purl:description"), nullptr);
  EXPECT_EQ(root->FirstChildElement("dc:creator"), nullptr);
  EXPECT_STREQ(root->Attribute("xmlns:dcterms"), "http://purl.org/dc/terms/");
  EXPECT_STREQ(root->Attribute("xmlns:xsi"),
               "http://www.w3.org/2001/XMLSchema-instance");
  EXPECT_STREQ(root->FirstChildElement("dcterms:modified")->Attribute("xsi:type"),
               "dcterms:W3CDTF");
}

TEST_F(injector, inserts_rsid_collection_in_schema_position) {
  auto unpacked = unpack(xpii::testing::make_docx_members());
  ASSERT_TRUE(unpacked.has_value());

  auto error = xpii::common::error{};
  ASSERT_TRUE(
      injector_.inject(unpacked->files, "Axiom", kSession, kFingerprint, error))
      << error.message;

  auto settings = load(unpacked->files, xpii::provenance::kSettingsPart);
  auto* collection = settings->RootElement()->FirstChildElement("w:rsids");
  ASSERT_NE(collection, nullptr);
  ASSERT_NE(collection->PreviousSiblingElement(), nullptr);
  EXPECT_STREQ(collection->PreviousSiblingElement()->Name(), "w:compat");
  ASSERT_NE(collection->NextSiblingElement(), nullptr);
  EXPECT_STREQ(collection->NextSiblingElement()->Name(), "w:themeFontLang");
  EXPECT_EQ(rsids(unpacked->files),
            (std::vector<std::string>{xpii::provenance::derive_rsid(kSession)}));
}

TEST_F(injector, rsid_collection_precedes_math_properties) {
  auto settings = std::string{
      R"(<?xml version="1.0" encoding="UTF-8" standalone="yes"?>)"
      R"(<w:settings xmlns:w="http://schemas.openxmlformats.org/wordprocessingml/2006/main" )"
      R"(xmlns:m="http://schemas.openxmlformats.org/officeDocument/2006/math">)"
      R"(<w:zoom w:percent="100"/><w:docVars><w:docVar w:name="case" w:val="7"/></w:docVars>)"
      R"(<m:mathPr><m:mathFont m:val="Cambria Math"/></m:mathPr>)"
      R"(<w:themeFontLang w:val="en-US"/></w:settings>)"};
  auto unpacked = unpack(with_part(xpii::testing::make_docx_members(),
                                   "word/settings.xml", settings));
  ASSERT_TRUE(unpacked.has_value());

  auto error = xpii::common::error{};
  ASSERT_TRUE(
      injector_.inject(unpacked->files, "Axiom", kSession, kFingerprint, error))
      << error.message;

  auto document = load(unpacked->files, xpii::provenance::kSettingsPart);
  auto* collection = document->RootElement()->FirstChildElement("w:rsids");
  ASSERT_NE(collection, nullptr);
  ASSERT_NE(collection->PreviousSiblingElement(), nullptr);
  EXPECT_STREQ(collection->PreviousSiblingElement()->Name(), "w:docVars");
  ASSERT_NE(collection->NextSiblingElement(), nullptr);
  EXPECT_STREQ(collection->NextSiblingElement()->Name(), "m:mathPr");
}

TEST_F(injector, rsid_collection_precedes_extension_elements) {
  auto settings = std::string{
      R"(<w:settings xmlns:w="http://schemas.openxmlformats.org/wordprocessingml/2006/main" )"
      R"(xmlns:w14="http://schemas.microsoft.com/office/word/2010/wordml" )"
      R"(xmlns:w15="http://schemas.microsoft.com/office/word/2012/wordml">)"
      R"(<w:zoom w:percent="100"/><w:compat/>)"
      R"(<w14:docId w14:val="1A2B3C4D"/><w15:chartTrackingRefBased/></w:settings>)"};
  auto unpacked = unpack(with_part(xpii::testing::make_docx_members(),
                                   "word/settings.xml", settings));
  ASSERT_TRUE(unpacked.has_value());

  auto error = xpii::common::error{};
  ASSERT_TRUE(
      injector_.inject(unpacked->files, "Axiom", kSession, kFingerprint, error))
      << error.message;

  auto document = load(unpacked->files, xpii::provenance::kSettingsPart);
  auto* collection = document->RootElement()->FirstChildElement("w:rsids");
  ASSERT_NE(collection, nullptr);
  EXPECT_STREQ(collection->PreviousSiblingElement()->Name(), "w:compat");
  ASSERT_NE(collection->NextSiblingElement(), nullptr);
  EXPECT_STREQ(collection->NextSiblingElement()->Name(), "w14:docId");
}

TEST_F(injector, rsid_collection_matches_default_namespace_settings) {
  auto settings = std::string{
      R"(<settings xmlns="http://schemas.openxmlformats.org/wordprocessingml/2006/main">)"
      R"(<zoom percent="100"/><themeFontLang val="en-US"/></settings>)"};
  auto unpacked = unpack(with_part(xpii::testing::make_docx_members(),
                                   "word/settings.xml", settings));
  ASSERT_TRUE(unpacked.has_value());

  auto error = xpii::common::error{};
  ASSERT_TRUE(
      injector_.inject(unpacked->files, "Axiom", kSession, kFingerprint, error))
      << error.message;

  auto document = load(unpacked->files, xpii::provenance::kSettingsPart);
  auto* collection = document->RootElement()->FirstChildElement("rsids");
  ASSERT_NE(collection, nullptr);
  ASSERT_NE(collection->NextSiblingElement(), nullptr);
  EXPECT_STREQ(collection->NextSiblingElement()->Name(), "themeFontLang");
}

TEST_F(injector, appends_rsid_collection_when_no_later_sibling) {
  auto settings = std::string{
      R"(<w:settings xmlns:w="http://schemas.openxmlformats.org/wordprocessingml/2006/main">)"
      R"(<w:zoom w:percent="90"/></w:settings>)"};
  auto unpacked = unpack(with_part(xpii::testing::make_docx_members(),
                                   "word/settings.xml", settings));
  ASSERT_TRUE(unpacked.has_value());

  auto error = xpii::common::error{};
  ASSERT_TRUE(
      injector_.inject(unpacked->files, "Axiom", kSession, kFingerprint, error))
      << error.message;

  auto document = load(unpacked->files, xpii::provenance::kSettingsPart);
  EXPECT_STREQ(document->RootElement()->LastChildElement()->Name(), "w:rsids");
  auto text = xpii::testing::read_file(
      unpacked->files.part_path(xpii::provenance::kSettingsPart));
  EXPECT_TRUE(
      text.starts_with(R"(<?xml version="1.0" encoding="UTF-8"?>)"));
}

TEST_F(injector, same_session_never_duplicates_rsid) {
  auto unpacked = unpack(xpii::testing::make_docx_members());
  ASSERT_TRUE(unpacked.has_value());

  auto error = xpii::common::error{};
  ASSERT_TRUE(
      injector_.inject(unpacked->files, "Axiom", kSession, kFingerprint, error));
  ASSERT_TRUE(
      injector_.inject(unpacked->files, "Axiom", kSession, kFingerprint, error));
  EXPECT_EQ(rsids(unpacked->files).size(), 1u);

  ASSERT_TRUE(injector_.inject(unpacked->files, "Axiom", "2026-XPII-002",
                               kFingerprint, error));
  EXPECT_EQ(rsids(unpacked->files),
            (std::vector<std::string>{
                xpii::provenance::derive_rsid(kSession),
                xpii::provenance::derive_rsid("2026-XPII-002")}));
}

TEST_F(injector, keeps_existing_rsids) {
  auto settings = std::string{
      R"(<w:settings xmlns:w="http://schemas.openxmlformats.org/wordprocessingml/2006/main">)"
      R"(<w:rsids><w:rsidRoot w:val="00AB12CD"/><w:rsid w:val="00AB12CD"/></w:rsids>)"
      R"(</w:settings>)"};
  auto unpacked = unpack(with_part(xpii::testing::make_docx_members(),
                                   "word/settings.xml", settings));
  ASSERT_TRUE(unpacked.has_value());

  auto error = xpii::common::error{};
  ASSERT_TRUE(
      injector_.inject(unpacked->files, "Axiom", kSession, kFingerprint, error));
  EXPECT_EQ(rsids(unpacked->files),
            (std::vector<std::string>{
                "00AB12CD", xpii::provenance::derive_rsid(kSession)}));
}

TEST_F(injector, generates_session_id_from_local_time) {
  auto unpacked = unpack(xpii::testing::make_docx_members());
  ASSERT_TRUE(unpacked.has_value());

  auto error = xpii::common::error{};
  auto record =
      injector_.inject(unpacked->files, "Axiom", "", kFingerprint, error);
  ASSERT_TRUE(record.has_value()) << error.message;
  EXPECT_EQ(record->session_id, xpii::common::format_local_compact(
                                    xpii::testing::fixed_clock()()));
}

TEST_F(injector, absent_parts_are_skipped) {
  auto members = without_part(
      without_part(xpii::testing::make_docx_members(), "docProps/core.xml"),
      "word/settings.xml");
  auto unpacked = unpack(members);
  ASSERT_TRUE(unpacked.has_value());

  auto error = xpii::common::error{};
  auto record =
      injector_.inject(unpacked->files, "Axiom", kSession, kFingerprint, error);
  ASSERT_TRUE(record.has_value()) << error.message;
  EXPECT_FALSE(unpacked->files.contains(xpii::provenance::kCorePropertiesPart));
  EXPECT_FALSE(unpacked->files.contains(xpii::provenance::kSettingsPart));
}

TEST_F(injector, document_body_is_preserved) {
  auto unpacked = unpack(xpii::testing::make_docx_members());
  ASSERT_TRUE(unpacked.has_value());

  auto error = xpii::common::error{};
  ASSERT_TRUE(
      injector_.inject(unpacked->files, "Axiom", kSession, kFingerprint, error));
  EXPECT_EQ(xpii::testing::read_file(
                unpacked->files.part_path(xpii::provenance::kDocumentPart)),
            xpii::testing::kDocument);
}

TEST_F(injector, whitespace_only_runs_are_preserved) {
  auto body = std::string{
      R"(<?xml version="1.0" encoding="UTF-8" standalone="yes"?>)"
      R"(<w:document xmlns:w="http://schemas.openxmlformats.org/wordprocessingml/2006/main">)"
      R"(<w:body><w:p><w:r><w:t>Hello</w:t></w:r>)"
      R"(<w:r><w:t xml:space="preserve"> </w:t></w:r>)"
      R"(<w:r><w:t>world</w:t></w:r></w:p></w:body></w:document>)"};
  auto unpacked = unpack(with_part(xpii::testing::make_docx_members(),
                                   "word/document.xml", body));
  ASSERT_TRUE(unpacked.has_value());

  auto error = xpii::common::error{};
  ASSERT_TRUE(
      injector_.inject(unpacked->files, "Axiom", kSession, kFingerprint, error))
      << error.message;
  EXPECT_EQ(xpii::testing::read_file(
                unpacked->files.part_path(xpii::provenance::kDocumentPart)),
            body);
}

TEST_F(injector, malformed_part_fails_with_parser_message) {
  auto unpacked =
      unpack(with_part(xpii::testing::make_docx_members(), "word/settings.xml",
                       "<w:settings><unclosed></w:settings>"));
  ASSERT_TRUE(unpacked.has_value());

  auto error = xpii::common::error{};
  auto record =
      injector_.inject(unpacked->files, "Axiom", kSession, kFingerprint, error);
  EXPECT_FALSE(record.has_value());
  EXPECT_EQ(error.code, xpii::schema::error_code::malformed_archive);
  EXPECT_NE(error.message.find("word/settings.xml"), std::string::npos);
}
