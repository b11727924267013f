#include <gtest/gtest.h>
#include <xpii/package/xml.hpp>

#include <string>

namespace xml = xpii::package::xml;

TEST(xml, serialize_adds_declaration_when_missing) {
  auto document = xml::make_document();
  auto error = xpii::common::error{};
  ASSERT_TRUE(xml::parse(*document, "<root><a>1</a></root>", "test", error));
  EXPECT_EQ(xml::serialize(*document),
            R"(<?xml version="1.0" encoding="UTF-8"?><root><a>1</a></root>)");
}

TEST(xml, serialize_keeps_existing_declaration_and_whitespace) {
  auto document = xml::make_document();
  auto error = xpii::common::error{};
  auto text = std::string{
      R"(<?xml version="1.0" encoding="UTF-8" standalone="yes"?>)"
      R"(<root><t xml:space="preserve">  two  spaces </t></root>)"};
  ASSERT_TRUE(xml::parse(*document, text, "test", error));
  EXPECT_EQ(xml::serialize(*document), text);
}

TEST(xml, parse_failure_is_malformed_archive) {
  auto document = xml::make_document();
  auto error = xpii::common::error{};
  EXPECT_FALSE(xml::parse(*document, "<root><open></root>", "word/x.xml",
                          error));
  EXPECT_EQ(error.code, xpii::schema::error_code::malformed_archive);
  EXPECT_NE(error.message.find("word/x.xml"), std::string::npos);
}

TEST(xml, parse_rejects_document_without_root) {
  auto document = xml::make_document();
  auto error = xpii::common::error{};
  EXPECT_FALSE(xml::parse(*document, "", "empty.xml", error));
  EXPECT_EQ(error.code, xpii::schema::error_code::malformed_archive);
}

TEST(xml, prefixes_resolve_from_declarations) {
  auto document = xml::make_document();
  auto error = xpii::common::error{};
  ASSERT_TRUE(xml::parse(*document,
                         R"(<p:props xmlns:p="urn:props" xmlns="urn:default"/>)",
                         "test", error));
  const auto& root = *document->RootElement();
  EXPECT_EQ(xml::find_prefix(root, "urn:props"), "p");
  EXPECT_EQ(xml::find_prefix(root, "urn:default"), "");
  EXPECT_FALSE(xml::find_prefix(root, "urn:other").has_value());
}

TEST(xml, whitespace_only_text_is_kept) {
  auto document = xml::make_document();
  auto error = xpii::common::error{};
  auto text = std::string{
      R"(<?xml version="1.0" encoding="UTF-8"?>)"
      R"(<r><t xml:space="preserve"> </t><t xml:space="preserve">   </t></r>)"};
  ASSERT_TRUE(xml::parse(*document, text, "test", error));
  EXPECT_STREQ(document->RootElement()->FirstChildElement("t")->GetText(), " ");
  EXPECT_EQ(xml::serialize(*document), text);
}

TEST(xml, namespace_of_resolves_through_ancestors) {
  auto document = xml::make_document();
  auto error = xpii::common::error{};
  ASSERT_TRUE(xml::parse(
      *document,
      R"(<p:root xmlns:p="urn:p" xmlns="urn:default"><plain/><p:inner/><q:x/></p:root>)",
      "test", error));
  const auto& root = *document->RootElement();
  EXPECT_EQ(xml::namespace_of(root), "urn:p");
  EXPECT_EQ(xml::local_name(root), "root");

  const auto* plain = root.FirstChildElement("plain");
  EXPECT_EQ(xml::namespace_of(*plain), "urn:default");
  EXPECT_EQ(xml::local_name(*plain), "plain");

  EXPECT_EQ(xml::namespace_of(*root.FirstChildElement("p:inner")), "urn:p");
  EXPECT_FALSE(xml::namespace_of(*root.FirstChildElement("q:x")).has_value());
}

TEST(xml, ensure_prefix_declares_missing_namespace) {
  auto document = xml::make_document();
  auto error = xpii::common::error{};
  ASSERT_TRUE(xml::parse(*document, R"(<r xmlns:dc="urn:taken"/>)", "test",
                         error));
  auto& root = *document->RootElement();

  EXPECT_EQ(xml::ensure_prefix(root, "urn:taken", "x"), "dc");
  EXPECT_EQ(xml::ensure_prefix(root, "urn:fresh", "fresh"), "fresh");
  EXPECT_STREQ(root.Attribute("xmlns:fresh"), "urn:fresh");
  EXPECT_EQ(xml::ensure_prefix(root, "urn:dc", "dc"), "dc1");
  EXPECT_STREQ(root.Attribute("xmlns:dc1"), "urn:dc");
}

TEST(xml, ensure_child_reuses_existing_element) {
  auto document = xml::make_document();
  auto error = xpii::common::error{};
  ASSERT_TRUE(xml::parse(*document, "<r><a>keep</a></r>", "test", error));
  auto& root = *document->RootElement();

  auto* existing = xml::ensure_child(root, "a");
  EXPECT_EQ(xml::text_of(*existing), "keep");
  auto* created = xml::ensure_child(root, xml::qualify("p", "b"));
  EXPECT_STREQ(created->Name(), "p:b");
  EXPECT_EQ(xml::text_of(*created), "");
  EXPECT_EQ(xml::qualify("", "plain"), "plain");
}
