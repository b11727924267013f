#pragma once

#include <miniz.h>
#include <xpii/common/clock.hpp>
#include <xpii/schema/primitives.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace xpii::testing {

using members_t = std::vector<std::pair<std::string, std::string>>;

inline constexpr auto kContentTypes = std::string_view{
    R"(<?xml version="1.0" encoding="UTF-8" standalone="yes"?>)"
    R"(<Types xmlns="http://schemas.openxmlformats.org/package/2006/content-types">)"
    R"(<Default Extension="rels" ContentType="application/vnd.openxmlformats-package.relationships+xml"/>)"
    R"(<Default Extension="xml" ContentType="application/xml"/>)"
    R"(</Types>)"};

inline constexpr auto kRootRels = std::string_view{
    R"(<?xml version="1.0" encoding="UTF-8" standalone="yes"?>)"
    R"(<Relationships xmlns="http://schemas.openxmlformats.org/package/2006/relationships">)"
    R"(<Relationship Id="rId1" Type="http://schemas.openxmlformats.org/officeDocument/2006/relationships/officeDocument" Target="word/document.xml"/>)"
    R"(</Relationships>)"};

inline constexpr auto kCoreProperties = std::string_view{
    R"(<?xml version="1.0" encoding="UTF-8" standalone="yes"?>)"
    R"(<cp:coreProperties xmlns:cp="http://schemas.openxmlformats.org/package/2006/metadata/core-properties" )"
    R"(xmlns:dc="http://purl.org/dc/elements/1.1/" xmlns:dcterms="http://purl.org/dc/terms/" )"
    R"(xmlns:dcmitype="http://purl.org/dc/dcmitype/" xmlns:xsi="http://www.w3.org/2001/XMLSchema-instance">)"
    R"(<dc:title>Quarterly report</dc:title><dc:creator>Old</dc:creator>)"
    R"(<dcterms:created xsi:type="dcterms:W3CDTF">2024-01-02T03:04:05Z</dcterms:created>)"
    R"(</cp:coreProperties>)"};

inline constexpr auto kSettings = std::string_view{
    R"(<?xml version="1.0" encoding="UTF-8" standalone="yes"?>)"
    R"(<w:settings xmlns:w="http://schemas.openxmlformats.org/wordprocessingml/2006/main">)"
    R"(<w:zoom w:percent="100"/><w:defaultTabStop w:val="720"/>)"
    R"(<w:characterSpacingControl w:val="doNotCompress"/>)"
    R"(<w:compat><w:compatSetting w:name="compatibilityMode" w:uri="http://schemas.microsoft.com/office/word" w:val="15"/></w:compat>)"
    R"(<w:themeFontLang w:val="en-US"/><w:decimalSymbol w:val="."/><w:listSeparator w:val=","/>)"
    R"(</w:settings>)"};

inline constexpr auto kDocument = std::string_view{
    R"(<?xml version="1.0" encoding="UTF-8" standalone="yes"?>)"
    R"(<w:document xmlns:w="http://schemas.openxmlformats.org/wordprocessingml/2006/main">)"
    R"(<w:body><w:p><w:r><w:t xml:space="preserve">Hello  provenance </w:t></w:r></w:p></w:body>)"
    R"(</w:document>)"};

inline std::string make_temp_path(const std::string_view prefix) {
  static auto counter = std::atomic<uint64_t>{0};
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path =
      std::filesystem::temp_directory_path() /
      (std::string{prefix} + "_" +
       std::to_string(static_cast<unsigned long long>(now)) + "_" +
       std::to_string(counter.fetch_add(1)));
  return path.string();
}

inline void remove_path(const std::filesystem::path& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

/// Members of a minimal Word package: content types, root rels, core
/// properties with creator "Old", settings and a one-paragraph body.
inline members_t make_docx_members() {
  return members_t{
      {"[Content_Types].xml", std::string{kContentTypes}},
      {"_rels/.rels", std::string{kRootRels}},
      {"docProps/core.xml", std::string{kCoreProperties}},
      {"word/document.xml", std::string{kDocument}},
      {"word/settings.xml", std::string{kSettings}},
  };
}

/// Write `members` as a zip in the given order. Returns false on failure.
inline bool write_zip(const std::filesystem::path& path,
                      const members_t& members) {
  auto archive = mz_zip_archive{};
  if (mz_zip_writer_init_file(&archive, path.string().c_str(), 0) ==
      MZ_FALSE) {
    return false;
  }
  auto ok = true;
  for (const auto& [name, contents] : members) {
    ok = ok && mz_zip_writer_add_mem(&archive, name.c_str(), contents.data(),
                                     contents.size(), MZ_DEFAULT_LEVEL) !=
                   MZ_FALSE;
  }
  ok = ok && mz_zip_writer_finalize_archive(&archive) != MZ_FALSE;
  ok = mz_zip_writer_end(&archive) != MZ_FALSE && ok;
  return ok;
}

inline bool write_docx(const std::filesystem::path& path) {
  return write_zip(path, make_docx_members());
}

inline bool write_file(const std::filesystem::path& path,
                       const std::string_view contents) {
  auto stream = std::ofstream{path, std::ios::binary | std::ios::trunc};
  stream.write(contents.data(), static_cast<std::streamsize>(contents.size()));
  return static_cast<bool>(stream);
}

inline std::string read_file(const std::filesystem::path& path) {
  auto stream = std::ifstream{path, std::ios::binary};
  return std::string{std::istreambuf_iterator<char>{stream},
                     std::istreambuf_iterator<char>{}};
}

/// Clock pinned to 2026-03-04T05:06:07.089Z.
inline xpii::common::clock_fn fixed_clock() {
  return [] {
    return std::chrono::system_clock::time_point{
        std::chrono::milliseconds{1772600767089}};
  };
}

inline constexpr auto kFixedClockW3cdtf =
    std::string_view{"2026-03-04T05:06:07Z"};
inline constexpr auto kFixedClockRfc3339 =
    std::string_view{"2026-03-04T05:06:07.089Z"};

}  // namespace xpii::testing
