#include <spdlog/spdlog.h>
#include <xpii/package/xml.hpp>

#include <fstream>
#include <iterator>
#include <memory>

using namespace xpii::schema;

namespace xpii::package::xml {

namespace {

inline constexpr auto kXmlnsAttribute = std::string_view{"xmlns"};
inline constexpr auto kXmlnsPrefix = std::string_view{"xmlns:"};

std::string xmlns_attribute(const std::string_view prefix) {
  if (prefix.empty()) {
    return std::string{kXmlnsAttribute};
  }
  auto name = std::string{kXmlnsPrefix};
  name.append(prefix);
  return name;
}

}  // namespace

std::unique_ptr<tinyxml2::XMLDocument> make_document() {
  return std::make_unique<tinyxml2::XMLDocument>(
      true, tinyxml2::PEDANTIC_WHITESPACE);
}

bool parse(tinyxml2::XMLDocument& document,
           const std::string_view text,
           const std::string_view part,
           xpii::common::error& error) {
  auto result = document.Parse(text.data(), text.size());
  if (result != tinyxml2::XML_SUCCESS || document.RootElement() == nullptr) {
    auto message = fmt::format("cannot parse {}: {}", part,
                               result == tinyxml2::XML_SUCCESS
                                   ? std::string{"no root element"}
                                   : std::string{document.ErrorStr()});
    spdlog::error("{}", message);
    error = xpii::common::make_error(error_code::malformed_archive,
                                     std::move(message));
    return false;
  }
  return true;
}

bool load(tinyxml2::XMLDocument& document,
          const std::filesystem::path& file,
          const std::string_view part,
          xpii::common::error& error) {
  auto stream = std::ifstream{file, std::ios::binary};
  if (!stream) {
    error = xpii::common::make_error(
        error_code::io_error, fmt::format("cannot read {}", file.string()));
    return false;
  }
  auto text = std::string{std::istreambuf_iterator<char>{stream},
                          std::istreambuf_iterator<char>{}};
  return parse(document, text, part, error);
}

std::string serialize(tinyxml2::XMLDocument& document) {
  auto* first = document.FirstChild();
  if (first == nullptr || first->ToDeclaration() == nullptr) {
    document.InsertFirstChild(document.NewDeclaration());
  }
  auto printer = tinyxml2::XMLPrinter{nullptr, true};
  document.Print(&printer);
  return std::string{printer.CStr(),
                     static_cast<std::size_t>(printer.CStrSize() - 1)};
}

bool save(tinyxml2::XMLDocument& document,
          const std::filesystem::path& file,
          xpii::common::error& error) {
  auto text = serialize(document);
  auto stream = std::ofstream{file, std::ios::binary | std::ios::trunc};
  if (stream) {
    stream.write(text.data(), static_cast<std::streamsize>(text.size()));
  }
  if (!stream) {
    auto message = fmt::format("cannot write {}", file.string());
    spdlog::error("{}", message);
    error = xpii::common::make_error(error_code::io_error, std::move(message));
    return false;
  }
  return true;
}

std::optional<std::string> find_prefix(const tinyxml2::XMLElement& element,
                                       const std::string_view uri) {
  for (const auto* attribute = element.FirstAttribute(); attribute != nullptr;
       attribute = attribute->Next()) {
    auto name = std::string_view{attribute->Name()};
    if (uri != attribute->Value()) {
      continue;
    }
    if (name == kXmlnsAttribute) {
      return std::string{};
    }
    if (name.starts_with(kXmlnsPrefix)) {
      return std::string{name.substr(kXmlnsPrefix.size())};
    }
  }
  return std::nullopt;
}

std::optional<std::string> namespace_of(const tinyxml2::XMLElement& element) {
  auto name = std::string_view{element.Name()};
  auto colon = name.find(':');
  auto attribute = colon == std::string_view::npos
                       ? std::string{kXmlnsAttribute}
                       : xmlns_attribute(name.substr(0, colon));
  for (const auto* scope = &element; scope != nullptr;
       scope = scope->Parent() == nullptr ? nullptr
                                          : scope->Parent()->ToElement()) {
    if (const auto* uri = scope->Attribute(attribute.c_str())) {
      return std::string{uri};
    }
  }
  return std::nullopt;
}

std::string_view local_name(const tinyxml2::XMLElement& element) {
  auto name = std::string_view{element.Name()};
  auto colon = name.find(':');
  return colon == std::string_view::npos ? name : name.substr(colon + 1);
}

std::string ensure_prefix(tinyxml2::XMLElement& element,
                          const std::string_view uri,
                          const std::string_view preferred) {
  if (auto prefix = find_prefix(element, uri)) {
    return *prefix;
  }
  auto prefix = std::string{preferred};
  for (auto suffix = 1; element.Attribute(xmlns_attribute(prefix).c_str());
       ++suffix) {
    prefix = std::string{preferred} + std::to_string(suffix);
  }
  element.SetAttribute(xmlns_attribute(prefix).c_str(),
                       std::string{uri}.c_str());
  spdlog::debug("Declared xmlns:{}=\"{}\" on <{}>", prefix, uri,
                element.Name());
  return prefix;
}

std::string qualify(const std::string_view prefix,
                    const std::string_view local) {
  if (prefix.empty()) {
    return std::string{local};
  }
  auto name = std::string{prefix};
  name.push_back(':');
  name.append(local);
  return name;
}

tinyxml2::XMLElement* ensure_child(tinyxml2::XMLElement& parent,
                                   const std::string& name) {
  if (auto* child = parent.FirstChildElement(name.c_str())) {
    return child;
  }
  auto* child = parent.GetDocument()->NewElement(name.c_str());
  parent.InsertEndChild(child);
  return child;
}

std::string text_of(const tinyxml2::XMLElement& element) {
  const auto* text = element.GetText();
  return text == nullptr ? std::string{} : std::string{text};
}

}  // namespace xpii::package::xml
