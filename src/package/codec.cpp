#include <miniz.h>
#include <spdlog/spdlog.h>
#include <xpii/crypto/sha256.hpp>
#include <xpii/package/codec.hpp>

#include <algorithm>
#include <array>
#include <fstream>
#include <iterator>
#include <system_error>

using namespace xpii::schema;

namespace xpii::package {

namespace {

class zip_reader final {
 public:
  zip_reader() = default;
  ~zip_reader() {
    if (open_) {
      mz_zip_reader_end(&archive_);
    }
  }

  zip_reader(const zip_reader&) = delete;
  zip_reader& operator=(const zip_reader&) = delete;

  bool open(const bytes_t& bytes) {
    open_ = mz_zip_reader_init_mem(&archive_, bytes.data(), bytes.size(), 0) !=
            MZ_FALSE;
    return open_;
  }

  bool open(const std::filesystem::path& path) {
    open_ = mz_zip_reader_init_file(&archive_, path.string().c_str(), 0) !=
            MZ_FALSE;
    return open_;
  }

  mz_zip_archive* get() { return &archive_; }

  std::string last_error() {
    return mz_zip_get_error_string(mz_zip_get_last_error(&archive_));
  }

 private:
  mz_zip_archive archive_{};
  bool open_{false};
};

class zip_writer final {
 public:
  zip_writer() = default;
  ~zip_writer() {
    if (open_) {
      mz_zip_writer_end(&archive_);
    }
  }

  zip_writer(const zip_writer&) = delete;
  zip_writer& operator=(const zip_writer&) = delete;

  bool open(const std::filesystem::path& path) {
    open_ = mz_zip_writer_init_file(&archive_, path.string().c_str(), 0) !=
            MZ_FALSE;
    return open_;
  }

  bool finish() {
    auto finalized = mz_zip_writer_finalize_archive(&archive_) != MZ_FALSE;
    auto ended = mz_zip_writer_end(&archive_) != MZ_FALSE;
    open_ = false;
    return finalized && ended;
  }

  mz_zip_archive* get() { return &archive_; }

  std::string last_error() {
    return mz_zip_get_error_string(mz_zip_get_last_error(&archive_));
  }

 private:
  mz_zip_archive archive_{};
  bool open_{false};
};

bool fail(xpii::common::error& error,
          const error_code code,
          std::string message) {
  spdlog::error("{}", message);
  error = xpii::common::make_error(code, std::move(message));
  return false;
}

std::optional<bytes_t> read_file(const std::filesystem::path& path,
                                 crypto::sha256_hasher* hasher) {
  auto stream = std::ifstream{path, std::ios::binary};
  if (!stream) {
    return std::nullopt;
  }
  auto contents = bytes_t{};
  auto buffer = std::array<char, crypto::kStreamChunkSize>{};
  while (stream) {
    stream.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    auto count = static_cast<std::size_t>(stream.gcount());
    if (count == 0) {
      continue;
    }
    auto chunk = std::string_view{buffer.data(), count};
    if (hasher != nullptr) {
      hasher->update(chunk);
    }
    contents.insert(std::end(contents), std::begin(chunk), std::end(chunk));
  }
  if (stream.bad()) {
    return std::nullopt;
  }
  return contents;
}

bool extract_entries(zip_reader& reader,
                     const workspace& files,
                     std::size_t& entry_count,
                     xpii::common::error& error) {
  auto count = mz_zip_reader_get_num_files(reader.get());
  for (auto i = mz_uint{0}; i < count; ++i) {
    auto stat = mz_zip_archive_file_stat{};
    if (mz_zip_reader_file_stat(reader.get(), i, &stat) == MZ_FALSE) {
      return fail(error, error_code::archive_error,
                  fmt::format("cannot stat zip entry {}: {}", i,
                              reader.last_error()));
    }
    auto name = std::string{stat.m_filename};
    if (!is_safe_member_name(name)) {
      return fail(error, error_code::archive_error,
                  fmt::format("unsafe zip entry name '{}'", name));
    }

    auto target = files.part_path(name);
    auto ec = std::error_code{};
    if (mz_zip_reader_is_file_a_directory(reader.get(), i) != MZ_FALSE) {
      std::filesystem::create_directories(target, ec);
      if (ec) {
        return fail(error, error_code::io_error,
                    fmt::format("cannot create '{}': {}", target.string(),
                                ec.message()));
      }
      continue;
    }

    std::filesystem::create_directories(target.parent_path(), ec);
    if (ec) {
      return fail(error, error_code::io_error,
                  fmt::format("cannot create '{}': {}",
                              target.parent_path().string(), ec.message()));
    }
    if (mz_zip_reader_extract_to_file(reader.get(), i, target.string().c_str(),
                                      0) == MZ_FALSE) {
      return fail(error, error_code::archive_error,
                  fmt::format("cannot extract '{}': {}", name,
                              reader.last_error()));
    }
    ++entry_count;
  }
  return true;
}

}  // namespace

bool is_safe_member_name(const std::string_view name) {
  if (name.empty() || name.front() == '/' || name.front() == '\\') {
    return false;
  }
  if (name.size() > 1 && name[1] == ':') {
    return false;
  }
  auto start = std::size_t{0};
  while (start <= name.size()) {
    auto end = name.find_first_of("/\\", start);
    if (end == std::string_view::npos) {
      end = name.size();
    }
    if (name.substr(start, end - start) == "..") {
      return false;
    }
    start = end + 1;
  }
  return true;
}

std::optional<unpacked_package> unpack(
    const std::filesystem::path& source,
    const std::filesystem::path& workspace_root,
    xpii::common::error& error) {
  auto hasher = crypto::sha256_hasher{};
  auto contents = read_file(source, &hasher);
  if (!contents) {
    fail(error, error_code::archive_error,
         fmt::format("cannot read package '{}'", source.string()));
    return std::nullopt;
  }
  auto fingerprint = to_hex(hasher.finalize());

  auto reader = zip_reader{};
  if (!reader.open(*contents)) {
    fail(error, error_code::archive_error,
         fmt::format("'{}' is not a zip container: {}", source.string(),
                     reader.last_error()));
    return std::nullopt;
  }
  if (mz_zip_reader_locate_file(reader.get(),
                                std::string{kContentTypesPart}.c_str(),
                                nullptr, 0) < 0) {
    fail(error, error_code::archive_error,
         fmt::format("'{}' has no {}", source.string(), kContentTypesPart));
    return std::nullopt;
  }

  auto ec = std::error_code{};
  std::filesystem::remove_all(workspace_root, ec);
  if (ec) {
    fail(error, error_code::io_error,
         fmt::format("cannot clear workspace '{}': {}",
                     workspace_root.string(), ec.message()));
    return std::nullopt;
  }
  std::filesystem::create_directories(workspace_root, ec);
  if (ec) {
    fail(error, error_code::io_error,
         fmt::format("cannot create workspace '{}': {}",
                     workspace_root.string(), ec.message()));
    return std::nullopt;
  }

  auto package = unpacked_package{.files = workspace{workspace_root},
                                  .fingerprint = std::move(fingerprint),
                                  .entry_count = 0};
  if (!extract_entries(reader, package.files, package.entry_count, error)) {
    return std::nullopt;
  }

  spdlog::debug("Unpacked '{}' ({} entries, sha256 {}) into '{}'",
                source.string(), package.entry_count, package.fingerprint,
                workspace_root.string());
  return package;
}

std::optional<hex_digest_t> pack(workspace files,
                                 const std::filesystem::path& output,
                                 xpii::common::error& error) {
  auto members = std::vector<std::string>{};
  auto ec = std::error_code{};
  auto iterator = std::filesystem::recursive_directory_iterator{files.root(), ec};
  for (; !ec && iterator != std::filesystem::recursive_directory_iterator{};
       iterator.increment(ec)) {
    auto entry_ec = std::error_code{};
    if (!iterator->is_regular_file(entry_ec)) {
      continue;
    }
    members.push_back(
        iterator->path().lexically_relative(files.root()).generic_string());
  }
  if (ec) {
    fail(error, error_code::io_error,
         fmt::format("cannot walk workspace '{}': {}", files.root().string(),
                     ec.message()));
    return std::nullopt;
  }
  std::ranges::sort(members);

  if (output.has_parent_path()) {
    std::filesystem::create_directories(output.parent_path(), ec);
    if (ec) {
      fail(error, error_code::io_error,
           fmt::format("cannot create '{}': {}",
                       output.parent_path().string(), ec.message()));
      return std::nullopt;
    }
  }

  auto writer = zip_writer{};
  if (!writer.open(output)) {
    fail(error, error_code::io_error,
         fmt::format("cannot create archive '{}': {}", output.string(),
                     writer.last_error()));
    return std::nullopt;
  }

  for (const auto& member : members) {
    auto contents = read_file(files.part_path(member), nullptr);
    if (!contents) {
      fail(error, error_code::io_error,
           fmt::format("cannot read workspace file '{}'", member));
      return std::nullopt;
    }
    auto modified = static_cast<MZ_TIME_T>(kFixedMemberTime);
    if (mz_zip_writer_add_mem_ex_v2(
            writer.get(), member.c_str(), contents->data(), contents->size(),
            nullptr, 0, MZ_DEFAULT_LEVEL, 0, 0, &modified, nullptr, 0,
            nullptr, 0) == MZ_FALSE) {
      fail(error, error_code::io_error,
           fmt::format("cannot add '{}' to '{}': {}", member, output.string(),
                       writer.last_error()));
      return std::nullopt;
    }
  }

  if (!writer.finish()) {
    fail(error, error_code::io_error,
         fmt::format("cannot finalize archive '{}'", output.string()));
    return std::nullopt;
  }

  auto digest = crypto::sha256_file(output);
  if (!digest) {
    fail(error, error_code::io_error,
         fmt::format("cannot read back archive '{}'", output.string()));
    return std::nullopt;
  }
  auto fingerprint = to_hex(*digest);
  spdlog::debug("Packed {} members into '{}' (sha256 {})", members.size(),
                output.string(), fingerprint);
  return fingerprint;
}

bool read_member(const std::filesystem::path& package,
                 const std::string_view member,
                 std::optional<bytes_t>& out,
                 xpii::common::error& error) {
  out.reset();
  auto reader = zip_reader{};
  if (!reader.open(package)) {
    return fail(error, error_code::archive_error,
                fmt::format("'{}' is not a readable zip container: {}",
                            package.string(), reader.last_error()));
  }
  auto index = mz_zip_reader_locate_file(
      reader.get(), std::string{member}.c_str(), nullptr, 0);
  if (index < 0) {
    return true;
  }

  auto size = std::size_t{};
  auto* data = mz_zip_reader_extract_to_heap(
      reader.get(), static_cast<mz_uint>(index), &size, 0);
  if (data == nullptr) {
    return fail(error, error_code::archive_error,
                fmt::format("cannot extract '{}' from '{}': {}", member,
                            package.string(), reader.last_error()));
  }
  auto* begin = static_cast<const uint8_t*>(data);
  out = bytes_t{begin, begin + size};
  mz_free(data);
  return true;
}

std::optional<std::vector<std::string>> list_members(
    const std::filesystem::path& package,
    xpii::common::error& error) {
  auto reader = zip_reader{};
  if (!reader.open(package)) {
    fail(error, error_code::archive_error,
         fmt::format("'{}' is not a readable zip container: {}",
                     package.string(), reader.last_error()));
    return std::nullopt;
  }
  auto names = std::vector<std::string>{};
  auto count = mz_zip_reader_get_num_files(reader.get());
  names.reserve(count);
  for (auto i = mz_uint{0}; i < count; ++i) {
    auto stat = mz_zip_archive_file_stat{};
    if (mz_zip_reader_file_stat(reader.get(), i, &stat) == MZ_FALSE) {
      fail(error, error_code::archive_error,
           fmt::format("cannot stat zip entry {}: {}", i,
                       reader.last_error()));
      return std::nullopt;
    }
    names.emplace_back(stat.m_filename);
  }
  return names;
}

}  // namespace xpii::package
