#include "collaborators/zip_writer.hpp"

#include "core/fs_utils.hpp"

#include <algorithm>
#include <array>
#include <cstdint>
#include <fstream>
#include <string>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace distrun::collaborators {

namespace {

constexpr std::uint32_t kLocalFileHeaderSignature = 0x04034b50U;
constexpr std::uint32_t kCentralDirectoryHeaderSignature = 0x02014b50U;
constexpr std::uint32_t kEndOfCentralDirectorySignature = 0x06054b50U;
constexpr std::uint16_t kZipVersion = 20; // 2.0
constexpr std::uint16_t kCompressionMethodStore = 0;
constexpr std::uint64_t kZip32Limit = 0xFFFFFFFFULL;

struct ZipEntry {
  fs::path source;
  std::string name;
  std::uint32_t crc32 = 0;
  std::uint32_t size_bytes = 0;
  std::uint32_t local_header_offset = 0;
};

const std::array<std::uint32_t, 256>& Crc32Table() {
  static const std::array<std::uint32_t, 256> table = [] {
    std::array<std::uint32_t, 256> generated{};
    for (std::uint32_t i = 0; i < 256U; ++i) {
      std::uint32_t c = i;
      for (int bit = 0; bit < 8; ++bit) {
        c = ((c & 1U) != 0U) ? (0xEDB88320U ^ (c >> 1)) : (c >> 1);
      }
      generated[i] = c;
    }
    return generated;
  }();
  return table;
}

// Little-endian record writer over the output stream. Tracks the first
// failure so callers can check once per record.
class ZipStream {
public:
  explicit ZipStream(std::ofstream& out) : out_(out) {}

  void U16(std::uint16_t value) {
    const std::array<char, 2> bytes = {
        static_cast<char>(value & 0xFFU),
        static_cast<char>((value >> 8) & 0xFFU),
    };
    out_.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
  }

  void U32(std::uint32_t value) {
    const std::array<char, 4> bytes = {
        static_cast<char>(value & 0xFFU),
        static_cast<char>((value >> 8) & 0xFFU),
        static_cast<char>((value >> 16) & 0xFFU),
        static_cast<char>((value >> 24) & 0xFFU),
    };
    out_.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
  }

  void Bytes(const std::string& text) {
    out_.write(text.data(), static_cast<std::streamsize>(text.size()));
  }

  bool Offset(std::uint32_t& offset) {
    const std::streamoff position = out_.tellp();
    if (position < 0 || static_cast<std::uint64_t>(position) > kZip32Limit) {
      return false;
    }
    offset = static_cast<std::uint32_t>(position);
    return true;
  }

  bool Good() const {
    return static_cast<bool>(out_);
  }

  std::ofstream& Raw() {
    return out_;
  }

private:
  std::ofstream& out_;
};

// Streams `path` in fixed-size chunks. With `out` null only the checksum and
// size are computed.
bool StreamFile(const fs::path& path, std::ofstream* out, std::uint32_t& crc32,
                std::uint64_t& size_bytes, std::string& error) {
  std::ifstream in_file(path, std::ios::binary);
  if (!in_file) {
    error = "failed to open file for archiving: " + path.string();
    return false;
  }

  const auto& table = Crc32Table();
  std::uint32_t crc = 0xFFFFFFFFU;
  size_bytes = 0;
  std::array<char, 8192> buffer{};
  while (in_file.good()) {
    in_file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    const std::streamsize read_count = in_file.gcount();
    if (read_count <= 0) {
      continue;
    }
    for (std::streamsize i = 0; i < read_count; ++i) {
      const auto byte = static_cast<std::uint8_t>(buffer[static_cast<std::size_t>(i)]);
      crc = table[(crc ^ byte) & 0xFFU] ^ (crc >> 8);
    }
    size_bytes += static_cast<std::uint64_t>(read_count);
    if (out != nullptr) {
      out->write(buffer.data(), read_count);
      if (!*out) {
        error = "failed while writing archive payload for file: " + path.string();
        return false;
      }
    }
  }

  if (!in_file.eof()) {
    error = "failed while reading file for archiving: " + path.string();
    return false;
  }
  crc32 = crc ^ 0xFFFFFFFFU;
  return true;
}

bool CollectEntries(const fs::path& source_dir, std::vector<ZipEntry>& entries,
                    std::string& error) {
  std::error_code ec;
  if (!fs::is_directory(source_dir, ec) || ec) {
    error = "archive source is not a directory: " + source_dir.string();
    return false;
  }

  const std::string top_level = source_dir.filename().string();
  if (top_level.empty()) {
    error = "archive source directory must have a name: " + source_dir.string();
    return false;
  }

  std::vector<fs::path> files;
  for (const auto& entry : fs::recursive_directory_iterator(source_dir, ec)) {
    std::error_code type_ec;
    if (entry.is_regular_file(type_ec)) {
      files.push_back(entry.path());
    }
  }
  if (ec) {
    error = "failed while enumerating archive source: " + source_dir.string();
    return false;
  }
  std::sort(files.begin(), files.end());

  entries.clear();
  entries.reserve(files.size());
  for (const auto& path : files) {
    ZipEntry entry;
    entry.source = path;
    entry.name = top_level + "/" + path.lexically_relative(source_dir).generic_string();
    if (entry.name.size() > 0xFFFFU) {
      error = "archive entry name too long: " + entry.name;
      return false;
    }

    std::uint64_t size = 0;
    if (!StreamFile(path, nullptr, entry.crc32, size, error)) {
      return false;
    }
    if (size > kZip32Limit) {
      error = "file too large for zip32 support: " + path.string();
      return false;
    }
    entry.size_bytes = static_cast<std::uint32_t>(size);
    entries.push_back(std::move(entry));
  }

  if (entries.size() > 0xFFFFU) {
    error = "too many files for zip32 support";
    return false;
  }
  return true;
}

bool WriteEntries(std::vector<ZipEntry>& entries, ZipStream& zip, std::string& error) {
  for (auto& entry : entries) {
    if (!zip.Offset(entry.local_header_offset)) {
      error = "zip offset overflow while writing local file headers";
      return false;
    }

    zip.U32(kLocalFileHeaderSignature);
    zip.U16(kZipVersion);
    zip.U16(0); // general purpose bit flag
    zip.U16(kCompressionMethodStore);
    zip.U16(0); // last mod file time
    zip.U16(0); // last mod file date
    zip.U32(entry.crc32);
    zip.U32(entry.size_bytes); // compressed size (store)
    zip.U32(entry.size_bytes); // uncompressed size
    zip.U16(static_cast<std::uint16_t>(entry.name.size()));
    zip.U16(0); // extra field length
    zip.Bytes(entry.name);
    if (!zip.Good()) {
      error = "failed while writing zip local file header";
      return false;
    }

    std::uint32_t crc_again = 0;
    std::uint64_t size_again = 0;
    if (!StreamFile(entry.source, &zip.Raw(), crc_again, size_again, error)) {
      return false;
    }
    if (crc_again != entry.crc32 || size_again != entry.size_bytes) {
      error = "file changed while archiving: " + entry.source.string();
      return false;
    }
  }
  return true;
}

bool WriteCentralDirectory(const std::vector<ZipEntry>& entries, ZipStream& zip,
                           std::string& error) {
  std::uint32_t directory_offset = 0;
  if (!zip.Offset(directory_offset)) {
    error = "zip central directory offset overflow";
    return false;
  }

  for (const auto& entry : entries) {
    zip.U32(kCentralDirectoryHeaderSignature);
    zip.U16(kZipVersion); // version made by
    zip.U16(kZipVersion); // version needed to extract
    zip.U16(0);           // general purpose bit flag
    zip.U16(kCompressionMethodStore);
    zip.U16(0); // last mod file time
    zip.U16(0); // last mod file date
    zip.U32(entry.crc32);
    zip.U32(entry.size_bytes);
    zip.U32(entry.size_bytes);
    zip.U16(static_cast<std::uint16_t>(entry.name.size()));
    zip.U16(0); // extra field length
    zip.U16(0); // file comment length
    zip.U16(0); // disk number start
    zip.U16(0); // internal file attributes
    zip.U32(0); // external file attributes
    zip.U32(entry.local_header_offset);
    zip.Bytes(entry.name);
  }

  std::uint32_t directory_end = 0;
  if (!zip.Offset(directory_end)) {
    error = "zip central directory size overflow";
    return false;
  }

  zip.U32(kEndOfCentralDirectorySignature);
  zip.U16(0); // number of this disk
  zip.U16(0); // disk where the central directory starts
  zip.U16(static_cast<std::uint16_t>(entries.size()));
  zip.U16(static_cast<std::uint16_t>(entries.size()));
  zip.U32(directory_end - directory_offset);
  zip.U32(directory_offset);
  zip.U16(0); // comment length

  if (!zip.Good()) {
    error = "failed while writing zip central directory";
    return false;
  }
  return true;
}

} // namespace

bool WriteZipArchive(const fs::path& source_dir, const fs::path& archive_path,
                     std::string& error) {
  if (source_dir.empty() || archive_path.empty()) {
    error = "archive source and output paths cannot be empty";
    return false;
  }

  std::vector<ZipEntry> entries;
  if (!CollectEntries(source_dir, entries, error)) {
    return false;
  }

  const fs::path temp_path = core::MakeTempSiblingPath(archive_path);
  bool written = false;
  {
    std::ofstream out_file(temp_path, std::ios::binary | std::ios::trunc);
    if (!out_file) {
      error = "failed to open archive output: " + temp_path.string();
      return false;
    }
    ZipStream zip(out_file);
    written = WriteEntries(entries, zip, error) && WriteCentralDirectory(entries, zip, error);
    out_file.close();
    if (written && !out_file) {
      error = "failed while finalizing archive: " + temp_path.string();
      written = false;
    }
  }

  if (written && core::RenameReplacing(temp_path, archive_path, error)) {
    return true;
  }

  std::error_code cleanup_ec;
  (void)fs::remove(temp_path, cleanup_ec);
  return false;
}

} // namespace distrun::collaborators
