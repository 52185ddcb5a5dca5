#include "zip_archive.hpp"

#include <zlib.h>

#include <algorithm>
#include <ctime>
#include <limits>
#include <set>

namespace sealer::archive {

namespace {

constexpr uint32_t kLocalHeaderSig   = 0x04034b50;
constexpr uint32_t kCentralHeaderSig = 0x02014b50;
constexpr uint32_t kEndOfCentralSig  = 0x06054b50;

constexpr uint16_t kVersionNeeded = 20;
constexpr uint16_t kVersionMadeBy = (3 << 8) | 20;  // unix, spec 2.0
constexpr uint16_t kFlagUtf8Names = 0x0800;
constexpr uint16_t kFlagEncrypted = 0x0001;
constexpr uint16_t kMethodStored  = 0;
constexpr uint16_t kMethodDeflate = 8;
constexpr uint32_t kUnixFileMode  = 0100644u << 16;

constexpr size_t kLocalHeaderSize   = 30;
constexpr size_t kCentralHeaderSize = 46;
constexpr size_t kEndOfCentralSize  = 22;
constexpr size_t kMaxCommentSize    = 0xFFFF;

constexpr size_t kInflateChunk = 64 * 1024;
// Deflate cannot expand past roughly 1032:1.
constexpr uint64_t kMaxDeflateRatio = 1032;
constexpr uint64_t kDeflateSlack    = 1024;

void PutU16(std::string& out, uint16_t v) {
  out.push_back(static_cast<char>(v & 0xFF));
  out.push_back(static_cast<char>((v >> 8) & 0xFF));
}

void PutU32(std::string& out, uint32_t v) {
  for (int i = 0; i < 4; ++i) {
    out.push_back(static_cast<char>((v >> (8 * i)) & 0xFF));
  }
}

uint16_t GetU16(std::string_view in, size_t pos) {
  return static_cast<uint16_t>(static_cast<uint8_t>(in[pos]) | (static_cast<uint8_t>(in[pos + 1]) << 8));
}

uint32_t GetU32(std::string_view in, size_t pos) {
  uint32_t v = 0;
  for (int i = 3; i >= 0; --i) {
    v = (v << 8) | static_cast<uint8_t>(in[pos + static_cast<size_t>(i)]);
  }
  return v;
}

uint32_t Crc32(std::string_view data) {
  return static_cast<uint32_t>(crc32(0L, reinterpret_cast<const Bytef*>(data.data()), static_cast<uInt>(data.size())));
}

struct DosDateTime {
  uint16_t time = 0;
  uint16_t date = (1 << 5) | 1;  // 1980-01-01
};

DosDateTime ToDosDateTime(util::TimePoint tp) {
  const std::time_t t = util::Clock::to_time_t(tp);
  std::tm           utc{};
  if (gmtime_r(&t, &utc) == nullptr || utc.tm_year + 1900 < 1980 || utc.tm_year + 1900 > 2107) {
    return {};
  }
  DosDateTime out;
  out.time = static_cast<uint16_t>((utc.tm_hour << 11) | (utc.tm_min << 5) | (utc.tm_sec / 2));
  out.date = static_cast<uint16_t>(((utc.tm_year + 1900 - 1980) << 9) | ((utc.tm_mon + 1) << 5) | utc.tm_mday);
  return out;
}

// Raw deflate (no zlib header), as zip method 8 requires.
std::string Deflate(std::string_view data) {
  z_stream strm{};
  if (deflateInit2(&strm, 6, Z_DEFLATED, -15, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
    throw std::runtime_error("deflateInit2 failed");
  }

  std::string out(deflateBound(&strm, static_cast<uLong>(data.size())), '\0');
  strm.next_in   = reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));
  strm.avail_in  = static_cast<uInt>(data.size());
  strm.next_out  = reinterpret_cast<Bytef*>(out.data());
  strm.avail_out = static_cast<uInt>(out.size());

  const int ret = deflate(&strm, Z_FINISH);
  const auto produced = strm.total_out;
  deflateEnd(&strm);
  if (ret != Z_STREAM_END) {
    throw std::runtime_error("deflate failed");
  }
  out.resize(produced);
  return out;
}

std::string Inflate(std::string_view data, size_t expected_size, const std::string& path) {
  z_stream strm{};
  if (inflateInit2(&strm, -15) != Z_OK) {
    throw std::runtime_error("inflateInit2 failed");
  }
  strm.next_in  = reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));
  strm.avail_in = static_cast<uInt>(data.size());

  // Output grows with what the stream actually produces, never with the declared size.
  std::string out;
  int         ret = Z_OK;
  while (ret != Z_STREAM_END) {
    const size_t used = out.size();
    out.resize(used + kInflateChunk);
    strm.next_out  = reinterpret_cast<Bytef*>(out.data() + used);
    strm.avail_out = static_cast<uInt>(kInflateChunk);

    ret = inflate(&strm, Z_NO_FLUSH);
    out.resize(used + (kInflateChunk - strm.avail_out));
    if ((ret != Z_OK && ret != Z_STREAM_END) || (ret == Z_OK && strm.avail_in == 0 && strm.avail_out != 0) ||
        out.size() > expected_size) {
      inflateEnd(&strm);
      throw ArchiveFormatError("corrupt deflate stream for entry: " + path);
    }
  }
  inflateEnd(&strm);

  if (out.size() != expected_size) {
    throw ArchiveFormatError("corrupt deflate stream for entry: " + path);
  }
  return out;
}

struct PendingEntry {
  std::string_view path;
  std::string_view data;
};

struct CentralRecord {
  std::string path;
  uint16_t    method = 0;
  uint32_t    crc    = 0;
  uint32_t    compressed_size = 0;
  uint32_t    size   = 0;
  uint32_t    offset = 0;
};

void CheckFits(size_t value, const std::string& what) {
  if (value > std::numeric_limits<uint32_t>::max()) {
    throw std::invalid_argument(what + " exceeds the 4 GiB zip limit");
  }
}

} // namespace

const ArchiveEntry* ArchiveContents::Find(std::string_view path) const {
  for (const auto& entry : entries) {
    if (entry.path == path) {
      return &entry;
    }
  }
  return nullptr;
}

std::optional<std::string> CheckEntryPath(std::string_view path) {
  if (path.empty()) {
    return "path is empty";
  }
  if (path.size() > 0xFFFF) {
    return "path is too long";
  }
  if (path.front() == '/') {
    return "path must be relative";
  }
  if (path.find('\\') != std::string_view::npos) {
    return "path must use '/' separators";
  }
  if (path.find('\0') != std::string_view::npos) {
    return "path contains NUL";
  }
  if (path == manifest::kManifestFileName || path == manifest::kSignatureFileName) {
    return "path is reserved for the bundle manifest";
  }

  size_t start = 0;
  while (start <= path.size()) {
    const size_t     end     = std::min(path.find('/', start), path.size());
    std::string_view segment = path.substr(start, end - start);
    if (segment.empty()) {
      return "path has an empty segment";
    }
    if (segment == "." || segment == "..") {
      return "path may not contain '.' or '..' segments";
    }
    start = end + 1;
  }
  return std::nullopt;
}

std::string BuildArchive(const std::vector<manifest::BundleFile>& files, std::string_view manifest_json,
                         std::string_view signature, util::TimePoint modified_at) {
  std::vector<PendingEntry> pending;
  pending.reserve(files.size() + 2);
  for (const auto& file : files) {
    pending.push_back({file.path, file.data});
  }
  pending.push_back({manifest::kManifestFileName, manifest_json});
  pending.push_back({manifest::kSignatureFileName, signature});

  if (pending.size() > 0xFFFF) {
    throw std::invalid_argument("too many files for a zip archive");
  }

  const DosDateTime stamp = ToDosDateTime(modified_at);

  std::string                out;
  std::vector<CentralRecord> central;
  central.reserve(pending.size());

  for (const auto& entry : pending) {
    CheckFits(entry.data.size(), "entry " + std::string(entry.path));
    CheckFits(out.size(), "archive");

    CentralRecord record;
    record.path   = std::string(entry.path);
    record.crc    = Crc32(entry.data);
    record.size   = static_cast<uint32_t>(entry.data.size());
    record.offset = static_cast<uint32_t>(out.size());

    std::string deflated;
    if (!entry.data.empty()) {
      deflated = Deflate(entry.data);
    }
    const bool       use_deflate = !entry.data.empty() && deflated.size() < entry.data.size();
    std::string_view body        = use_deflate ? std::string_view(deflated) : entry.data;
    record.method                = use_deflate ? kMethodDeflate : kMethodStored;
    record.compressed_size       = static_cast<uint32_t>(body.size());

    PutU32(out, kLocalHeaderSig);
    PutU16(out, kVersionNeeded);
    PutU16(out, kFlagUtf8Names);
    PutU16(out, record.method);
    PutU16(out, stamp.time);
    PutU16(out, stamp.date);
    PutU32(out, record.crc);
    PutU32(out, record.compressed_size);
    PutU32(out, record.size);
    PutU16(out, static_cast<uint16_t>(record.path.size()));
    PutU16(out, 0);
    out += record.path;
    out.append(body.data(), body.size());

    central.push_back(std::move(record));
  }

  CheckFits(out.size(), "archive");
  const auto central_offset = static_cast<uint32_t>(out.size());
  for (const auto& record : central) {
    PutU32(out, kCentralHeaderSig);
    PutU16(out, kVersionMadeBy);
    PutU16(out, kVersionNeeded);
    PutU16(out, kFlagUtf8Names);
    PutU16(out, record.method);
    PutU16(out, stamp.time);
    PutU16(out, stamp.date);
    PutU32(out, record.crc);
    PutU32(out, record.compressed_size);
    PutU32(out, record.size);
    PutU16(out, static_cast<uint16_t>(record.path.size()));
    PutU16(out, 0);  // extra
    PutU16(out, 0);  // comment
    PutU16(out, 0);  // disk
    PutU16(out, 0);  // internal attrs
    PutU32(out, kUnixFileMode);
    PutU32(out, record.offset);
    out += record.path;
  }
  CheckFits(out.size(), "archive");
  const auto central_size = static_cast<uint32_t>(out.size() - central_offset);

  PutU32(out, kEndOfCentralSig);
  PutU16(out, 0);
  PutU16(out, 0);
  PutU16(out, static_cast<uint16_t>(central.size()));
  PutU16(out, static_cast<uint16_t>(central.size()));
  PutU32(out, central_size);
  PutU32(out, central_offset);
  PutU16(out, 0);

  return out;
}

ArchiveContents ReadArchive(std::string_view archive) {
  if (archive.size() < kEndOfCentralSize) {
    throw ArchiveFormatError("archive is too small to be a zip file");
  }

  // End of central directory: the last 22 bytes plus an optional comment.
  size_t eocd  = std::string_view::npos;
  size_t floor = archive.size() > kEndOfCentralSize + kMaxCommentSize ? archive.size() - kEndOfCentralSize - kMaxCommentSize : 0;
  for (size_t pos = archive.size() - kEndOfCentralSize + 1; pos-- > floor;) {
    if (GetU32(archive, pos) == kEndOfCentralSig && pos + kEndOfCentralSize + GetU16(archive, pos + 20) == archive.size()) {
      eocd = pos;
      break;
    }
  }
  if (eocd == std::string_view::npos) {
    throw ArchiveFormatError("end of central directory not found");
  }

  const uint16_t disk           = GetU16(archive, eocd + 4);
  const uint16_t central_disk   = GetU16(archive, eocd + 6);
  const uint16_t disk_entries   = GetU16(archive, eocd + 8);
  const uint16_t total_entries  = GetU16(archive, eocd + 10);
  const uint32_t central_size   = GetU32(archive, eocd + 12);
  const uint32_t central_offset = GetU32(archive, eocd + 16);
  if (disk != 0 || central_disk != 0 || disk_entries != total_entries) {
    throw ArchiveFormatError("multi-disk archives are not supported");
  }
  if (total_entries == 0xFFFF || central_offset == 0xFFFFFFFF || central_size == 0xFFFFFFFF) {
    throw ArchiveFormatError("zip64 archives are not supported");
  }
  if (static_cast<uint64_t>(central_offset) + central_size > eocd) {
    throw ArchiveFormatError("central directory lies outside the archive");
  }

  ArchiveContents       contents;
  std::set<std::string> seen;
  size_t                pos = central_offset;
  for (uint16_t i = 0; i < total_entries; ++i) {
    if (pos + kCentralHeaderSize > eocd || GetU32(archive, pos) != kCentralHeaderSig) {
      throw ArchiveFormatError("corrupt central directory entry");
    }
    const uint16_t flags       = GetU16(archive, pos + 8);
    const uint16_t method      = GetU16(archive, pos + 10);
    const uint32_t crc         = GetU32(archive, pos + 16);
    const uint32_t csize       = GetU32(archive, pos + 20);
    const uint32_t usize       = GetU32(archive, pos + 24);
    const uint16_t name_len    = GetU16(archive, pos + 28);
    const uint16_t extra_len   = GetU16(archive, pos + 30);
    const uint16_t comment_len = GetU16(archive, pos + 32);
    const uint32_t local       = GetU32(archive, pos + 42);

    const size_t next = pos + kCentralHeaderSize + name_len + extra_len + comment_len;
    if (next > eocd) {
      throw ArchiveFormatError("central directory entry overruns the directory");
    }
    std::string path(archive.substr(pos + kCentralHeaderSize, name_len));
    pos = next;

    if (flags & kFlagEncrypted) {
      throw ArchiveFormatError("encrypted entries are not supported: " + path);
    }
    if (method != kMethodStored && method != kMethodDeflate) {
      throw ArchiveFormatError("unsupported compression method for entry: " + path);
    }
    if (!seen.insert(path).second) {
      throw ArchiveFormatError("duplicate entry: " + path);
    }

    if (static_cast<uint64_t>(local) + kLocalHeaderSize > central_offset || GetU32(archive, local) != kLocalHeaderSig) {
      throw ArchiveFormatError("bad local header for entry: " + path);
    }
    const uint16_t local_name_len  = GetU16(archive, local + 26);
    const uint16_t local_extra_len = GetU16(archive, local + 28);
    const size_t   data_start      = local + kLocalHeaderSize + local_name_len + local_extra_len;
    if (data_start + csize > central_offset) {
      throw ArchiveFormatError("entry data overruns the archive: " + path);
    }
    if (archive.substr(local + kLocalHeaderSize, local_name_len) != path) {
      throw ArchiveFormatError("local and central names differ for entry: " + path);
    }

    // Directory entries written by other tools carry no content.
    if (!path.empty() && path.back() == '/') {
      continue;
    }

    std::string_view body = archive.substr(data_start, csize);
    std::string      data;
    if (method == kMethodStored) {
      if (csize != usize) {
        throw ArchiveFormatError("stored entry size mismatch: " + path);
      }
      data.assign(body.data(), body.size());
    } else {
      if (usize > static_cast<uint64_t>(csize) * kMaxDeflateRatio + kDeflateSlack) {
        throw ArchiveFormatError("declared size is out of reach of the deflate data for entry: " + path);
      }
      data = Inflate(body, usize, path);
    }

    const bool crc_matches = Crc32(data) == crc;
    contents.entries.push_back({std::move(path), std::move(data), crc_matches});
  }

  return contents;
}

} // namespace sealer::archive
