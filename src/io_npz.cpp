// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * io_npz.cpp
 *
 * Scene archives as numpy writes them: ZIP (STORE) of .npy entries.
 */

#include "icearea/io/npz.hpp"

#include <spdlog/spdlog.h>

#include <array>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <sstream>
#include <vector>

namespace icearea {
namespace io {

namespace detail {

constexpr int kMetadataVersion = 1;

// ─── CRC32 ──────────────────────────────────────────────────────────────────

constexpr std::array<uint32_t, 256> buildCrc32Table() {
  std::array<uint32_t, 256> table{};
  for (uint32_t i = 0; i < 256; ++i) {
    uint32_t c = i;
    for (int k = 0; k < 8; ++k) c = (c & 1) ? 0xEDB88320u ^ (c >> 1) : c >> 1;
    table[i] = c;
  }
  return table;
}

static constexpr auto kCrc32Table = buildCrc32Table();

uint32_t crc32(const std::vector<char>& bytes) {
  uint32_t crc = 0xFFFFFFFFu;
  for (char ch : bytes) {
    crc = kCrc32Table[(crc ^ static_cast<uint8_t>(ch)) & 0xFF] ^ (crc >> 8);
  }
  return crc ^ 0xFFFFFFFFu;
}

// ─── Little-endian helpers ──────────────────────────────────────────────────

template <typename T>
void putLE(std::ostream& os, T v) {
  for (size_t i = 0; i < sizeof(T); ++i) {
    os.put(static_cast<char>((static_cast<uint64_t>(v) >> (8 * i)) & 0xFF));
  }
}

template <typename T>
T getLE(std::istream& is) {
  uint8_t b[sizeof(T)] = {};
  is.read(reinterpret_cast<char*>(b), sizeof(T));
  uint64_t v = 0;
  for (size_t i = 0; i < sizeof(T); ++i) v |= static_cast<uint64_t>(b[i]) << (8 * i);
  return static_cast<T>(v);
}

// ─── ZIP (STORE) ────────────────────────────────────────────────────────────

constexpr uint32_t kLocalSig = 0x04034b50;
constexpr uint32_t kCentralSig = 0x02014b50;
constexpr uint32_t kEndSig = 0x06054b50;

class ZipWriter {
 public:
  explicit ZipWriter(std::ostream& os) : os_(os) {}

  void add(const std::string& name, const std::vector<char>& bytes) {
    Entry e{name, crc32(bytes), static_cast<uint32_t>(bytes.size()),
            static_cast<uint32_t>(os_.tellp())};
    putLE<uint32_t>(os_, kLocalSig);
    writeCommon(e);
    putLE<uint16_t>(os_, 0);  // extra field length
    os_.write(e.name.data(), e.name.size());
    os_.write(bytes.data(), bytes.size());
    entries_.push_back(std::move(e));
  }

  void finish() {
    const auto cd_offset = static_cast<uint32_t>(os_.tellp());
    for (const auto& e : entries_) {
      putLE<uint32_t>(os_, kCentralSig);
      putLE<uint16_t>(os_, 20);  // version made by
      writeCommon(e);
      putLE<uint16_t>(os_, 0);  // extra field length
      putLE<uint16_t>(os_, 0);  // comment length
      putLE<uint16_t>(os_, 0);  // disk number
      putLE<uint16_t>(os_, 0);  // internal attributes
      putLE<uint32_t>(os_, 0);  // external attributes
      putLE<uint32_t>(os_, e.offset);
      os_.write(e.name.data(), e.name.size());
    }
    const auto cd_size = static_cast<uint32_t>(os_.tellp()) - cd_offset;
    const auto count = static_cast<uint16_t>(entries_.size());

    putLE<uint32_t>(os_, kEndSig);
    putLE<uint16_t>(os_, 0);  // disk number
    putLE<uint16_t>(os_, 0);  // disk with central directory
    putLE<uint16_t>(os_, count);
    putLE<uint16_t>(os_, count);
    putLE<uint32_t>(os_, cd_size);
    putLE<uint32_t>(os_, cd_offset);
    putLE<uint16_t>(os_, 0);  // comment length
  }

 private:
  struct Entry {
    std::string name;
    uint32_t crc;
    uint32_t size;
    uint32_t offset;
  };

  // Fields shared by local and central headers, up to the filename length
  void writeCommon(const Entry& e) {
    putLE<uint16_t>(os_, 20);  // version needed
    putLE<uint16_t>(os_, 0);   // flags
    putLE<uint16_t>(os_, 0);   // compression: STORE
    putLE<uint16_t>(os_, 0);   // mod time
    putLE<uint16_t>(os_, 0);   // mod date
    putLE<uint32_t>(os_, e.crc);
    putLE<uint32_t>(os_, e.size);  // compressed
    putLE<uint32_t>(os_, e.size);  // uncompressed
    putLE<uint16_t>(os_, static_cast<uint16_t>(e.name.size()));
  }

  std::ostream& os_;
  std::vector<Entry> entries_;
};

struct ZipEntry {
  std::string name;
  std::vector<char> data;
};

// Reads local headers sequentially; entries must be STOREd.
bool readZipEntries(std::istream& is, std::vector<ZipEntry>& entries) {
  constexpr size_t kMaxEntries = 64;
  constexpr uint64_t kMaxEntrySize = 2'000'000'000u;

  while (entries.size() < kMaxEntries) {
    const auto sig = getLE<uint32_t>(is);
    if (is.fail() || sig != kLocalSig) break;

    is.ignore(2);  // version needed
    is.ignore(2);  // flags
    const auto compression = getLE<uint16_t>(is);
    is.ignore(8);  // time, date, crc
    uint64_t compressed_size = getLE<uint32_t>(is);
    uint64_t size = getLE<uint32_t>(is);
    const auto name_len = getLE<uint16_t>(is);
    const auto extra_len = getLE<uint16_t>(is);
    if (is.fail()) return false;

    std::string name(name_len, '\0');
    is.read(&name[0], name_len);
    std::string extra(extra_len, '\0');
    is.read(&extra[0], extra_len);

    // numpy.savez forces ZIP64: real sizes live in extra field 0x0001
    if (size == 0xFFFFFFFFu || compressed_size == 0xFFFFFFFFu) {
      std::istringstream ex(extra);
      while (ex) {
        const auto tag = getLE<uint16_t>(ex);
        const auto len = getLE<uint16_t>(ex);
        if (ex.fail()) break;
        if (tag == 0x0001 && len >= 16) {
          size = getLE<uint64_t>(ex);
          compressed_size = getLE<uint64_t>(ex);
          break;
        }
        ex.ignore(len);
      }
    }

    if (compression != 0 || compressed_size != size) {
      spdlog::error("[npz_io] Entry '{}' is compressed (method {}); save with "
                    "numpy.savez, not savez_compressed",
                    name, compression);
      return false;
    }
    if (size > kMaxEntrySize) {
      spdlog::error("[npz_io] Entry '{}' too large ({} bytes)", name, size);
      return false;
    }

    std::vector<char> data(size);
    is.read(data.data(), size);
    if (is.fail()) {
      spdlog::error("[npz_io] Truncated data for entry '{}'", name);
      return false;
    }
    entries.push_back({std::move(name), std::move(data)});
  }
  return !entries.empty();
}

// ─── NumPy .npy format ──────────────────────────────────────────────────────

std::vector<char> buildNpy(const std::string& descr, bool fortran_order,
                           const std::string& shape, const char* data,
                           size_t bytes) {
  std::string dict = "{'descr': '" + descr + "', 'fortran_order': " +
                     (fortran_order ? "True" : "False") +
                     ", 'shape': " + shape + ", }";

  // Magic(6) + version(2) + header_len(2) + dict + '\n' is 64-byte aligned
  constexpr size_t kPrefix = 10;
  const size_t rem = (kPrefix + dict.size() + 1) % 64;
  if (rem != 0) dict.append(64 - rem, ' ');
  dict.push_back('\n');
  const auto header_len = static_cast<uint16_t>(dict.size());

  std::vector<char> buf = {'\x93', 'N', 'U', 'M', 'P', 'Y', '\x01', '\x00'};
  buf.reserve(kPrefix + header_len + bytes);
  buf.push_back(static_cast<char>(header_len & 0xFF));
  buf.push_back(static_cast<char>((header_len >> 8) & 0xFF));
  buf.insert(buf.end(), dict.begin(), dict.end());
  buf.insert(buf.end(), data, data + bytes);
  return buf;
}

std::vector<char> buildNpyArray(const Eigen::MatrixXf& m) {
  // Eigen default storage is column-major = Fortran order
  std::ostringstream shape;
  shape << "(" << m.rows() << ", " << m.cols() << ")";
  return buildNpy("<f4", true, shape.str(),
                  reinterpret_cast<const char*>(m.data()),
                  static_cast<size_t>(m.size()) * sizeof(float));
}

std::vector<char> buildNpyString(const std::string& str) {
  return buildNpy("|S" + std::to_string(str.size()), false, "()", str.data(),
                  str.size());
}

struct NpyInfo {
  enum class Type { Unknown, Float32, Float64, String } type = Type::Unknown;
  bool fortran_order = false;
  int rows = 0;
  int cols = 0;
  size_t string_len = 0;   ///< Characters
  size_t char_size = 1;    ///< 1 for '|S' bytes, 4 for '<U' UTF-32LE
  size_t data_offset = 0;

  size_t stringBytes() const { return string_len * char_size; }
};

// Decimal length of a '|S<n>' / '<U<n>' descr
bool parseLength(const std::string& digits, size_t& out) {
  if (digits.empty() || !std::isdigit(static_cast<unsigned char>(digits[0]))) {
    return false;
  }
  char* end = nullptr;
  const unsigned long v = std::strtoul(digits.c_str(), &end, 10);
  if (end != digits.c_str() + digits.size()) return false;
  out = static_cast<size_t>(v);
  return true;
}

bool parseNpyHeader(const std::vector<char>& buf, NpyInfo& info) {
  if (buf.size() < 10 || std::memcmp(buf.data(), "\x93NUMPY", 6) != 0) {
    return false;
  }
  // v1.0 has a 2-byte header length, v2.0/v3.0 a 4-byte one
  const int major = static_cast<uint8_t>(buf[6]);
  size_t header_len = 0;
  size_t prefix = 0;
  auto byte = [&](size_t i) { return static_cast<size_t>(static_cast<uint8_t>(buf[i])); };
  if (major == 1) {
    header_len = byte(8) | (byte(9) << 8);
    prefix = 10;
  } else if (buf.size() >= 12) {
    header_len = byte(8) | (byte(9) << 8) | (byte(10) << 16) | (byte(11) << 24);
    prefix = 12;
  } else {
    return false;
  }
  info.data_offset = prefix + header_len;
  if (info.data_offset > buf.size()) return false;

  const std::string dict(buf.data() + prefix, header_len);
  info.fortran_order = dict.find("'fortran_order': True") != std::string::npos;

  if (dict.find("'<f4'") != std::string::npos) {
    info.type = NpyInfo::Type::Float32;
  } else if (dict.find("'<f8'") != std::string::npos) {
    info.type = NpyInfo::Type::Float64;
  } else if (auto s = dict.find("'|S"), u = dict.find("'<U");
             s != std::string::npos || u != std::string::npos) {
    const auto start = s != std::string::npos ? s : u;
    const auto end = dict.find('\'', start + 3);
    if (end == std::string::npos) return false;
    info.type = NpyInfo::Type::String;
    info.char_size = s != std::string::npos ? 1 : 4;
    return parseLength(dict.substr(start + 3, end - start - 3),
                       info.string_len);
  } else {
    return false;
  }

  // Shape: (rows, cols) for channel arrays
  const auto shape_pos = dict.find("'shape'");
  if (shape_pos == std::string::npos) return false;
  const auto open = dict.find('(', shape_pos);
  const auto close = dict.find(')', open);
  if (open == std::string::npos || close == std::string::npos) return false;
  std::istringstream shape(dict.substr(open + 1, close - open - 1));
  char comma = 0;
  if (!(shape >> info.rows >> comma >> info.cols) || comma != ',') return false;
  return info.rows > 0 && info.cols > 0;
}

template <typename T>
Eigen::MatrixXf decodeArray(const std::vector<char>& buf, const NpyInfo& info) {
  std::vector<T> values(static_cast<size_t>(info.rows) * info.cols);
  std::memcpy(values.data(), buf.data() + info.data_offset,
              values.size() * sizeof(T));
  using ColMajor = Eigen::Matrix<T, Eigen::Dynamic, Eigen::Dynamic>;
  using RowMajor =
      Eigen::Matrix<T, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
  if (info.fortran_order) {
    return Eigen::Map<const ColMajor>(values.data(), info.rows, info.cols)
        .template cast<float>();
  }
  return Eigen::Map<const RowMajor>(values.data(), info.rows, info.cols)
      .template cast<float>();
}

// String payload as UTF-8 ('<U' arrays are UTF-32LE code points)
std::string decodeString(const std::vector<char>& buf, const NpyInfo& info) {
  const char* data = buf.data() + info.data_offset;
  if (info.char_size == 1) return std::string(data, info.string_len);

  std::string out;
  out.reserve(info.string_len);
  for (size_t i = 0; i < info.string_len; ++i) {
    uint32_t cp = 0;
    for (int b = 0; b < 4; ++b) {
      cp |= static_cast<uint32_t>(static_cast<uint8_t>(data[4 * i + b]))
            << (8 * b);
    }
    if (cp == 0) break;  // numpy pads short strings with NUL
    if (cp < 0x80) {
      out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
      out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
      out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
      out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
      out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
      out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
      out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
      out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
      out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
      out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
  }
  return out;
}

// 2-D float32/float64 array entry; false (with a log) if unusable
bool readArray(const ZipEntry& e, Eigen::MatrixXf& values) {
  NpyInfo info;
  if (!parseNpyHeader(e.data, info) ||
      (info.type != NpyInfo::Type::Float32 &&
       info.type != NpyInfo::Type::Float64)) {
    spdlog::error("[npz_io] '{}' is not a 2-D float32/float64 array", e.name);
    return false;
  }
  const size_t elem =
      info.type == NpyInfo::Type::Float32 ? sizeof(float) : sizeof(double);
  const size_t bytes = static_cast<size_t>(info.rows) * info.cols * elem;
  if (info.data_offset + bytes > e.data.size()) {
    spdlog::error("[npz_io] Truncated array '{}'", e.name);
    return false;
  }
  values = info.type == NpyInfo::Type::Float32
               ? decodeArray<float>(e.data, info)
               : decodeArray<double>(e.data, info);
  return true;
}

// ─── Metadata JSON ──────────────────────────────────────────────────────────

std::string jsonNumber(double v) {
  if (std::isnan(v)) return "NaN";
  if (std::isinf(v)) return v > 0 ? "Infinity" : "-Infinity";
  std::ostringstream os;
  os.precision(17);
  os << v;
  return os.str();
}

std::string buildMetadataJson(const GeoTransform& transform, float nodata) {
  const auto gt = transform.toGdal();
  std::ostringstream json;
  json << "{\"version\": " << kMetadataVersion << ", \"transform\": [";
  for (size_t i = 0; i < gt.size(); ++i) {
    json << (i ? ", " : "") << jsonNumber(gt[i]);
  }
  json << "], \"nodata\": " << jsonNumber(nodata) << "}";
  return json.str();
}

// Number after "key": (accepts NaN / Infinity as written by Python's json).
bool jsonNumberAt(const std::string& json, const std::string& key,
                  double& out) {
  auto pos = json.find("\"" + key + "\"");
  if (pos == std::string::npos) return false;
  pos = json.find(':', pos);
  if (pos == std::string::npos) return false;
  const char* start = json.c_str() + pos + 1;
  char* end = nullptr;
  out = std::strtod(start, &end);
  return end != start;
}

// Array of n numbers after "key": [...]
bool jsonNumberArray(const std::string& json, const std::string& key,
                     double* out, size_t n) {
  auto pos = json.find("\"" + key + "\"");
  if (pos == std::string::npos) return false;
  pos = json.find('[', pos);
  const auto end = json.find(']', pos);
  if (pos == std::string::npos || end == std::string::npos) return false;
  const std::string inner = json.substr(pos + 1, end - pos - 1);
  const char* p = inner.c_str();
  for (size_t i = 0; i < n; ++i) {
    while (*p == ' ' || *p == ',') ++p;
    char* next = nullptr;
    out[i] = std::strtod(p, &next);
    if (next == p) return false;
    p = next;
  }
  return true;
}

}  // namespace detail

// ─── Save ───────────────────────────────────────────────────────────────────

bool saveScene(const std::string& filename, const RasterSet& rasters) {
  return saveScene(filename, rasters, Eigen::MatrixXf());
}

bool saveScene(const std::string& filename, const RasterSet& rasters,
               const Eigen::MatrixXf& incidence_angle) {
  if (rasters.empty()) {
    spdlog::error("[npz_io] No raster to save to {}", filename);
    return false;
  }
  const Raster& first = rasters.begin()->second;
  for (const auto& [channel, raster] : rasters) {
    if (raster.rows() != first.rows() || raster.cols() != first.cols()) {
      spdlog::error("[npz_io] {} raster is {}x{}, expected {}x{}",
                    toString(channel), raster.rows(), raster.cols(),
                    first.rows(), first.cols());
      return false;
    }
  }
  if (incidence_angle.size() > 0 &&
      (incidence_angle.rows() != first.rows() ||
       incidence_angle.cols() != first.cols())) {
    spdlog::error("[npz_io] Incidence angle is {}x{}, expected {}x{}",
                  incidence_angle.rows(), incidence_angle.cols(), first.rows(),
                  first.cols());
    return false;
  }

  std::ofstream fs(filename, std::ios::binary);
  if (!fs.is_open()) {
    spdlog::error("[npz_io] Cannot create {}", filename);
    return false;
  }

  detail::ZipWriter zip(fs);
  for (const auto& [channel, raster] : rasters) {
    std::string name = channel == Channel::HH ? "hh.npy" : "hv.npy";
    zip.add(name, detail::buildNpyArray(raster.values()));
  }
  if (incidence_angle.size() > 0) {
    zip.add("ia.npy", detail::buildNpyArray(incidence_angle));
  }
  zip.add("meta.npy", detail::buildNpyString(detail::buildMetadataJson(
                          first.transform(), first.nodata())));
  zip.finish();

  if (fs.fail()) {
    spdlog::error("[npz_io] Write failed for {}", filename);
    return false;
  }
  return true;
}

// ─── Load ───────────────────────────────────────────────────────────────────

bool loadScene(const std::string& filename, RasterSet& rasters) {
  Eigen::MatrixXf incidence_angle;
  return loadScene(filename, rasters, incidence_angle);
}

bool loadScene(const std::string& filename, RasterSet& rasters,
               Eigen::MatrixXf& incidence_angle) {
  std::ifstream fs(filename, std::ios::binary);
  if (!fs.is_open()) {
    spdlog::error("[npz_io] Cannot open {}", filename);
    return false;
  }

  std::vector<detail::ZipEntry> entries;
  if (!detail::readZipEntries(fs, entries)) {
    spdlog::error("[npz_io] No readable entries in {}", filename);
    return false;
  }

  // Metadata (optional: identity transform, NaN nodata)
  GeoTransform transform;
  float nodata = NAN;
  for (const auto& e : entries) {
    if (e.name != "meta.npy") continue;
    detail::NpyInfo info;
    if (!detail::parseNpyHeader(e.data, info) ||
        info.type != detail::NpyInfo::Type::String ||
        info.data_offset + info.stringBytes() > e.data.size()) {
      spdlog::error("[npz_io] Invalid meta.npy in {}", filename);
      return false;
    }
    const std::string json = detail::decodeString(e.data, info);

    double version = 0;
    if (detail::jsonNumberAt(json, "version", version) &&
        static_cast<int>(version) > detail::kMetadataVersion) {
      spdlog::error("[npz_io] Unsupported metadata version {} (max {})",
                    static_cast<int>(version), detail::kMetadataVersion);
      return false;
    }
    std::array<double, 6> gt{};
    if (detail::jsonNumberArray(json, "transform", gt.data(), gt.size())) {
      transform = GeoTransform::fromGdal(gt);
    } else {
      spdlog::warn("[npz_io] No transform in {}, using pixel coordinates",
                   filename);
    }
    double nd = NAN;
    if (detail::jsonNumberAt(json, "nodata", nd)) {
      nodata = static_cast<float>(nd);
    }
  }

  RasterSet loaded;
  Eigen::MatrixXf ia;
  int rows = -1, cols = -1;
  for (const auto& e : entries) {
    const bool is_ia = e.name == "ia.npy";
    Channel channel = Channel::HH;
    if (e.name == "hh.npy") {
      channel = Channel::HH;
    } else if (e.name == "hv.npy") {
      channel = Channel::HV;
    } else if (!is_ia) {
      continue;
    }

    Eigen::MatrixXf values;
    if (!detail::readArray(e, values)) return false;
    if (rows >= 0 && (values.rows() != rows || values.cols() != cols)) {
      spdlog::error("[npz_io] Shape mismatch for '{}': ({}x{}) vs ({}x{})",
                    e.name, values.rows(), values.cols(), rows, cols);
      return false;
    }
    rows = static_cast<int>(values.rows());
    cols = static_cast<int>(values.cols());

    if (is_ia) {
      ia = std::move(values);
    } else {
      loaded[channel] = Raster(channel, std::move(values), transform, nodata);
    }
  }

  if (loaded.empty()) {
    spdlog::error("[npz_io] No hh.npy / hv.npy in {}", filename);
    return false;
  }

  spdlog::info("[npz_io] Loaded {} channel(s), {}x{} px from {}",
               loaded.size(), rows, cols, filename);
  rasters = std::move(loaded);
  incidence_angle = std::move(ia);
  return true;
}

}  // namespace io
}  // namespace icearea
