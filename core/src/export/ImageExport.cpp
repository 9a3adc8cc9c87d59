#include "em/export/ImageExport.hpp"

#include <algorithm>
#include <array>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <system_error>

namespace em {

// ---------------------------------------------------------------------------
// PNG encoding: stored deflate blocks, no compression.
// ---------------------------------------------------------------------------

namespace {

using CrcTable = std::array<std::uint32_t, 256>;

// ISO 3309 polynomial. Built once, read-only afterwards.
const CrcTable& crcTable() {
  static const CrcTable table = [] {
    CrcTable t{};
    for (std::uint32_t n = 0; n < 256; n++) {
      std::uint32_t c = n;
      for (int k = 0; k < 8; k++) {
        c = (c & 1) ? (0xEDB88320u ^ (c >> 1)) : (c >> 1);
      }
      t[n] = c;
    }
    return t;
  }();
  return table;
}

std::uint32_t crc32(const std::uint8_t* data, std::size_t len) {
  const CrcTable& t = crcTable();
  std::uint32_t c = 0xFFFFFFFFu;
  for (std::size_t i = 0; i < len; i++) {
    c = t[(c ^ data[i]) & 0xFF] ^ (c >> 8);
  }
  return c ^ 0xFFFFFFFFu;
}

std::uint32_t adler32(const std::uint8_t* data, std::size_t len) {
  constexpr std::uint32_t MOD = 65521u;
  constexpr std::size_t NMAX = 5552; // RFC 1950: bytes before the sums can overflow
  std::uint32_t a = 1, b = 0;
  std::size_t offset = 0;
  while (offset < len) {
    std::size_t chunk = std::min(len - offset, NMAX);
    for (std::size_t i = 0; i < chunk; i++) {
      a += data[offset + i];
      b += a;
    }
    a %= MOD;
    b %= MOD;
    offset += chunk;
  }
  return (b << 16) | a;
}

void pushBE32(std::vector<std::uint8_t>& buf, std::uint32_t v) {
  buf.push_back(static_cast<std::uint8_t>((v >> 24) & 0xFF));
  buf.push_back(static_cast<std::uint8_t>((v >> 16) & 0xFF));
  buf.push_back(static_cast<std::uint8_t>((v >> 8) & 0xFF));
  buf.push_back(static_cast<std::uint8_t>(v & 0xFF));
}

void appendChunk(std::vector<std::uint8_t>& out, const char type[4],
                 const std::uint8_t* data, std::size_t len) {
  pushBE32(out, static_cast<std::uint32_t>(len));
  std::size_t typeStart = out.size();
  out.insert(out.end(), type, type + 4);
  if (len > 0 && data) out.insert(out.end(), data, data + len);
  // CRC covers type + data.
  pushBE32(out, crc32(&out[typeStart], 4 + len));
}

// Filter byte 0 (None) followed by RGB per row.
std::vector<std::uint8_t> scanlines(const std::uint8_t* rgba, int width, int height) {
  const std::size_t w = static_cast<std::size_t>(width);
  std::vector<std::uint8_t> raw;
  raw.reserve(static_cast<std::size_t>(height) * (1 + w * 3));
  for (int y = 0; y < height; y++) {
    raw.push_back(0x00);
    const std::uint8_t* row = rgba + static_cast<std::size_t>(y) * w * 4;
    for (std::size_t x = 0; x < w; x++) {
      raw.push_back(row[x * 4 + 0]);
      raw.push_back(row[x * 4 + 1]);
      raw.push_back(row[x * 4 + 2]);
    }
  }
  return raw;
}

std::vector<std::uint8_t> zlibStored(const std::vector<std::uint8_t>& data) {
  std::vector<std::uint8_t> z;
  std::size_t blocks = (data.size() + 65534) / 65535;
  z.reserve(2 + blocks * 5 + data.size() + 4);

  z.push_back(0x78); // CMF: deflate, 32K window
  z.push_back(0x01); // FLG: no dictionary

  std::size_t offset = 0;
  do {
    std::size_t blockLen = std::min(data.size() - offset, static_cast<std::size_t>(65535));
    bool last = offset + blockLen == data.size();
    z.push_back(last ? 0x01 : 0x00); // BFINAL, BTYPE=00

    auto len16 = static_cast<std::uint16_t>(blockLen);
    auto nlen16 = static_cast<std::uint16_t>(~len16);
    z.push_back(static_cast<std::uint8_t>(len16 & 0xFF));
    z.push_back(static_cast<std::uint8_t>(len16 >> 8));
    z.push_back(static_cast<std::uint8_t>(nlen16 & 0xFF));
    z.push_back(static_cast<std::uint8_t>(nlen16 >> 8));

    z.insert(z.end(), data.begin() + static_cast<std::ptrdiff_t>(offset),
             data.begin() + static_cast<std::ptrdiff_t>(offset + blockLen));
    offset += blockLen;
  } while (offset < data.size());

  pushBE32(z, adler32(data.data(), data.size()));
  return z;
}

bool ensureParentDir(const std::string& path) {
  std::filesystem::path parent = std::filesystem::path(path).parent_path();
  if (parent.empty()) return true;
  std::error_code ec;
  std::filesystem::create_directories(parent, ec);
  if (ec) {
    std::fprintf(stderr, "ImageExport: cannot create %s: %s\n",
                 parent.string().c_str(), ec.message().c_str());
    return false;
  }
  return true;
}

bool writeBytes(const std::string& path, const void* data, std::size_t len) {
  if (!ensureParentDir(path)) return false;

  FILE* f = std::fopen(path.c_str(), "wb");
  if (!f) {
    std::fprintf(stderr, "ImageExport: cannot open %s for writing\n", path.c_str());
    return false;
  }
  std::size_t written = len > 0 ? std::fwrite(data, 1, len, f) : 0;
  bool ok = (std::fclose(f) == 0) && written == len;
  if (!ok) std::fprintf(stderr, "ImageExport: short write to %s\n", path.c_str());
  return ok;
}

const char kB64[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

int b64Value(char c) {
  if (c >= 'A' && c <= 'Z') return c - 'A';
  if (c >= 'a' && c <= 'z') return c - 'a' + 26;
  if (c >= '0' && c <= '9') return c - '0' + 52;
  if (c == '+') return 62;
  if (c == '/') return 63;
  return -1;
}

} // namespace

std::vector<std::uint8_t> encodePNG(const std::uint8_t* pixels, int width, int height) {
  std::vector<std::uint8_t> out;
  if (!pixels || width <= 0 || height <= 0) return out;

  const std::uint8_t sig[8] = {0x89, 0x50, 0x4E, 0x47, 0x0D, 0x0A, 0x1A, 0x0A};
  out.insert(out.end(), sig, sig + 8);

  std::vector<std::uint8_t> ihdr;
  ihdr.reserve(13);
  pushBE32(ihdr, static_cast<std::uint32_t>(width));
  pushBE32(ihdr, static_cast<std::uint32_t>(height));
  ihdr.push_back(8); // bit depth
  ihdr.push_back(2); // color type: RGB
  ihdr.push_back(0); // deflate
  ihdr.push_back(0); // adaptive filtering
  ihdr.push_back(0); // no interlace
  appendChunk(out, "IHDR", ihdr.data(), ihdr.size());

  auto idat = zlibStored(scanlines(pixels, width, height));
  appendChunk(out, "IDAT", idat.data(), idat.size());
  appendChunk(out, "IEND", nullptr, 0);
  return out;
}

bool writePNG(const std::string& path, const std::uint8_t* pixels, int width, int height) {
  auto bytes = encodePNG(pixels, width, height);
  if (bytes.empty()) return false;
  return writeBinaryFile(path, bytes);
}

bool writeBinaryFile(const std::string& path, const std::vector<std::uint8_t>& bytes) {
  return writeBytes(path, bytes.data(), bytes.size());
}

bool writeTextFile(const std::string& path, const std::string& text) {
  return writeBytes(path, text.data(), text.size());
}

// ---------------------------------------------------------------------------
// Base64 / data URLs
// ---------------------------------------------------------------------------

std::string base64Encode(const std::uint8_t* data, std::size_t len) {
  std::string out;
  out.reserve((len + 2) / 3 * 4);

  std::size_t i = 0;
  for (; i + 2 < len; i += 3) {
    std::uint32_t n = (std::uint32_t(data[i]) << 16) | (std::uint32_t(data[i + 1]) << 8) |
                      std::uint32_t(data[i + 2]);
    out.push_back(kB64[(n >> 18) & 63]);
    out.push_back(kB64[(n >> 12) & 63]);
    out.push_back(kB64[(n >> 6) & 63]);
    out.push_back(kB64[n & 63]);
  }

  std::size_t rest = len - i;
  if (rest == 1) {
    std::uint32_t n = std::uint32_t(data[i]) << 16;
    out.push_back(kB64[(n >> 18) & 63]);
    out.push_back(kB64[(n >> 12) & 63]);
    out += "==";
  } else if (rest == 2) {
    std::uint32_t n = (std::uint32_t(data[i]) << 16) | (std::uint32_t(data[i + 1]) << 8);
    out.push_back(kB64[(n >> 18) & 63]);
    out.push_back(kB64[(n >> 12) & 63]);
    out.push_back(kB64[(n >> 6) & 63]);
    out.push_back('=');
  }
  return out;
}

std::string base64Encode(const std::vector<std::uint8_t>& bytes) {
  return base64Encode(bytes.data(), bytes.size());
}

bool base64Decode(const std::string& text, std::vector<std::uint8_t>& out) {
  out.clear();
  std::uint32_t acc = 0;
  int bits = 0;
  int pad = 0;

  for (char c : text) {
    if (c == ' ' || c == '\n' || c == '\r' || c == '\t') continue;
    if (c == '=') { pad++; continue; }
    if (pad > 0) return false; // data after padding
    int v = b64Value(c);
    if (v < 0) return false;
    acc = (acc << 6) | static_cast<std::uint32_t>(v);
    bits += 6;
    if (bits >= 8) {
      bits -= 8;
      out.push_back(static_cast<std::uint8_t>((acc >> bits) & 0xFF));
    }
  }
  return pad <= 2;
}

std::string pngDataUrl(const std::vector<std::uint8_t>& pngBytes) {
  return std::string(kPngDataUrlPrefix) + base64Encode(pngBytes);
}

bool decodePngDataUrl(const std::string& url, std::vector<std::uint8_t>& pngBytes) {
  const std::size_t prefixLen = std::strlen(kPngDataUrlPrefix);
  if (url.compare(0, prefixLen, kPngDataUrlPrefix) != 0) return false;
  return base64Decode(url.substr(prefixLen), pngBytes);
}

} // namespace em
