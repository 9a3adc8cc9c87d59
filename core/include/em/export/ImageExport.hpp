#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace em {

// Encode raw RGBA pixel data (top-down rows) as a PNG byte stream (RGB, no
// alpha). Stored-deflate framing, no zlib/libpng dependency. Returns an empty
// vector for a null buffer or non-positive size.
std::vector<std::uint8_t> encodePNG(const std::uint8_t* pixels, int width, int height);

bool writePNG(const std::string& path, const std::uint8_t* pixels, int width, int height);

// Creates missing parent directories. Return false and log on failure.
bool writeBinaryFile(const std::string& path, const std::vector<std::uint8_t>& bytes);
bool writeTextFile(const std::string& path, const std::string& text);

std::string base64Encode(const std::uint8_t* data, std::size_t len);
std::string base64Encode(const std::vector<std::uint8_t>& bytes);

// Whitespace is skipped; any other non-alphabet byte fails.
bool base64Decode(const std::string& text, std::vector<std::uint8_t>& out);

inline constexpr const char* kPngDataUrlPrefix = "data:image/png;base64,";

std::string pngDataUrl(const std::vector<std::uint8_t>& pngBytes);

// Inverse of pngDataUrl(). False when the prefix or payload is malformed.
bool decodePngDataUrl(const std::string& url, std::vector<std::uint8_t>& pngBytes);

} // namespace em
