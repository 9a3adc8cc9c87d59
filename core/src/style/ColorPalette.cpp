#include "em/style/ColorPalette.hpp"

#include <cstdio>

namespace em {

ColorPalette redPalette() {
  ColorPalette p;
  p.name = "Reds";
  // All fields already carry the red preset from the struct initializers.
  return p;
}

static int hexDigit(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

bool parseHexColor(const std::string& hex, Rgb& out) {
  std::size_t start = (!hex.empty() && hex[0] == '#') ? 1 : 0;
  if (hex.size() - start != 6) return false;

  std::uint8_t comps[3];
  for (int i = 0; i < 3; i++) {
    int hi = hexDigit(hex[start + 2 * i]);
    int lo = hexDigit(hex[start + 2 * i + 1]);
    if (hi < 0 || lo < 0) return false;
    comps[i] = static_cast<std::uint8_t>(hi * 16 + lo);
  }
  out.r = comps[0];
  out.g = comps[1];
  out.b = comps[2];
  return true;
}

std::string toHexColor(const Rgb& c) {
  char buf[8];
  std::snprintf(buf, sizeof(buf), "#%02x%02x%02x", c.r, c.g, c.b);
  return buf;
}

} // namespace em
