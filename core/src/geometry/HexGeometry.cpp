#include "em/geometry/HexGeometry.hpp"

#include <cmath>
#include <cstdio>

namespace em {

namespace {
constexpr double kPi = 3.14159265358979323846;
constexpr double kSqrt3 = 1.73205080756887729353;
} // namespace

AxialCoordinate hexToAxial(int hex1, int hex2, int minHex1, int minHex2) {
  // Widen before subtracting; index spans may exceed the int range.
  const double h1 = static_cast<double>(hex1) - static_cast<double>(minHex1);
  const double h2 = static_cast<double>(hex2) - static_cast<double>(minHex2);

  AxialCoordinate a;
  a.q = -(h1 - h2) - 3.0;
  a.r = -h2;
  return a;
}

PixelCoordinate axialToPixel(const AxialCoordinate& axial,
                             double effectiveSize, Side mirrorSide) {
  PixelCoordinate p;
  p.x = effectiveSize * (1.5 * axial.q);
  p.y = effectiveSize * (kSqrt3 / 2.0 * axial.q + kSqrt3 * axial.r);
  if (mirrorSide == Side::Left) p.x = -p.x;
  return p;
}

PixelCoordinate hexToPixel(int hex1, int hex2, int minHex1, int minHex2,
                           double effectiveSize, Side mirrorSide) {
  return axialToPixel(hexToAxial(hex1, hex2, minHex1, minHex2),
                      effectiveSize, mirrorSide);
}

std::vector<PixelCoordinate> hexagonCorners(double hexSize) {
  std::vector<PixelCoordinate> corners;
  corners.reserve(6);
  for (int i = 0; i < 6; i++) {
    double angle = kPi / 3.0 * static_cast<double>(i);
    corners.push_back({hexSize * std::cos(angle), hexSize * std::sin(angle)});
  }
  return corners;
}

std::string formatFixed(double v, int precision) {
  if (precision < 0) precision = 0;
  if (precision > 10) precision = 10;
  double half = 0.5 * std::pow(10.0, -precision);
  if (std::fabs(v) < half) v = 0.0;

  char buf[64];
  std::snprintf(buf, sizeof(buf), "%.*f", precision, v);
  return buf;
}

std::vector<std::string> hexagonVertices(double hexSize, int precision) {
  std::vector<std::string> out;
  out.reserve(6);
  for (const auto& c : hexagonCorners(hexSize)) {
    out.push_back(formatFixed(c.x, precision) + "," + formatFixed(c.y, precision));
  }
  return out;
}

std::string hexagonPath(double hexSize, int precision) {
  std::string path;
  for (const auto& v : hexagonVertices(hexSize, precision)) {
    if (!path.empty()) path += ' ';
    path += v;
  }
  return path;
}

} // namespace em
