#pragma once
#include "em/data/ColumnTypes.hpp"

#include <string>
#include <vector>

namespace em {

struct AxialCoordinate {
  double q{0.0};
  double r{0.0};
};

struct PixelCoordinate {
  double x{0.0};
  double y{0.0};
};

inline double effectiveHexSize(double hexSize, double spacingFactor) {
  return hexSize * spacingFactor;
}

// Recentre (hex1, hex2) on the smallest observed indices and convert to axial
// (q, r). A constant shift of hex1/hex2 shifts (q, r) by a constant vector.
AxialCoordinate hexToAxial(int hex1, int hex2, int minHex1, int minHex2);

// Flat-top projection. Side::Left negates x; Right and Middle leave it as is.
PixelCoordinate axialToPixel(const AxialCoordinate& axial,
                             double effectiveSize, Side mirrorSide);

PixelCoordinate hexToPixel(int hex1, int hex2, int minHex1, int minHex2,
                           double effectiveSize, Side mirrorSide);

// Six corners of a flat-top hexagon of circumradius hexSize centred on the
// origin, starting at angle 0 and stepping by 60 degrees.
std::vector<PixelCoordinate> hexagonCorners(double hexSize);

// Corners formatted as "x,y" with `precision` decimals.
std::vector<std::string> hexagonVertices(double hexSize, int precision = 2);

// Space-joined hexagonVertices(), usable as an SVG polygon `points` value.
std::string hexagonPath(double hexSize, int precision = 2);

// Fixed-point formatting shared by every markup emitter ("-0.00" becomes "0.00").
std::string formatFixed(double v, int precision);

} // namespace em
