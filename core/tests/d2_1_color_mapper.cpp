// D2.1: ColorPalette / ColorMapper test (pure C++)

#include "em/style/ColorMapper.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <string>

static int tests = 0;
static int passed = 0;

static void check(bool cond, const char* msg) {
  tests++;
  if (!cond) {
    std::fprintf(stderr, "FAIL: %s\n", msg);
    std::exit(1);
  }
  passed++;
  std::printf("  OK: %s\n", msg);
}

static int paletteIndex(const em::ColorPalette& p, const std::string& color) {
  auto it = std::find(p.colors.begin(), p.colors.end(), color);
  return it == p.colors.end() ? -1 : static_cast<int>(it - p.colors.begin());
}

int main() {
  em::ColorMapper mapper;
  const em::ColorPalette& pal = mapper.palette();

  {
    check(pal.name == "Reds", "default palette is Reds");
    check(pal.colors.size() == 5, "5 colors");
    check(pal.thresholds.size() == 6, "6 thresholds");
    check(pal.colors.front() == "#fee5d9" && pal.colors.back() == "#a50f15",
          "lightest to darkest");
  }

  // normalize
  {
    check(em::ColorMapper::normalize(50, 0, 100) == 0.5, "normalize(50, 0, 100) == 0.5");
    check(em::ColorMapper::normalize(5, 10, 10) == 0.0, "normalize(5, 10, 10) == 0 (flat range)");
    check(em::ColorMapper::normalize(-5, 0, 10) == 0.0, "below range clamps to 0");
    check(em::ColorMapper::normalize(15, 0, 10) == 1.0, "above range clamps to 1");
    check(em::ColorMapper::normalize(5, 10, 0) == 0.0, "inverted range yields 0");
  }

  // Zero is white
  {
    const double ranges[][2] = {{0, 1}, {0, 100}, {-10, 10}, {5, 6}, {1e-6, 2e-6}};
    bool ok = true;
    for (const auto& r : ranges) {
      if (mapper.colorForValue(0.0, r[0], r[1]) != "#ffffff") ok = false;
    }
    check(ok, "colorForValue(0, min, max) is the white sentinel");
    check(mapper.colorForValue(0.001, 0, 100) == "#fee5d9",
          "tiny positive value is the lightest bucket, not white");
  }

  // Bucket placement
  {
    check(mapper.colorForValue(1, 0, 100) == "#fee5d9", "1% -> bucket 0");
    check(mapper.colorForValue(20, 0, 100) == "#fcbba1", "20% -> bucket 1 (lower bound inclusive)");
    check(mapper.colorForValue(50, 0, 100) == "#fc9272", "50% -> bucket 2");
    check(mapper.colorForValue(79, 0, 100) == "#ef6548", "79% -> bucket 3");
    check(mapper.colorForValue(100, 0, 100) == "#a50f15", "100% -> last bucket (upper bound inclusive)");
    check(mapper.colorForValue(1000, 0, 100) == "#a50f15", "above max clamps to last bucket");
  }

  // Monotonicity
  {
    bool ok = true;
    int prev = -1;
    for (int v = 1; v <= 250; v++) {
      int idx = paletteIndex(pal, mapper.colorForValue(v, 3.0, 180.0));
      if (idx < 0 || idx < prev) ok = false;
      prev = idx;
    }
    check(ok, "bucket index is non-decreasing in value");
  }

  // Regional lookup
  {
    em::RegionMinMax mm;
    mm["ME"] = em::ValueRange{0.0, 100.0};
    mm["LO"] = em::ValueRange{0.0, 10.0};
    check(mapper.colorForRegionalValue(100, "ME", mm) == "#a50f15", "ME max is darkest");
    check(mapper.colorForRegionalValue(10, "ME", mm) == "#fee5d9", "10 is light in ME");
    check(mapper.colorForRegionalValue(10, "LO", mm) == "#a50f15", "10 is darkest in LO");
    check(mapper.colorForRegionalValue(5, "AME", mm) == "#fee5d9",
          "unknown region falls back to 0/0 (lightest)");
    check(mapper.colorForRegionalValue(0, "AME", mm) == "#ffffff", "unknown region zero is white");
  }

  // Threshold boundaries in metric units
  {
    em::ColorThresholds t;
    t.all = {10, 20, 30, 40, 50, 60};
    check(mapper.colorForThresholds(5, "ME", t) == "#fee5d9", "below first boundary -> bucket 0");
    check(mapper.colorForThresholds(35, "ME", t) == "#fc9272", "35 -> bucket 2");
    check(mapper.colorForThresholds(50, "ME", t) == "#a50f15", "50 -> bucket 4");
    check(mapper.colorForThresholds(600, "ME", t) == "#a50f15", "far above -> last bucket");
    check(mapper.colorForThresholds(0, "ME", t) == "#ffffff", "zero still white with thresholds");

    t.byRegion["LO"] = {0, 1, 2, 3, 4, 5};
    check(mapper.colorForThresholds(5, "LO", t) == "#a50f15", "regional boundaries win");
    check(mapper.colorForThresholds(5, "ME", t) == "#fee5d9", "other regions use global");

    em::ColorThresholds range;
    range.all = {0, 100};
    check(mapper.colorForThresholds(100, "ME", range) == "#a50f15",
          "two boundaries act as a min/max range");

    em::ColorThresholds none;
    check(mapper.colorForThresholds(42, "ME", none) == "#fee5d9", "no boundaries -> lightest");
  }

  {
    check(em::ColorMapper::bucketForBoundaries(3.0, {0, 10}) == 0,
          "fewer than 3 boundaries -> single bucket");
    check(mapper.bucketIndex(0.0) == 0, "bucketIndex(0) == 0");
    check(mapper.bucketIndex(1.0) == 4, "bucketIndex(1) == 4");
    check(mapper.bucketIndex(0.3999) == 1, "bucketIndex(0.3999) == 1");
  }

  // Sentinels
  {
    em::StateColors s = mapper.stateColors();
    check(s.notInRegion == "#999999", "not-in-region dark gray");
    check(s.existsNoData == "#ffffff", "exists-no-data white");
    check(s.existsNoDataStroke == "#999999", "exists-no-data has a visible stroke");
    check(s.zeroValue == "#ffffff", "zero value white");
    check(pal.existsNoDataStrokeWidth > 0.0, "stroke width positive");
  }

  // Legend values
  {
    auto v = mapper.legendValues(0, 100);
    check(v.size() == 6, "legendValues has N+1 entries");
    check(std::fabs(v[1] - 20.0) < 1e-9 && std::fabs(v[5] - 100.0) < 1e-9, "legend spans range");
    auto flat = mapper.legendValues(5, 5);
    bool allFive = std::all_of(flat.begin(), flat.end(), [](double x) { return x == 5.0; });
    check(allFive, "flat range legend is constant");
  }

  // Custom palette without usable thresholds uses even buckets
  {
    em::ColorPalette p;
    p.colors = {"#000001", "#000002"};
    p.thresholds.clear();
    em::ColorMapper m(p);
    check(m.colorForValue(10, 0, 100) == "#000001", "even buckets: low half");
    check(m.colorForValue(100, 0, 100) == "#000002", "even buckets: top clamps");
  }

  // Hex color helpers
  {
    em::Rgb c;
    check(em::parseHexColor("#a50f15", c) && c.r == 165 && c.g == 15 && c.b == 21,
          "parseHexColor(#a50f15)");
    check(em::toHexColor(c) == "#a50f15", "toHexColor round trip");
    check(!em::parseHexColor("#12345", c), "short color rejected");
    check(!em::parseHexColor("#zz0000", c), "non-hex rejected");
  }

  std::printf("D2.1 color_mapper: %d/%d PASS\n", passed, tests);
  return 0;
}
