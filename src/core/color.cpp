#include "core/color.hpp"

#include <cmath>
#include <cstdint>
#include <map>
#include <regex>
#include <vector>

namespace qrapi {

namespace {

// CSS named colors, 0xRRGGBB
const std::map<std::string, uint32_t> &named_colors() {
  static const std::map<std::string, uint32_t> colors = {
      {"aliceblue", 0xf0f8ff},
      {"antiquewhite", 0xfaebd7},
      {"aqua", 0x00ffff},
      {"aquamarine", 0x7fffd4},
      {"azure", 0xf0ffff},
      {"beige", 0xf5f5dc},
      {"bisque", 0xffe4c4},
      {"black", 0x000000},
      {"blanchedalmond", 0xffebcd},
      {"blue", 0x0000ff},
      {"blueviolet", 0x8a2be2},
      {"brown", 0xa52a2a},
      {"burlywood", 0xdeb887},
      {"cadetblue", 0x5f9ea0},
      {"chartreuse", 0x7fff00},
      {"chocolate", 0xd2691e},
      {"coral", 0xff7f50},
      {"cornflowerblue", 0x6495ed},
      {"cornsilk", 0xfff8dc},
      {"crimson", 0xdc143c},
      {"cyan", 0x00ffff},
      {"darkblue", 0x00008b},
      {"darkcyan", 0x008b8b},
      {"darkgoldenrod", 0xb8860b},
      {"darkgray", 0xa9a9a9},
      {"darkgrey", 0xa9a9a9},
      {"darkgreen", 0x006400},
      {"darkkhaki", 0xbdb76b},
      {"darkmagenta", 0x8b008b},
      {"darkolivegreen", 0x556b2f},
      {"darkorange", 0xff8c00},
      {"darkorchid", 0x9932cc},
      {"darkred", 0x8b0000},
      {"darksalmon", 0xe9967a},
      {"darkseagreen", 0x8fbc8f},
      {"darkslateblue", 0x483d8b},
      {"darkslategray", 0x2f4f4f},
      {"darkslategrey", 0x2f4f4f},
      {"darkturquoise", 0x00ced1},
      {"darkviolet", 0x9400d3},
      {"deeppink", 0xff1493},
      {"deepskyblue", 0x00bfff},
      {"dimgray", 0x696969},
      {"dimgrey", 0x696969},
      {"dodgerblue", 0x1e90ff},
      {"firebrick", 0xb22222},
      {"floralwhite", 0xfffaf0},
      {"forestgreen", 0x228b22},
      {"fuchsia", 0xff00ff},
      {"gainsboro", 0xdcdcdc},
      {"ghostwhite", 0xf8f8ff},
      {"gold", 0xffd700},
      {"goldenrod", 0xdaa520},
      {"gray", 0x808080},
      {"grey", 0x808080},
      {"green", 0x008000},
      {"greenyellow", 0xadff2f},
      {"honeydew", 0xf0fff0},
      {"hotpink", 0xff69b4},
      {"indianred", 0xcd5c5c},
      {"indigo", 0x4b0082},
      {"ivory", 0xfffff0},
      {"khaki", 0xf0e68c},
      {"lavender", 0xe6e6fa},
      {"lavenderblush", 0xfff0f5},
      {"lawngreen", 0x7cfc00},
      {"lemonchiffon", 0xfffacd},
      {"lightblue", 0xadd8e6},
      {"lightcoral", 0xf08080},
      {"lightcyan", 0xe0ffff},
      {"lightgoldenrodyellow", 0xfafad2},
      {"lightgreen", 0x90ee90},
      {"lightgray", 0xd3d3d3},
      {"lightgrey", 0xd3d3d3},
      {"lightpink", 0xffb6c1},
      {"lightsalmon", 0xffa07a},
      {"lightseagreen", 0x20b2aa},
      {"lightskyblue", 0x87cefa},
      {"lightslategray", 0x778899},
      {"lightslategrey", 0x778899},
      {"lightsteelblue", 0xb0c4de},
      {"lightyellow", 0xffffe0},
      {"lime", 0x00ff00},
      {"limegreen", 0x32cd32},
      {"linen", 0xfaf0e6},
      {"magenta", 0xff00ff},
      {"maroon", 0x800000},
      {"mediumaquamarine", 0x66cdaa},
      {"mediumblue", 0x0000cd},
      {"mediumorchid", 0xba55d3},
      {"mediumpurple", 0x9370db},
      {"mediumseagreen", 0x3cb371},
      {"mediumslateblue", 0x7b68ee},
      {"mediumspringgreen", 0x00fa9a},
      {"mediumturquoise", 0x48d1cc},
      {"mediumvioletred", 0xc71585},
      {"midnightblue", 0x191970},
      {"mintcream", 0xf5fffa},
      {"mistyrose", 0xffe4e1},
      {"moccasin", 0xffe4b5},
      {"navajowhite", 0xffdead},
      {"navy", 0x000080},
      {"oldlace", 0xfdf5e6},
      {"olive", 0x808000},
      {"olivedrab", 0x6b8e23},
      {"orange", 0xffa500},
      {"orangered", 0xff4500},
      {"orchid", 0xda70d6},
      {"palegoldenrod", 0xeee8aa},
      {"palegreen", 0x98fb98},
      {"paleturquoise", 0xafeeee},
      {"palevioletred", 0xdb7093},
      {"papayawhip", 0xffefd5},
      {"peachpuff", 0xffdab9},
      {"peru", 0xcd853f},
      {"pink", 0xffc0cb},
      {"plum", 0xdda0dd},
      {"powderblue", 0xb0e0e6},
      {"purple", 0x800080},
      {"rebeccapurple", 0x663399},
      {"red", 0xff0000},
      {"rosybrown", 0xbc8f8f},
      {"royalblue", 0x4169e1},
      {"saddlebrown", 0x8b4513},
      {"salmon", 0xfa8072},
      {"sandybrown", 0xf4a460},
      {"seagreen", 0x2e8b57},
      {"seashell", 0xfff5ee},
      {"sienna", 0xa0522d},
      {"silver", 0xc0c0c0},
      {"skyblue", 0x87ceeb},
      {"slateblue", 0x6a5acd},
      {"slategray", 0x708090},
      {"slategrey", 0x708090},
      {"snow", 0xfffafa},
      {"springgreen", 0x00ff7f},
      {"tan", 0xd2b48c},
      {"teal", 0x008080},
      {"thistle", 0xd8bfd8},
      {"tomato", 0xff6347},
      {"turquoise", 0x40e0d0},
      {"violet", 0xee82ee},
      {"wheat", 0xf5deb3},
      {"white", 0xffffff},
      {"whitesmoke", 0xf5f5f5},
      {"yellow", 0xffff00},
      {"yellowgreen", 0x9acd32},
  };
  return colors;
}

int hex_value(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

std::optional<Rgba> parse_hex(const std::string &hex) {
  std::vector<int> digits;
  digits.reserve(hex.size());
  for (char c : hex) {
    int v = hex_value(c);
    if (v < 0) return std::nullopt;
    digits.push_back(v);
  }

  Rgba color;
  switch (digits.size()) {
    case 3:
    case 4:
      // Short form: each digit is doubled (#abc == #aabbcc)
      color.r = static_cast<uint8_t>(digits[0] * 17);
      color.g = static_cast<uint8_t>(digits[1] * 17);
      color.b = static_cast<uint8_t>(digits[2] * 17);
      if (digits.size() == 4) color.a = static_cast<uint8_t>(digits[3] * 17);
      return color;
    case 6:
    case 8:
      color.r = static_cast<uint8_t>(digits[0] * 16 + digits[1]);
      color.g = static_cast<uint8_t>(digits[2] * 16 + digits[3]);
      color.b = static_cast<uint8_t>(digits[4] * 16 + digits[5]);
      if (digits.size() == 8) color.a = static_cast<uint8_t>(digits[6] * 16 + digits[7]);
      return color;
    default:
      return std::nullopt;
  }
}

// Unit interval [0, 1] to a channel, rounding half up; nullopt past 255
std::optional<uint8_t> unit_to_channel(double v) {
  double scaled = v * 255.0 + 0.5;
  if (!(scaled >= 0.0) || scaled >= 256.0) return std::nullopt;
  return static_cast<uint8_t>(scaled);
}

std::optional<Rgba> from_units(double r, double g, double b) {
  auto cr = unit_to_channel(r);
  auto cg = unit_to_channel(g);
  auto cb = unit_to_channel(b);
  if (!cr || !cg || !cb) return std::nullopt;
  return Rgba{*cr, *cg, *cb, 255};
}

double hue_component(double m1, double m2, double hue) {
  hue = hue - std::floor(hue);
  if (hue < 1.0 / 6.0) return m1 + (m2 - m1) * hue * 6.0;
  if (hue < 0.5) return m2;
  if (hue < 2.0 / 3.0) return m1 + (m2 - m1) * (2.0 / 3.0 - hue) * 6.0;
  return m1;
}

// h, s, l in [0, 1]
std::optional<Rgba> hsl_to_rgba(double h, double s, double l) {
  if (s == 0.0) return from_units(l, l, l);
  double m2 = l <= 0.5 ? l * (1.0 + s) : l + s - l * s;
  double m1 = 2.0 * l - m2;
  return from_units(hue_component(m1, m2, h + 1.0 / 3.0), hue_component(m1, m2, h), hue_component(m1, m2, h - 1.0 / 3.0));
}

// h, s, v in [0, 1]
std::optional<Rgba> hsv_to_rgba(double h, double s, double v) {
  if (s == 0.0) return from_units(v, v, v);
  h = h - std::floor(h);
  int i = static_cast<int>(h * 6.0);
  double f = h * 6.0 - i;
  double p = v * (1.0 - s);
  double q = v * (1.0 - s * f);
  double t = v * (1.0 - s * (1.0 - f));
  switch (i % 6) {
    case 0:
      return from_units(v, t, p);
    case 1:
      return from_units(q, v, p);
    case 2:
      return from_units(p, v, t);
    case 3:
      return from_units(p, q, v);
    case 4:
      return from_units(t, p, v);
    default:
      return from_units(v, p, q);
  }
}

std::optional<Rgba> parse_functional(const std::string &str) {
  static const std::regex rgb_regex(R"(^rgb\(\s*(\d+)\s*,\s*(\d+)\s*,\s*(\d+)\s*\)$)");
  static const std::regex rgba_regex(R"(^rgba\(\s*(\d+)\s*,\s*(\d+)\s*,\s*(\d+)\s*,\s*(\d+)\s*\)$)");
  static const std::regex rgb_percent_regex(R"(^rgb\(\s*(\d*\.?\d+)%\s*,\s*(\d*\.?\d+)%\s*,\s*(\d*\.?\d+)%\s*\)$)");
  static const std::regex hsl_regex(R"(^hsl\(\s*(\d+\.?\d*)\s*,\s*(\d+\.?\d*)%\s*,\s*(\d+\.?\d*)%\s*\)$)");
  static const std::regex hsv_regex(R"(^hs[bv]\(\s*(\d+\.?\d*)\s*,\s*(\d+\.?\d*)%\s*,\s*(\d+\.?\d*)%\s*\)$)");

  std::smatch match;
  auto number = [&match](int i) {
    return std::stod(match[i].str());
  };

  // stod throws on out-of-range input
  try {
    if (std::regex_match(str, match, rgb_regex) || std::regex_match(str, match, rgba_regex)) {
      int channels[4] = {0, 0, 0, 255};
      for (size_t i = 1; i < match.size(); ++i) {
        channels[i - 1] = std::stoi(match[i].str());
        if (channels[i - 1] > 255) return std::nullopt;
      }
      return Rgba{static_cast<uint8_t>(channels[0]), static_cast<uint8_t>(channels[1]), static_cast<uint8_t>(channels[2]),
                  static_cast<uint8_t>(channels[3])};
    }

    if (std::regex_match(str, match, rgb_percent_regex)) {
      return from_units(number(1) / 100.0, number(2) / 100.0, number(3) / 100.0);
    }

    if (std::regex_match(str, match, hsl_regex)) {
      return hsl_to_rgba(number(1) / 360.0, number(2) / 100.0, number(3) / 100.0);
    }

    if (std::regex_match(str, match, hsv_regex)) {
      return hsv_to_rgba(number(1) / 360.0, number(2) / 100.0, number(3) / 100.0);
    }
  } catch (const std::exception &) {
    return std::nullopt;
  }

  return std::nullopt;
}

}  // namespace

std::optional<Rgba> parse_color(const std::string &str) {
  auto value = to_lower(trim(str));
  if (value.empty()) {
    return std::nullopt;
  }

  if (value[0] == '#') {
    return parse_hex(value.substr(1));
  }

  if (value == "transparent") {
    return Rgba{0, 0, 0, 0};
  }

  const auto &named = named_colors();
  if (auto it = named.find(value); it != named.end()) {
    uint32_t rgb = it->second;
    return Rgba{static_cast<uint8_t>(rgb >> 16), static_cast<uint8_t>((rgb >> 8) & 0xff), static_cast<uint8_t>(rgb & 0xff), 255};
  }

  return parse_functional(value);
}

}  // namespace qrapi
