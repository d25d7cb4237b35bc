#pragma once

#include <optional>
#include <string>

#include "core/types.hpp"

namespace qrapi {

// Resolve a color string the way common imaging libraries do (case-insensitive):
//   "#rgb", "#rgba", "#rrggbb", "#rrggbbaa"
//   "rgb(r,g,b)", "rgb(r%,g%,b%)", "rgba(r,g,b,a)"
//   "hsl(h,s%,l%)", "hsv(h,s%,v%)", "hsb(h,s%,b%)"
//   the CSS named colors, plus "transparent"
// Returns nullopt for anything else.
std::optional<Rgba> parse_color(const std::string &str);

}  // namespace qrapi
