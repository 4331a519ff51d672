/**
 * @file theme.hpp
 * @brief Terminal color themes used by the view models.
 */

#ifndef PRDECK_THEME_HPP
#define PRDECK_THEME_HPP

#include <string>

namespace prdeck {

/// Terminal palette color (maps onto the eight curses colors).
enum class Color { Default, Black, Red, Green, Yellow, Blue, Magenta, Cyan, White };

/// Available theme variants.
enum class ThemeKind { Dark, Light };

/// Semantic color roles resolved by view models.
struct Theme {
  ThemeKind kind{ThemeKind::Dark};
  Color background{Color::Default};
  Color text_primary{Color::White};
  Color text_muted{Color::Blue};
  Color accent{Color::Cyan};
  Color status_success{Color::Green};
  Color status_error{Color::Red};
  Color status_warning{Color::Yellow};
  Color status_info{Color::Cyan};
  Color selected_fg{Color::Black};
  Color selected_bg{Color::Cyan};
  Color header_fg{Color::Black};
  Color header_bg{Color::Blue};

  static Theme dark();
  static Theme light();
  static Theme for_kind(ThemeKind kind);
};

bool operator==(const Theme &a, const Theme &b);
bool operator!=(const Theme &a, const Theme &b);

const char *to_string(ThemeKind kind);

/// Parse "dark"/"light"; anything else yields ThemeKind::Dark.
ThemeKind parse_theme_kind(const std::string &name);

/// The other theme variant.
ThemeKind toggled(ThemeKind kind);

} // namespace prdeck

#endif // PRDECK_THEME_HPP
