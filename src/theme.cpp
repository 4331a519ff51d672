#include "theme.hpp"

namespace prdeck {

Theme Theme::dark() { return Theme{}; }

Theme Theme::light() {
  Theme t;
  t.kind = ThemeKind::Light;
  t.text_primary = Color::Black;
  t.text_muted = Color::Blue;
  t.accent = Color::Magenta;
  t.status_success = Color::Green;
  t.status_error = Color::Red;
  t.status_warning = Color::Magenta;
  t.status_info = Color::Blue;
  t.selected_fg = Color::White;
  t.selected_bg = Color::Blue;
  t.header_fg = Color::White;
  t.header_bg = Color::Black;
  return t;
}

Theme Theme::for_kind(ThemeKind kind) {
  return kind == ThemeKind::Light ? light() : dark();
}

bool operator==(const Theme &a, const Theme &b) {
  return a.kind == b.kind && a.background == b.background &&
         a.text_primary == b.text_primary && a.text_muted == b.text_muted &&
         a.accent == b.accent && a.status_success == b.status_success &&
         a.status_error == b.status_error &&
         a.status_warning == b.status_warning &&
         a.status_info == b.status_info && a.selected_fg == b.selected_fg &&
         a.selected_bg == b.selected_bg && a.header_fg == b.header_fg &&
         a.header_bg == b.header_bg;
}

bool operator!=(const Theme &a, const Theme &b) { return !(a == b); }

const char *to_string(ThemeKind kind) {
  return kind == ThemeKind::Light ? "light" : "dark";
}

ThemeKind parse_theme_kind(const std::string &name) {
  return name == "light" ? ThemeKind::Light : ThemeKind::Dark;
}

ThemeKind toggled(ThemeKind kind) {
  return kind == ThemeKind::Light ? ThemeKind::Dark : ThemeKind::Light;
}

} // namespace prdeck
