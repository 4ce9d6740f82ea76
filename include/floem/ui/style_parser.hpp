#pragma once

#include <floem/log.hpp>
#include <floem/ui/base_style.hpp>
#include <floem/ui/selectors.hpp>
#include <floem/ui/style.hpp>
#include <floem/ui/view_tree.hpp>

#include <charconv>
#include <cstddef>
#include <cstdint>
#include <fstream>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace floem::ui {

namespace detail {

inline std::string_view trim_ws(std::string_view s) {
  std::size_t i = 0;
  while (i < s.size() && (s[i] == ' ' || s[i] == '\t' || s[i] == '\r' || s[i] == '\n')) {
    ++i;
  }
  std::size_t j = s.size();
  while (j > i && (s[j - 1] == ' ' || s[j - 1] == '\t' || s[j - 1] == '\r' || s[j - 1] == '\n')) {
    --j;
  }
  return s.substr(i, j - i);
}

inline bool is_quoted(std::string_view s) {
  return s.size() >= 2 && ((s.front() == '"' && s.back() == '"') ||
                           (s.front() == '\'' && s.back() == '\''));
}

inline std::string unescape_toml_string(std::string_view s) {
  std::string out;
  out.reserve(s.size());
  for (std::size_t i = 0; i < s.size(); ++i) {
    const char c = s[i];
    if (c != '\\' || i + 1 >= s.size()) {
      out.push_back(c);
      continue;
    }
    const char n = s[++i];
    if (n == 'n') {
      out.push_back('\n');
    } else if (n == 't') {
      out.push_back('\t');
    } else {
      out.push_back(n);
    }
  }
  return out;
}

// Strips a trailing comment; '#' inside a quoted string is kept.
inline std::string_view strip_comment(std::string_view line) {
  char quote = 0;
  for (std::size_t i = 0; i < line.size(); ++i) {
    const char c = line[i];
    if (quote) {
      if (c == '\\') {
        ++i;
      } else if (c == quote) {
        quote = 0;
      }
    } else if (c == '"' || c == '\'') {
      quote = c;
    } else if (c == '#') {
      return line.substr(0, i);
    }
  }
  return line;
}

inline std::optional<std::string> parse_toml_table_name(std::string_view line) {
  line = trim_ws(line);
  if (line.size() < 3 || line.front() != '[' || line.back() != ']') {
    return std::nullopt;
  }
  auto inner = trim_ws(line.substr(1, line.size() - 2));
  if (is_quoted(inner)) {
    return unescape_toml_string(inner.substr(1, inner.size() - 2));
  }
  return std::string{inner};
}

inline std::pair<std::string, std::string> parse_toml_kv(std::string_view line) {
  const auto pos = line.find('=');
  if (pos == std::string_view::npos) {
    return {};
  }
  auto k = trim_ws(line.substr(0, pos));
  auto v = trim_ws(line.substr(pos + 1));
  if (is_quoted(k)) {
    k = k.substr(1, k.size() - 2);
  }
  return {std::string{k}, std::string{v}};
}

inline std::optional<PropValue> parse_toml_value(std::string_view v) {
  v = trim_ws(v);
  if (v.empty()) {
    return std::nullopt;
  }
  if (is_quoted(v)) {
    return PropValue{unescape_toml_string(v.substr(1, v.size() - 2))};
  }
  if (v == "true") {
    return PropValue{true};
  }
  if (v == "false") {
    return PropValue{false};
  }
  const auto *first = v.data();
  const auto *last = v.data() + v.size();
  if (v.size() > 2 && v[0] == '0' && (v[1] == 'x' || v[1] == 'X')) {
    std::uint64_t u{};
    const auto [ptr, ec] = std::from_chars(first + 2, last, u, 16);
    if (ec != std::errc{} || ptr != last) {
      return std::nullopt;
    }
    return PropValue{static_cast<std::int64_t>(u)};
  }
  if (v.find_first_of(".eE") != std::string_view::npos) {
    double d{};
    const auto [ptr, ec] = std::from_chars(first, last, d);
    if (ec != std::errc{} || ptr != last) {
      return std::nullopt;
    }
    return PropValue{d};
  }
  std::int64_t i{};
  const auto [ptr, ec] = std::from_chars(first, last, i);
  if (ec != std::errc{} || ptr != last) {
    return std::nullopt;
  }
  return PropValue{i};
}

inline std::optional<double> toml_number(const PropValue &v) {
  if (const auto *d = std::get_if<double>(&v)) {
    return *d;
  }
  if (const auto *i = std::get_if<std::int64_t>(&v)) {
    return static_cast<double>(*i);
  }
  return std::nullopt;
}

// Converts a raw TOML value into the representation the property expects:
// colors from "#rrggbb" or 0xRRGGBBAA, lengths from "1.5em" or plain numbers.
inline std::optional<PropValue> coerce_prop(const std::string &key, PropValue v) {
  const auto *info = prop_info(key);
  if (!info) {
    return v;
  }
  if (info->interpolation == Interpolation::Color) {
    if (const auto *s = std::get_if<std::string>(&v)) {
      if (const auto c = parse_color(*s)) {
        return PropValue{*c};
      }
      return std::nullopt;
    }
    if (const auto *i = std::get_if<std::int64_t>(&v)) {
      const auto u = static_cast<std::uint32_t>(*i);
      return PropValue{*i > 0xFFFFFF ? color_from_u32(u)
                                     : color_from_u32((u << 8) | 0xFFu)};
    }
    return std::nullopt;
  }
  if (info->interpolation == Interpolation::Length) {
    if (const auto *s = std::get_if<std::string>(&v)) {
      if (const auto l = parse_length(*s)) {
        return PropValue{*l};
      }
      return std::nullopt;
    }
    if (const auto n = toml_number(v)) {
      return PropValue{px(*n)};
    }
    return std::nullopt;
  }
  return v;
}

} // namespace detail

struct EngineConfig {
  std::optional<double> root_font_size{};
  std::optional<double> default_font_size{};
};

struct ThemeModel {
  std::string name;
  std::string base;
  Style style;
  EngineConfig engine;
  std::unordered_map<std::string, double> breakpoints;
};

struct ThemeRegistry {
  std::unordered_map<std::string, ThemeModel> themes;
};

inline void register_theme(ThemeRegistry &reg, ThemeModel t) {
  if (t.name.empty()) {
    t.name = "Default";
  }
  auto name = t.name;
  reg.themes.insert_or_assign(std::move(name), std::move(t));
}

struct ResolvedTheme {
  Style style;
  EngineConfig engine;
  GridBreakpoints breakpoints;
};

// Applies the base chain first so the named theme wins. A theme already on
// the chain is not entered again.
inline ResolvedTheme resolve_theme(const ThemeRegistry &reg, std::string_view name) {
  ResolvedTheme out;
  std::unordered_set<std::string> visiting;

  auto apply_theme = [&](auto &&self, std::string_view theme_name) -> void {
    if (theme_name.empty()) {
      return;
    }
    const std::string key{theme_name};
    if (visiting.contains(key)) {
      floem_log("theme base cycle at " + key, "Theme");
      return;
    }
    const auto it = reg.themes.find(key);
    if (it == reg.themes.end()) {
      return;
    }

    visiting.insert(key);
    const auto &t = it->second;
    if (!t.base.empty()) {
      self(self, t.base);
    }
    out.style.apply(t.style);
    if (t.engine.root_font_size) {
      out.engine.root_font_size = t.engine.root_font_size;
    }
    if (t.engine.default_font_size) {
      out.engine.default_font_size = t.engine.default_font_size;
    }
    for (const auto &kv : t.breakpoints) {
      if (kv.first == "sm") {
        out.breakpoints.sm = kv.second;
      } else if (kv.first == "md") {
        out.breakpoints.md = kv.second;
      } else if (kv.first == "lg") {
        out.breakpoints.lg = kv.second;
      } else if (kv.first == "xl") {
        out.breakpoints.xl = kv.second;
      } else if (kv.first == "xxl") {
        out.breakpoints.xxl = kv.second;
      }
    }
    visiting.erase(key);
  };

  apply_theme(apply_theme, name);
  return out;
}

inline Style resolve_theme_style(const ThemeRegistry &reg, std::string_view name) {
  return resolve_theme(reg, name).style;
}

struct StyleParseError {
  std::int32_t line{};
  std::int32_t column{};
  std::string message;
};

struct ParseThemeResult {
  ThemeModel theme;
  std::vector<StyleParseError> errors;
};

inline std::vector<std::string> split_dot(std::string_view s) {
  std::vector<std::string> out;
  std::size_t pos = 0;
  while (pos <= s.size()) {
    const auto next = s.find('.', pos);
    const auto part = (next == std::string_view::npos) ? s.substr(pos) : s.substr(pos, next - pos);
    out.emplace_back(part);
    if (next == std::string_view::npos) {
      break;
    }
    pos = next + 1;
  }
  return out;
}

inline ParseThemeResult parse_theme_toml(std::string_view toml) {
  ParseThemeResult out;
  std::vector<std::string> table;
  bool table_ok = false;

  const auto add_error = [&](std::int32_t line, std::int32_t col, std::string msg) {
    floem_log("theme line " + std::to_string(line) + ": " + msg, "Theme");
    out.errors.push_back(StyleParseError{line, col, std::move(msg)});
  };

  std::size_t pos = 0;
  std::int32_t line_no = 0;
  while (pos <= toml.size()) {
    ++line_no;
    const auto next = toml.find('\n', pos);
    auto line = (next == std::string_view::npos) ? toml.substr(pos) : toml.substr(pos, next - pos);
    pos = (next == std::string_view::npos) ? toml.size() + 1 : next + 1;

    line = detail::trim_ws(detail::strip_comment(line));
    if (line.empty()) {
      continue;
    }

    if (auto t = detail::parse_toml_table_name(line)) {
      table = split_dot(*t);
      const auto &t0 = table[0];
      const bool simple = t0 == "Theme" || t0 == "Engine" || t0 == "Breakpoints";
      table_ok = (simple && table.size() == 1) ||
                 (t0 == "Global" && table.size() <= 3) ||
                 (t0 == "class" && table.size() >= 2 && table.size() <= 3);
      if (t0 == "Global" && table.size() == 2 && !parse_selector(table[1])) {
        add_error(line_no, 1, "unknown selector: " + table[1]);
        table_ok = false;
      } else if (t0 == "Global" && table.size() == 3 &&
                 (table[1] != "responsive" || !parse_breakpoint(table[2]))) {
        add_error(line_no, 1, "unknown responsive table: " + *t);
        table_ok = false;
      } else if (t0 == "class" && table.size() == 3 && !parse_selector(table[2])) {
        add_error(line_no, 1, "unknown selector: " + table[2]);
        table_ok = false;
      } else if (!table_ok) {
        add_error(line_no, 1, "unknown table: " + *t);
      }
      continue;
    }

    if (table.empty()) {
      add_error(line_no, 1, "key/value outside any table");
      continue;
    }
    if (!table_ok) {
      continue;
    }

    const auto kv = detail::parse_toml_kv(line);
    if (kv.first.empty()) {
      add_error(line_no, 1, "invalid key/value");
      continue;
    }

    const auto eq = line.find('=');
    const auto value_start = line.find_first_not_of(" \t", eq + 1);
    const auto value_col = static_cast<std::int32_t>(
        (value_start == std::string_view::npos ? eq + 1 : value_start) + 1);
    const auto raw = detail::parse_toml_value(kv.second);
    if (!raw) {
      add_error(line_no, value_col, "invalid value for " + kv.first);
      continue;
    }

    const auto &table0 = table[0];
    if (table0 == "Theme") {
      const auto *s = std::get_if<std::string>(&*raw);
      if (kv.first == "name" || kv.first == "base") {
        if (!s) {
          add_error(line_no, value_col, "Theme." + kv.first + " must be string");
        } else if (kv.first == "name") {
          out.theme.name = *s;
        } else {
          out.theme.base = *s;
        }
      }
      continue;
    }

    if (table0 == "Engine" || table0 == "Breakpoints") {
      const auto n = detail::toml_number(*raw);
      if (!n || *n <= 0.0) {
        add_error(line_no, value_col, table0 + "." + kv.first + " must be a positive number");
        continue;
      }
      if (table0 == "Breakpoints") {
        if (!parse_breakpoint(kv.first) || kv.first == "xs") {
          add_error(line_no, 1, "unknown breakpoint: " + kv.first);
          continue;
        }
        out.theme.breakpoints.insert_or_assign(kv.first, *n);
      } else if (kv.first == "root_font_size") {
        out.theme.engine.root_font_size = *n;
      } else if (kv.first == "default_font_size") {
        out.theme.engine.default_font_size = *n;
      } else {
        add_error(line_no, 1, "unknown engine key: " + kv.first);
      }
      continue;
    }

    auto value = detail::coerce_prop(kv.first, *raw);
    if (!value) {
      add_error(line_no, value_col, "invalid value for " + kv.first);
      continue;
    }
    Style decl;
    decl.set(kv.first, std::move(*value));

    if (table0 == "Global") {
      if (table.size() == 1) {
        out.theme.style.apply(decl);
      } else if (table.size() == 2) {
        out.theme.style.selector(*parse_selector(table[1]), decl);
      } else {
        out.theme.style.responsive(*parse_breakpoint(table[2]), decl);
      }
      continue;
    }

    // class.<name>[.<selector>]
    if (table.size() == 2) {
      out.theme.style.class_def(table[1], decl);
    } else {
      out.theme.style.class_def(table[1],
                                Style{}.selector(*parse_selector(table[2]), decl));
    }
  }

  if (out.theme.name.empty()) {
    out.theme.name = "Default";
  }

  return out;
}

inline std::optional<std::string> load_text_file(const std::string &path) {
  std::ifstream f(path, std::ios::in | std::ios::binary);
  if (!f) {
    return std::nullopt;
  }
  f.seekg(0, std::ios::end);
  const auto size = f.tellg();
  if (size <= 0) {
    return std::string{};
  }
  std::string out;
  out.resize(static_cast<std::size_t>(size));
  f.seekg(0, std::ios::beg);
  if (!f.read(out.data(), static_cast<std::streamsize>(out.size()))) {
    return std::nullopt;
  }
  return out;
}

// Parses and registers a theme file. Returns nullopt when the file cannot be
// read; parse errors are reported in the result.
inline std::optional<ParseThemeResult> load_theme_toml_file(ThemeRegistry &reg,
                                                            const std::string &path) {
  auto s = load_text_file(path);
  if (!s) {
    floem_log("cannot read theme file " + path, "Theme");
    return std::nullopt;
  }
  auto r = parse_theme_toml(*s);
  register_theme(reg, r.theme);
  return r;
}

// Installs a resolved theme on the window: engine settings, breakpoints, and
// the theme style as the root context.
inline void apply_theme(ViewTree &tree, const ResolvedTheme &theme) {
  auto &w = tree.window();
  if (theme.engine.default_font_size) {
    w.default_font_size = *theme.engine.default_font_size;
  }
  if (theme.engine.root_font_size) {
    tree.set_root_font_size(*theme.engine.root_font_size);
  }
  tree.set_grid_breakpoints(theme.breakpoints);
  tree.apply_theme(theme.style);
}

} // namespace floem::ui
