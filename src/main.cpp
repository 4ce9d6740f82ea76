#include <iostream>
#include <string>

#include <floem/floem.hpp>
#include <floem/ui/freetype_metrics.hpp>

using namespace floem::reactive;
using namespace floem::ui;

namespace {

constexpr const char *demo_theme = R"(
[Theme]
name = "Demo"

[Engine]
default_font_size = 14

[Global]
color = "#202020"

[Global.dark_mode]
color = "#e0e0e0"

[class.button]
padding = "0.5em"
background = "#3366cc"

[class.button.hover]
background = "#4477dd"
)";

void print_stats(const char *label, const StylePassStats &s) {
  std::cout << label << ": visited=" << s.visited
            << " full=" << s.full_resolutions << " fast=" << s.fast_paths
            << " skipped=" << s.skipped << "\n";
}

} // namespace

int main() {
  RuntimeGuard runtime;
#if defined(FLOEM_LOG_DEBUG)
  floem::set_logging_enabled(true);
#endif

  FreeTypeFontMetrics metrics;
  if (auto r = metrics.load_default(); !r.ok) {
    std::cout << "FreeType: " << r.error << ", using approximate metrics\n";
  }

  ViewTree tree;
  tree.set_window_width(800.0);
  if (metrics.loaded()) {
    tree.set_font_metrics(&metrics);
  }

  ThemeRegistry themes;
  const auto parsed = parse_theme_toml(demo_theme);
  for (const auto &e : parsed.errors) {
    std::cout << "theme error " << e.line << ":" << e.column << " " << e.message << "\n";
  }
  register_theme(themes, parsed.theme);
  apply_theme(tree, resolve_theme(themes, "Demo"));

  auto font_size = create_rw_signal(16.0);
  const auto root = tree.root();
  tree.style(root, [font_size] { return Style{}.font_size(font_size.get()); });

  const auto column = tree.add_view(root);
  tree.set_style(column, Style{}.width(pct(50)).padding(em(1)));

  const auto label = tree.add_view(column);
  tree.set_style(label, Style{}.width(ch(20)));

  const auto button = tree.add_view(column);
  tree.add_class(button, "button");

  create_effect([&tree, label] {
    tree.state(label).layout_requested.track();
    std::cout << "layout requested for label\n";
  });

  print_stats("initial pass", tree.style_pass());
  dump_view_tree(std::cout, tree);

  tree.pointer_enter(button);
  print_stats("hover button", tree.style_pass());

  font_size.set(20.0);
  print_stats("root font 20px", tree.style_pass(StyleRecalcChange{Propagate::InheritedOnly}));

  tree.set_dark_mode(true);
  print_stats("dark mode", tree.style_pass());
  dump_view_tree(std::cout, tree);

  std::cout << "label width " << tree.resolve_layout_props(label).at("width") << "px\n";

  tree.remove_view(column);
  print_stats("after removal", tree.style_pass());
  return 0;
}
