#include <cstdio>
#include <exception>
#include <string>
#include <string_view>
#include <variant>
#include <vector>
#include <spdlog/spdlog.h>
#include "app.hpp"
#include "config.hpp"
#include "logging.hpp"

static void usage(const char* prog) {
  std::fprintf(stderr,
    "usage: %s [--backend=auto|ansi|kitty] [--no-truecolor] [--no-mouse] [--focus] [--log=FILE] [--loglevel=LEVEL]\n",
    prog);
}

static bool parse_args(int argc, char** argv, ConfigOverrides& o) {
  for (int i = 1; i < argc; ++i) {
    std::string_view a = argv[i];
    if (a.rfind("--backend=", 0) == 0) {
      auto t = parse_backend_type(a.substr(10));
      if (!t) return false;
      o.preferred = *t;
    } else if (a == "--no-truecolor") o.truecolor = false;
    else if (a == "--no-mouse") o.mouse = false;
    else if (a == "--focus") o.focus_events = true;
    else if (a.rfind("--log=", 0) == 0) o.log_file = std::string(a.substr(6));
    else if (a.rfind("--loglevel=", 0) == 0) o.log_level = std::string(a.substr(11));
    else return false;
  }
  return true;
}

static std::string describe(const InputEvent& ev) {
  if (auto* k = std::get_if<KeyEvent>(&ev)) {
    std::string s = "key ";
    if (k->ctrl) s += "ctrl+";
    if (k->meta) s += "meta+";
    if (k->shift) s += "shift+";
    return s + k->name;
  }
  if (auto* m = std::get_if<MouseEvent>(&ev))
    return std::string("mouse ") + to_string(m->button) + " " + to_string(m->action) + " " +
           std::to_string(m->x) + "," + std::to_string(m->y) + " (" + to_string(m->protocol) + ")";
  if (auto* f = std::get_if<FocusEvent>(&ev)) return f->focused ? "focus in" : "focus out";
  return "paste " + std::to_string(std::get<PasteEvent>(ev).text.size()) + " bytes";
}

static void draw_box(CellBuffer& buf, int x, int y, int w, int h, Color fg) {
  if (w < 2 || h < 2) return;
  for (int i = x + 1; i < x + w - 1; ++i) { buf.write_text(i, y, "─", fg); buf.write_text(i, y + h - 1, "─", fg); }
  for (int j = y + 1; j < y + h - 1; ++j) { buf.write_text(x, j, "│", fg); buf.write_text(x + w - 1, j, "│", fg); }
  buf.write_text(x, y, "┌", fg);
  buf.write_text(x + w - 1, y, "┐", fg);
  buf.write_text(x, y + h - 1, "└", fg);
  buf.write_text(x + w - 1, y + h - 1, "┘", fg);
}

int main(int argc, char** argv) {
  ConfigOverrides overrides;
  if (!parse_args(argc, argv, overrides)) { usage(argv[0]); return 2; }
  std::vector<std::string> messages;
  AppConfig cfg = with_overrides(load_config(process_environment(), messages), overrides);
  std::string log_error;
  if (!init_logging(cfg, &log_error)) std::fprintf(stderr, "cellterm: cannot open log: %s\n", log_error.c_str());
  for (const auto& m : messages) spdlog::warn("config: {}", m);

  std::vector<std::string> history;
  try {
    App app(cfg);
    app.run([&history](InputEventQueue& queue, CellBuffer& buf, App& self) {
      for (auto& ev : queue.drain()) {
        if (auto* k = std::get_if<KeyEvent>(&ev)) {
          if ((k->name == "q" && !k->ctrl && !k->meta) || (k->name == "c" && k->ctrl)) self.stop();
        }
        history.push_back(describe(ev));
        if (history.size() > 100) history.erase(history.begin());
      }
      buf.clear();
      int w = buf.width(), h = buf.height();
      draw_box(buf, 0, 0, w, h, rgb(90, 140, 220));
      buf.write_text(2, 0, " cellterm ", rgb(255, 255, 255), rgb(90, 140, 220), Attr::Bold);
      buf.write_text(2, 1, std::string("backend: ") + std::string(self.backend().name()) + "  (q quits)",
                     rgb(200, 200, 120));
      int rows = h - 4;
      int start = static_cast<int>(history.size()) > rows ? static_cast<int>(history.size()) - rows : 0;
      for (int i = start, y = 3; i < static_cast<int>(history.size()) && y < h - 1; ++i, ++y)
        buf.write_text(2, y, history[i], kDefaultColor, kDefaultColor, i + 1 == static_cast<int>(history.size()) ? Attr::Bold : Attr::None);
    });
  } catch (const std::exception& e) {
    std::fprintf(stderr, "cellterm: %s\n", e.what());
    return 1;
  }
  return 0;
}
