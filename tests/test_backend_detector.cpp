#include "backend_detector.hpp"
#include <cassert>
#include <memory>
#include <string_view>

int main() {
  assert(parse_backend_type("kitty") == BackendType::Kitty);
  assert(parse_backend_type("ansi") == BackendType::Ansi);
  assert(parse_backend_type("auto") == BackendType::Auto);
  assert(!parse_backend_type("sixel"));
  assert(std::string_view(backend_type_name(BackendType::Kitty)) == "kitty");

  MapEnvironment kitty;
  kitty.set("TERM_PROGRAM", "kitty");
  kitty.set("KITTY_WINDOW_ID", "1");
  MapEnvironment plain;
  plain.set("TERM", "xterm-256color");

  BackendDetector dk(kitty);
  assert(dk.detect()->name() == "kitty");
  BackendPreference ansi_pref;
  ansi_pref.preferred = BackendType::Ansi;
  assert(dk.detect(ansi_pref)->name() == "ansi");

  BackendDetector dp(plain);
  assert(dp.detect()->name() == "ansi");
  BackendPreference kitty_pref;
  kitty_pref.preferred = BackendType::Kitty;
  assert(dp.detect(kitty_pref)->name() == "kitty");

  BackendPreference fb;
  fb.fallback = BackendType::Kitty;
  assert(dp.detect(fb)->name() == "kitty");
  fb.fallback = BackendType::Auto;
  assert(dp.detect(fb)->name() == "ansi");

  BackendPreference no_tc;
  no_tc.truecolor = false;
  assert(!dp.detect(no_tc)->capabilities().truecolor);
  assert(!dk.detect(no_tc)->capabilities().truecolor);

  // a backend handed out by the detector outlives the detector and its environment
  std::unique_ptr<RenderBackend> made;
  {
    MapEnvironment scoped;
    scoped.set("TERM", "xterm-wezterm");
    BackendDetector ds(scoped);
    made = ds.detect();
  }
  assert(made->name() == "kitty" && made->detect());
  return 0;
}
