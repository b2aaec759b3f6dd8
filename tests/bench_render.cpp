#include "ansi_backend.hpp"
#include "cell_buffer.hpp"
#include "diff_engine.hpp"
#include "kitty_backend.hpp"
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <random>
#include <algorithm>
#include <string>

struct BenchCfg {
  int width = 200;
  int height = 60;
  int frames = 500;
  int sparse_cells = 40; // changed cells per sparse frame
};

template <typename Fn>
static double time_it(Fn&& fn) {
  auto t0 = std::chrono::steady_clock::now();
  fn();
  auto t1 = std::chrono::steady_clock::now();
  std::chrono::duration<double> dt = t1 - t0;
  return dt.count();
}

static void paint(CellBuffer& buf, int frame) {
  for (int y = 0; y < buf.height(); ++y)
    for (int x = 0; x < buf.width(); ++x) {
      Cell c;
      c.ch = std::string(1, static_cast<char>('a' + (x + y + frame) % 26));
      c.fg = rgb(static_cast<std::uint8_t>(x * 3), static_cast<std::uint8_t>(y * 4), static_cast<std::uint8_t>(frame));
      buf.set_cell(x, y, c);
    }
}

static void bench(RenderBackend& backend, const BenchCfg& cfg) {
  CellBuffer buf(cfg.width, cfg.height);
  DiffEngine diff;
  backend.init();
  size_t bytes = 0;
  double full = time_it([&] {
    for (int f = 0; f < cfg.frames; ++f) {
      paint(buf, f);
      bytes += backend.render_buffer(diff.diff(buf), buf.width(), buf.height()).size();
    }
  });
  std::cout << "[" << backend.name() << "] full frames " << cfg.width << "x" << cfg.height
            << " x" << cfg.frames << " took " << full << "s, " << bytes / cfg.frames << " bytes/frame\n";

  std::mt19937 rng(42);
  std::uniform_int_distribution<int> rx(0, cfg.width - 1), ry(0, cfg.height - 1), rc(0, 25);
  bytes = 0;
  double sparse = time_it([&] {
    for (int f = 0; f < cfg.frames; ++f) {
      for (int i = 0; i < cfg.sparse_cells; ++i)
        buf.set_char(rx(rng), ry(rng), std::string(1, static_cast<char>('A' + rc(rng))));
      bytes += backend.render_buffer(diff.diff(buf), buf.width(), buf.height()).size();
    }
  });
  std::cout << "[" << backend.name() << "] sparse frames (" << cfg.sparse_cells << " cells) x" << cfg.frames
            << " took " << sparse << "s, " << bytes / cfg.frames << " bytes/frame\n";
  backend.cleanup();
}

int main(int argc, char** argv) {
  BenchCfg cfg;
  if (argc >= 2) cfg.frames = std::max(1, std::atoi(argv[1]));
  AnsiBackend ansi_tc;
  AnsiBackend ansi_256(BackendOptions{false, false});
  MapEnvironment env;
  KittyBackend kitty(BackendOptions{}, env);
  bench(ansi_tc, cfg);
  bench(ansi_256, cfg);
  bench(kitty, cfg);
  return 0;
}
