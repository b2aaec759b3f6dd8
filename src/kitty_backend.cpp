#include "kitty_backend.hpp"
#include <algorithm>
#include <cctype>
#include <vector>

static std::string to_lower(std::string s) {
  for (char& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s;
}

int kitty_format_code(ImageFormat f) {
  switch (f) {
    case ImageFormat::Png: return 100;
    case ImageFormat::Rgb: return 24;
    case ImageFormat::Rgba: return 32;
  }
  return 100;
}

static std::string apc(const std::string& keys, std::string_view payload) {
  std::string s = "\x1b_G";
  s += keys;
  if (!payload.empty()) { s += ';'; s.append(payload.data(), payload.size()); }
  s += "\x1b\\";
  return s;
}

std::string encode_kitty_image(std::string_view base64_data, const KittyImageOptions& opts) {
  std::string keys = "a=T,f=" + std::to_string(kitty_format_code(opts.format));
  if (opts.format != ImageFormat::Png) {
    if (opts.pixel_width) keys += ",s=" + std::to_string(*opts.pixel_width);
    if (opts.pixel_height) keys += ",v=" + std::to_string(*opts.pixel_height);
  }
  if (opts.width) keys += ",c=" + std::to_string(*opts.width);
  if (opts.height) keys += ",r=" + std::to_string(*opts.height);
  if (opts.image_id) keys += ",i=" + std::to_string(*opts.image_id);
  if (base64_data.size() <= kKittyMaxChunk) return apc(keys, base64_data);

  // Chunks must stay multiples of 4 base64 chars.
  const size_t chunk = kKittyMaxChunk - (kKittyMaxChunk % 4);
  std::string out;
  for (size_t off = 0; off < base64_data.size(); off += chunk) {
    bool last = off + chunk >= base64_data.size();
    std::string_view piece = base64_data.substr(off, chunk);
    if (off == 0) out += apc(keys + ",m=1", piece);
    else out += apc(last ? "m=0" : "m=1", piece);
  }
  return out;
}

std::string delete_kitty_images() { return apc("a=d", {}); }

std::string base64_encode(std::string_view bytes) {
  static constexpr char tbl[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
  std::string out;
  out.reserve((bytes.size() + 2) / 3 * 4);
  size_t i = 0;
  for (; i + 2 < bytes.size(); i += 3) {
    unsigned v = (static_cast<unsigned char>(bytes[i]) << 16) |
                 (static_cast<unsigned char>(bytes[i + 1]) << 8) |
                 static_cast<unsigned char>(bytes[i + 2]);
    out += tbl[(v >> 18) & 63]; out += tbl[(v >> 12) & 63];
    out += tbl[(v >> 6) & 63];  out += tbl[v & 63];
  }
  if (i < bytes.size()) {
    unsigned v = static_cast<unsigned char>(bytes[i]) << 16;
    bool two = i + 1 < bytes.size();
    if (two) v |= static_cast<unsigned char>(bytes[i + 1]) << 8;
    out += tbl[(v >> 18) & 63]; out += tbl[(v >> 12) & 63];
    out += two ? tbl[(v >> 6) & 63] : '=';
    out += '=';
  }
  return out;
}

KittyBackend::KittyBackend(BackendOptions opts) : KittyBackend(opts, process_environment()) {}

KittyBackend::KittyBackend(BackendOptions opts, const Environment& env) : opts_(opts), detected_(detect_environment(env)) {}

bool KittyBackend::detect_environment(const Environment& env) {
  if (auto prog = env.get("TERM_PROGRAM")) {
    std::string p = to_lower(*prog);
    if (p == "kitty" || p == "wezterm") return true;
  }
  if (auto term = env.get("TERM")) {
    if (term->find("wezterm") != std::string::npos) return true;
  }
  if (auto id = env.get("KITTY_WINDOW_ID")) {
    if (!id->empty()) return true;
  }
  return false;
}

bool KittyBackend::detect() const { return detected_; }

BackendCapabilities KittyBackend::capabilities() const {
  BackendCapabilities caps;
  caps.truecolor = opts_.truecolor;
  caps.images = opts_.images;
  caps.synchronized_output = true;
  caps.styled_underlines = true;
  return caps;
}

std::string KittyBackend::init() {
  state_.reset();
  return std::string(ansi::kSyncBegin) + ansi::kAltScreenOn + ansi::kCursorHide + ansi::kSyncEnd;
}

std::string KittyBackend::render_buffer(const std::vector<RenderCell>& changes, int width, int height) {
  std::string body = ansi::render_changes(changes, width, height, state_, opts_.truecolor);
  if (body.empty()) return body;
  return ansi::kSyncBegin + body + ansi::kSyncEnd;
}

std::string KittyBackend::cleanup() {
  state_.reset();
  return std::string(ansi::kSyncEnd) + ansi::kReset + ansi::kCursorShow + ansi::kAltScreenOff;
}
