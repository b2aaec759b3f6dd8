#include "input_decoder.hpp"
#include <algorithm>
#include <vector>
#include <utility>
#include <spdlog/spdlog.h>

namespace {

constexpr std::string_view kPasteBegin = "\x1b[200~";
constexpr std::string_view kPasteEnd = "\x1b[201~";

bool starts_with(std::string_view s, std::string_view prefix) {
  return s.size() >= prefix.size() && s.substr(0, prefix.size()) == prefix;
}

// Longest suffix of s that is a proper prefix of marker.
std::size_t partial_marker(std::string_view s, std::string_view marker) {
  std::size_t n = std::min(s.size(), marker.size() - 1);
  for (; n > 0; --n)
    if (s.substr(s.size() - n) == marker.substr(0, n)) return n;
  return 0;
}

void push_keys(std::vector<KeyEvent>& keys, InputEventQueue& q) {
  for (auto& k : keys) q.push(std::move(k));
  keys.clear();
}

} // namespace

void InputDecoder::feed(std::string_view bytes, InputEventQueue& q) {
  std::string buf;
  buf.reserve(pending_.size() + bytes.size());
  buf.append(pending_).append(bytes);
  pending_.clear();
  std::string_view all(buf);
  std::size_t i = 0;
  while (i < all.size()) {
    std::string_view rest = all.substr(i);
    std::size_t used = 0;
    if (in_paste_) used = feed_paste(rest, q);
    else if (!keys_.has_pending() && rest[0] == '\x1b') used = route_escape(rest, q);
    else used = feed_keys(rest, q);
    if (used == 0) {
      pending_.assign(rest);
      break;
    }
    i += used;
  }
}

// Returns bytes consumed, 0 when rest is an incomplete prefix to hold.
std::size_t InputDecoder::route_escape(std::string_view rest, InputEventQueue& q) {
  if (rest.size() == 1) return 0;
  // ESC ESC: alt+escape, or a meta prefix on the sequence that follows.
  if (rest[1] == '\x1b') return rest.size() == 2 ? 0 : feed_keys(rest, q);
  if (rest[1] != '[') return feed_keys(rest, q);

  MouseDecoder::Result m = mouse_.decode(rest);
  if (m.status == MouseDecoder::Status::Complete) {
    q.push(std::move(m.event));
    return m.consumed;
  }
  if (m.status == MouseDecoder::Status::Incomplete && rest.size() < kMaxReport) return 0;
  if (rest.size() >= 3 && (rest[2] == 'I' || rest[2] == 'O')) {
    q.push(FocusEvent{rest[2] == 'I', std::string(rest.substr(0, 3))});
    return 3;
  }
  if (starts_with(rest, kPasteBegin)) {
    in_paste_ = true;
    paste_truncated_ = false;
    paste_.clear();
    return kPasteBegin.size();
  }
  if (rest.size() < kPasteBegin.size() && kPasteBegin.substr(0, rest.size()) == rest) return 0;
  return feed_keys(rest, q);
}

// Feeds the key decoder until it is back at ground state.
std::size_t InputDecoder::feed_keys(std::string_view rest, InputEventQueue& q) {
  std::vector<KeyEvent> keys;
  std::size_t n = 0;
  do {
    keys_.decode(rest.substr(n, 1), keys);
    ++n;
  } while (n < rest.size() && keys_.has_pending());
  push_keys(keys, q);
  return n;
}

std::size_t InputDecoder::feed_paste(std::string_view rest, InputEventQueue& q) {
  std::size_t end = rest.find(kPasteEnd);
  std::size_t body = end != std::string_view::npos ? end : rest.size() - partial_marker(rest, kPasteEnd);
  if (body == 0 && end == std::string_view::npos) return 0;
  std::size_t room = kMaxPaste - std::min(kMaxPaste, paste_.size());
  paste_.append(rest.substr(0, std::min(body, room)));
  if (body > room && !paste_truncated_) {
    paste_truncated_ = true;
    spdlog::warn("bracketed paste exceeds {} bytes, truncating", kMaxPaste);
  }
  if (end == std::string_view::npos) return body;
  q.push(PasteEvent{std::move(paste_)});
  paste_.clear();
  in_paste_ = false;
  return end + kPasteEnd.size();
}

void InputDecoder::flush(InputEventQueue& q) {
  if (in_paste_) return;
  std::vector<KeyEvent> keys;
  if (!pending_.empty()) {
    keys_.decode(pending_, keys);
    pending_.clear();
  }
  for (auto& k : keys_.flush()) keys.push_back(std::move(k));
  push_keys(keys, q);
}

void InputDecoder::reset() {
  keys_.reset();
  pending_.clear();
  in_paste_ = false;
  paste_truncated_ = false;
  paste_.clear();
}
