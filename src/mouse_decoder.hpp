#pragma once
/*
 * MouseDecoder
 *
 * Purpose: parse terminal mouse reports (X10, UTF-8 extended, SGR, URXVT)
 *          into MouseEvents with 0-indexed coordinates.
 * Usage: decode() tells the caller whether the bytes at the front are a
 *        complete report, a truncated one, or not a mouse report at all.
 */
#include <cstddef>
#include <optional>
#include <string_view>
#include "types.hpp"

class MouseDecoder {
public:
  enum class Status { Complete, Incomplete, NoMatch };

  struct Result {
    Status status = Status::NoMatch;
    std::size_t consumed = 0;
    MouseEvent event;
  };

  static constexpr int kX10MaxCoord = 222;

  Result decode(std::string_view bytes) const;
  std::optional<MouseEvent> parse(std::string_view bytes) const;

private:
  Result decode_sgr(std::string_view bytes) const;
  Result decode_urxvt(std::string_view bytes) const;
  Result decode_x10(std::string_view bytes) const;
};
