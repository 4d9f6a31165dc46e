/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <algorithm>
#include <ostream>
#include <span>
#include <string_view>

#include <fmt/format.h>

#include "common/bytestr.hpp"
#include "common/hexutil.hpp"

namespace peerkeys::common {

  /**
   * Non-owning view of a contiguous byte sequence.
   * Text passed to the byte-oriented API is viewed through fromString(), so
   * equality is always byte-wise regardless of where the bytes came from.
   */
  class BufferView : public std::span<const uint8_t> {
   public:
    using span::span;

    BufferView(std::initializer_list<uint8_t> &&) = delete;

    BufferView(const span &other) : span(other) {}

    template <typename T>
      requires std::is_integral_v<std::decay_t<T>> and (sizeof(T) == 1)
    BufferView(std::span<T> other)
        : span(reinterpret_cast<const uint8_t *>(other.data()), other.size()) {}

    static BufferView fromString(std::string_view str) {
      return BufferView(str2byte(str));
    }

    std::string toHex() const {
      return hex_lower(*this);
    }

    std::string_view toStringView() const {
      // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
      return {reinterpret_cast<const char *>(data()), size()};
    }

    bool operator==(const BufferView &other) const {
      return std::ranges::equal(*this, other);
    }
  };

  inline std::ostream &operator<<(std::ostream &os, BufferView view) {
    return os << view.toHex();
  }

}  // namespace peerkeys::common

namespace peerkeys {
  using common::BufferView;
}  // namespace peerkeys

template <>
struct fmt::formatter<peerkeys::common::BufferView> {
  // Presentation format: 's' - short, 'l' - long.
  char presentation = 's';

  constexpr auto parse(format_parse_context &ctx) -> decltype(ctx.begin()) {
    auto it = ctx.begin(), end = ctx.end();
    if (it != end && (*it == 's' || *it == 'l')) {
      presentation = *it++;
    }
    if (it != end && *it != '}') {
      throw format_error("invalid format");
    }
    return it;
  }

  template <typename FormatContext>
  auto format(const peerkeys::common::BufferView &view,
              FormatContext &ctx) const -> decltype(ctx.out()) {
    if (view.empty()) {
      static constexpr string_view message("<empty>");
      return std::copy(std::begin(message), std::end(message), ctx.out());
    }

    if (presentation == 's' && view.size() > 5) {
      auto hex = view.toHex();
      return fmt::format_to(ctx.out(),
                            "0x{}…{}",
                            std::string_view{hex}.substr(0, 4),
                            std::string_view{hex}.substr(hex.size() - 4));
    }

    return fmt::format_to(ctx.out(), "0x{}", view.toHex());
  }
};
