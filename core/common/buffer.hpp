/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <span>
#include <string_view>
#include <vector>

#include <fmt/format.h>
#include <boost/container_hash/hash.hpp>

#include "common/buffer_view.hpp"
#include "common/hexutil.hpp"
#include "outcome/outcome.hpp"

namespace peerkeys::common {

  /**
   * @brief Class represents arbitrary (including empty) byte buffer.
   */
  class Buffer : public std::vector<uint8_t> {
   public:
    using Base = std::vector<uint8_t>;

    Buffer() = default;

    /**
     * @brief lvalue construct buffer from a byte vector
     */
    explicit Buffer(const Base &other) : Base(other) {}
    Buffer(Base &&other) : Base(std::move(other)) {}

    Buffer(const BufferView &s) : Base(s.begin(), s.end()) {}

    template <size_t N>
    explicit Buffer(const std::array<uint8_t, N> &other)
        : Base(other.begin(), other.end()) {}

    Buffer(const uint8_t *begin, const uint8_t *end) : Base(begin, end) {}

    using Base::Base;
    using Base::operator=;

    Buffer &operator+=(const BufferView &view) {
      return put(view);
    }

    /**
     * @brief Put a string into byte buffer
     * @param view arbitrary string
     * @return this buffer, suitable for chaining.
     */
    Buffer &put(std::string_view view) {
      Base::insert(Base::end(), view.begin(), view.end());
      return *this;
    }

    /**
     * @brief Put a sequence of bytes as view into byte buffer
     * @param view arbitrary span of bytes
     * @return this buffer, suitable for chaining.
     */
    Buffer &put(const BufferView &view) {
      Base::insert(Base::end(), view.begin(), view.end());
      return *this;
    }

    BufferView view() const {
      return BufferView(std::span<const uint8_t>(*this));
    }

    /**
     * @brief encode bytearray as hex
     * @return hex-encoded string
     */
    std::string toHex() const {
      return hex_lower(view());
    }

    /**
     * @brief Construct Buffer from hex string
     * @param hex hex-encoded string
     * @return result containing constructed buffer if input string is
     * hex-encoded string.
     */
    static outcome::result<Buffer> fromHex(std::string_view hex) {
      OUTCOME_TRY(bytes, unhex(hex));
      return outcome::success(Buffer(std::move(bytes)));
    }

    /**
     * @brief return content of bytearray as string
     * @note Does not ensure correct encoding
     */
    std::string toString() const {
      return std::string{Base::cbegin(), Base::cend()};
    }

    /**
     * @brief stores content of a string to byte array
     */
    static Buffer fromString(std::string_view src) {
      return {src.begin(), src.end()};
    }
  };

  inline std::ostream &operator<<(std::ostream &os, const Buffer &buffer) {
    return os << buffer.view();
  }

  namespace literals {
    /// creates a buffer filled with characters from the original string
    /// mind that it does not perform unhexing, there is ""_hex2buf for it
    inline Buffer operator""_buf(const char *c, size_t s) {
      return Buffer::fromString(std::string_view{c, s});
    }

    inline Buffer operator""_hex2buf(const char *hex, size_t size) {
      return Buffer::fromHex(std::string_view{hex, size}).value();
    }
  }  // namespace literals

}  // namespace peerkeys::common

namespace peerkeys {
  using common::Buffer;
}  // namespace peerkeys

template <>
struct std::hash<peerkeys::common::Buffer> {
  size_t operator()(const peerkeys::common::Buffer &x) const {
    return boost::hash_range(x.begin(), x.end());
  }
};

template <>
struct fmt::formatter<peerkeys::common::Buffer>
    : fmt::formatter<peerkeys::common::BufferView> {
  template <typename FormatContext>
  auto format(const peerkeys::common::Buffer &buffer,
              FormatContext &ctx) const -> decltype(ctx.out()) {
    return fmt::formatter<peerkeys::common::BufferView>::format(buffer.view(),
                                                                ctx);
  }
};
