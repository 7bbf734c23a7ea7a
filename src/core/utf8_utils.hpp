#ifndef CHAOSSCORE_CORE_UTF8_UTILS_HPP_
#define CHAOSSCORE_CORE_UTF8_UTILS_HPP_

#include <cstddef>
#include <string>
#include <string_view>

namespace chaosscore::core {

inline constexpr std::string_view kUtf8ReplacementCharacter = "\xEF\xBF\xBD";

// Length of the well-formed UTF-8 sequence starting at `pos`, or 0 when the
// bytes there are not one (stray continuation, overlong form, surrogate,
// beyond U+10FFFF, truncated).
inline std::size_t ValidUtf8SequenceLength(std::string_view text, const std::size_t pos) {
  const auto lead = static_cast<unsigned char>(text[pos]);
  if (lead < 0x80U) {
    return 1U;
  }

  std::size_t length = 0;
  unsigned char second_min = 0x80U;
  unsigned char second_max = 0xBFU;
  if (lead >= 0xC2U && lead <= 0xDFU) {
    length = 2U;
  } else if (lead == 0xE0U) {
    length = 3U;
    second_min = 0xA0U;
  } else if (lead == 0xEDU) {
    length = 3U;
    second_max = 0x9FU;
  } else if (lead >= 0xE1U && lead <= 0xEFU) {
    length = 3U;
  } else if (lead == 0xF0U) {
    length = 4U;
    second_min = 0x90U;
  } else if (lead == 0xF4U) {
    length = 4U;
    second_max = 0x8FU;
  } else if (lead >= 0xF1U && lead <= 0xF3U) {
    length = 4U;
  } else {
    return 0U;
  }

  if (pos + length > text.size()) {
    return 0U;
  }
  const auto second = static_cast<unsigned char>(text[pos + 1U]);
  if (second < second_min || second > second_max) {
    return 0U;
  }
  for (std::size_t offset = 2U; offset < length; ++offset) {
    const auto next = static_cast<unsigned char>(text[pos + offset]);
    if ((next & 0xC0U) != 0x80U) {
      return 0U;
    }
  }
  return length;
}

// Copies `text`, replacing every byte that does not begin a well-formed
// UTF-8 sequence with U+FFFD.
inline std::string ReplaceInvalidUtf8(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  std::size_t pos = 0;
  while (pos < text.size()) {
    const std::size_t length = ValidUtf8SequenceLength(text, pos);
    if (length == 0U) {
      out.append(kUtf8ReplacementCharacter);
      ++pos;
      continue;
    }
    out.append(text.substr(pos, length));
    pos += length;
  }
  return out;
}

} // namespace chaosscore::core

#endif // CHAOSSCORE_CORE_UTF8_UTILS_HPP_
