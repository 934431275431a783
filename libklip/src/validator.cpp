/**
 * @file validator.cpp
 * @brief Text validation and UTF-8 helpers
 */

#include "klip/validator.h"
#include <cstdint>
#include <string>

namespace klip {

Error text_too_large_error(size_t size, size_t max_bytes) {
  return Error(ErrorCode::TextTooLarge,
               "Text too large: " + std::to_string(size) +
                   " bytes exceeds the maximum of " +
                   std::to_string(max_bytes) + " bytes");
}

Result<void> validate_text(std::string_view text, size_t max_bytes) {
  if (text.size() > max_bytes) {
    return text_too_large_error(text.size(), max_bytes);
  }

  // The message decoder already rejects malformed input; checked again
  // because this is the last stop before the OS clipboard.
  if (!is_valid_utf8(text)) {
    return Error(ErrorCode::InvalidUtf8, "Text is not valid UTF-8");
  }

  return Result<void>::ok();
}

bool is_valid_utf8(std::string_view bytes) {
  const auto *p = reinterpret_cast<const uint8_t *>(bytes.data());
  const auto *end = p + bytes.size();

  while (p < end) {
    uint8_t lead = *p;

    // Clipboard text is mostly ASCII
    if (KLIP_LIKELY(lead < 0x80)) {
      ++p;
      continue;
    }

    size_t length;
    uint32_t cp;
    if ((lead & 0xE0) == 0xC0) {
      length = 2;
      cp = lead & 0x1F;
    } else if ((lead & 0xF0) == 0xE0) {
      length = 3;
      cp = lead & 0x0F;
    } else if ((lead & 0xF8) == 0xF0) {
      length = 4;
      cp = lead & 0x07;
    } else {
      return false;
    }

    if (static_cast<size_t>(end - p) < length) {
      return false;
    }

    for (size_t i = 1; i < length; ++i) {
      if ((p[i] & 0xC0) != 0x80) {
        return false;
      }
      cp = (cp << 6) | (p[i] & 0x3F);
    }

    // Overlong encodings
    if ((length == 2 && cp < 0x80) || (length == 3 && cp < 0x800) ||
        (length == 4 && cp < 0x10000)) {
      return false;
    }

    if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
      return false;
    }

    p += length;
  }

  return true;
}

size_t count_scalar_values(std::string_view text) {
  size_t count = 0;
  for (char c : text) {
    if ((static_cast<uint8_t>(c) & 0xC0) != 0x80) {
      ++count;
    }
  }
  return count;
}

} // namespace klip
