/**
 * @file validator.h
 * @brief Payload checks applied before any clipboard side effect
 */

#ifndef KLIP_VALIDATOR_H
#define KLIP_VALIDATOR_H

#include "config.h"
#include "error.h"
#include "platform.h"
#include <cstddef>
#include <string_view>

namespace klip {

/**
 * @brief Check a candidate clipboard text against the size/encoding policy
 * @param text UTF-8 text
 * @param max_bytes Largest accepted byte length
 * @return TextTooLarge if text.size() > max_bytes, InvalidUtf8 if the bytes
 *         are not well-formed UTF-8, success otherwise
 *
 * Empty text is accepted. Pure; safe to call from any thread.
 */
KLIP_API Result<void> validate_text(std::string_view text,
                                    size_t max_bytes = DEFAULT_MAX_TEXT_BYTES);

/**
 * @brief Check that @p bytes are well-formed UTF-8
 *
 * Rejects overlong forms, surrogate code points (U+D800..U+DFFF) and
 * values above U+10FFFF.
 */
KLIP_API bool is_valid_utf8(std::string_view bytes);

/**
 * @brief Count Unicode scalar values in UTF-8 text
 *
 * "Hello 世界 🌍" counts 10, not its 17 bytes. Continuation bytes are
 * skipped, so the count is only meaningful for valid UTF-8.
 */
KLIP_API size_t count_scalar_values(std::string_view text);

/// Caller-visible message for an oversized payload
KLIP_API Error text_too_large_error(size_t size, size_t max_bytes);

} // namespace klip

#endif // KLIP_VALIDATOR_H
