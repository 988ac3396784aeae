#pragma once

#include "tus/core/error.hpp"
#include "tus/core/result.hpp"
#include "tus/upload/types.hpp"

#include <string>
#include <string_view>

namespace tus::upload {

/**
 * @brief Standard base64 (RFC 4648 alphabet, '=' padding)
 */
std::string encode_base64(std::string_view bytes);

/**
 * @brief Strict base64 decoding
 *
 * Rejects characters outside the alphabet, whitespace, missing padding and
 * padding anywhere but the final one or two positions.
 */
Result<std::string> decode_base64(std::string_view text);

/**
 * @brief Parse an Upload-Metadata header value
 *
 * Grammar: pair *("," pair), pair = key [" " base64value]
 * Whitespace around a pair is ignored. Keys must be non-empty, unique and
 * contain no spaces or commas. Any violation yields
 * ErrorCode::ProtocolViolation naming the offending pair.
 */
UploadResult<Metadata> parse_metadata(std::string_view header);

/**
 * @brief Inverse of parse_metadata(); keys in map order
 */
std::string format_metadata(const Metadata& metadata);

} // namespace tus::upload
