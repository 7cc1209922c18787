// ============================================================================
// Strongbox - Text Encoding
// ============================================================================
// Standard base64 (RFC 4648, with padding) used for sealed records in the
// data file. Decoding is strict: no whitespace, no missing padding.
// ============================================================================

#ifndef STRONGBOX_ENCODING_HPP
#define STRONGBOX_ENCODING_HPP

#include "types.hpp"
#include <string>
#include <string_view>

namespace strongbox {

/// Encode bytes as padded base64
[[nodiscard]] std::string base64_encode(ByteSpan data);

/// Decode padded base64
/// @return The decoded bytes, or InvalidEncoding
[[nodiscard]] Result<ByteBuffer> base64_decode(std::string_view text);

} // namespace strongbox

#endif // STRONGBOX_ENCODING_HPP
