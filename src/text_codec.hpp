#pragma once

#include <string>

#include "protocol.hpp"

namespace proto {

// Legacy JSON shape. Empty strings, zero numbers and empty lists are
// omitted; peer_id has no legacy field and is never written.
std::string encode_text(const Message& m);

// Throws std::runtime_error on invalid JSON, a missing "type", or a field
// of the wrong JSON type. Unrecognised keys are ignored.
Message decode_text(const std::string& text);

} // namespace proto
