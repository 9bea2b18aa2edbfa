#pragma once
// Options.hpp – Decode policies and logging settings.

#include <string>

namespace bitpacket {

// What to do with the unused low bits of the last byte of a BitStructure.
enum class PaddingPolicy {
    Ignore,      // Skip them; encode always writes zeros
    RequireZero, // Throw NonZeroPadding unless they are all zero
};

// Carried by a ByteReader and seen by every field decoding from it.
struct DecodeOptions {
    PaddingPolicy padding{PaddingPolicy::Ignore};
    bool          reject_trailing_bytes{false}; // Field::setBytes only
};

struct Options {
    DecodeOptions decode;
    std::string   log_level{"warn"}; // spdlog level name
};

} // namespace bitpacket
