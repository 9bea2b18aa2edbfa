#pragma once
// Error.hpp – Exception types raised by BitPacket fields and containers.
//
// Every error is thrown at the point of violation; nothing is retried and
// no partial decode is rolled back.  Catch FieldError for the whole family.

#include <stdexcept>

namespace bitpacket {

class FieldError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// A container already holds a child with the same name.
class NameConflict : public FieldError {
public:
    using FieldError::FieldError;
};

// A path segment does not exist (or has not been decoded yet).
class KeyNotFound : public FieldError {
public:
    using FieldError::FieldError;
};

// A non-terminal path segment names a leaf.
class NotAContainer : public FieldError {
public:
    using FieldError::FieldError;
};

// A value does not fit the field's declared width.
class SizeExceeded : public FieldError {
public:
    using FieldError::FieldError;
};

// A value length differs from the length resolved for the field.
class LengthMismatch : public FieldError {
public:
    using FieldError::FieldError;
};

// Data content does not fit its length field.
class ValueTooLong : public FieldError {
public:
    using FieldError::FieldError;
};

// Fewer bytes remain in the stream than the field needs, or bytes are left over.
class StreamLengthMismatch : public FieldError {
public:
    using FieldError::FieldError;
};

// Wrong field type for an array, or wrong Value alternative for a field.
class TypeError : public FieldError {
public:
    using FieldError::FieldError;
};

// A MetaField was used before decode or bind created its delegate.
class NotMaterialized : public FieldError {
public:
    using FieldError::FieldError;
};

// A byte field inside a BitStructure, or a bit field outside of one.
class UnsupportedNesting : public FieldError {
public:
    using FieldError::FieldError;
};

// Array index assignment past the end + 1.
class IndexError : public FieldError {
public:
    using FieldError::FieldError;
};

// Direct assignment to a field the library keeps in sync itself.
class ReadOnlyField : public FieldError {
public:
    using FieldError::FieldError;
};

// Trailing pad bits of a BitStructure were not zero (strict padding only).
class NonZeroPadding : public FieldError {
public:
    using FieldError::FieldError;
};

} // namespace bitpacket
