#ifndef VARINT_HPP
#define VARINT_HPP

#include <stddef.h>

// Map file varints are little-endian groups of 7 bits with the continuation
// flag in the high bit of each byte, at most 5 bytes long.
#define MF_MAX_VARINT_BYTES 5

// Decode the varint starting at data[off]; *next receives the offset just past it.
// Throws mf_error (mf_truncated_data or mf_varint_too_long).
unsigned long long read_unsigned_varint(const char *data, size_t len, size_t off, size_t *next);

// As above, followed by zig-zag decoding
long long read_signed_varint(const char *data, size_t len, size_t off, size_t *next);

#endif
