#ifndef CURSOR_HPP
#define CURSOR_HPP

#include <stddef.h>
#include <string>
#include "errors.hpp"

// Bounds-checked reader over [data, data + len).
//
// Running out of bytes throws mf_error(truncation); a malformed value
// (an over-long varint or a string that is not UTF-8) throws mf_error(corruption).
// The header parser and the tile decoder each choose the kinds that fit
// the data they are reading.
struct mf_cursor {
	const char *data = NULL;
	size_t len = 0;
	size_t off = 0;
	mf_error_kind truncation = mf_truncated_data;
	mf_error_kind corruption = mf_truncated_data;

	mf_cursor(const char *ndata, size_t nlen, size_t noff, mf_error_kind ntruncation, mf_error_kind ncorruption)
	    : data(ndata), len(nlen), off(noff), truncation(ntruncation), corruption(ncorruption) {
	}

	size_t remaining() const {
		return off <= len ? len - off : 0;
	}

	bool at_end() const {
		return off >= len;
	}

	// The one checked primitive: returns a pointer to the next n bytes and consumes them
	const char *take(size_t n, const char *what);

	void skip(size_t n, const char *what);

	unsigned read_u8(const char *what);
	unsigned read_u16(const char *what);
	int read_i8(const char *what);
	int read_i16(const char *what);
	unsigned long read_u32(const char *what);
	int read_i32(const char *what);
	unsigned long long read_u40(const char *what);
	unsigned long long read_u64(const char *what);
	float read_f32(const char *what);

	unsigned long long read_uvarint(const char *what);
	long long read_svarint(const char *what);

	// Unsigned varint byte count followed by that many bytes of UTF-8
	std::string read_string(const char *what);

	[[noreturn]] void fail(mf_error_kind kind, std::string const &message) const;
};

#endif
