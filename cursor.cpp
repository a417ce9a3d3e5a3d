#include <string.h>
#include <string>
#include "cursor.hpp"
#include "varint.hpp"
#include "text.hpp"

void mf_cursor::fail(mf_error_kind kind, std::string const &message) const {
	throw mf_error(kind, message);
}

const char *mf_cursor::take(size_t n, const char *what) {
	if (off > len || n > len - off) {
		fail(truncation, std::string(what) + ": need " + std::to_string(n) + " bytes at offset " + std::to_string(off) + " but only " + std::to_string(remaining()) + " remain");
	}

	const char *p = data + off;
	off += n;
	return p;
}

void mf_cursor::skip(size_t n, const char *what) {
	take(n, what);
}

// All fixed-width values are big-endian

static unsigned long long big_endian(const char *p, size_t n) {
	unsigned long long v = 0;
	for (size_t i = 0; i < n; i++) {
		v = (v << 8) | (unsigned char) p[i];
	}
	return v;
}

unsigned mf_cursor::read_u8(const char *what) {
	return (unsigned char) *take(1, what);
}

unsigned mf_cursor::read_u16(const char *what) {
	return big_endian(take(2, what), 2);
}

int mf_cursor::read_i8(const char *what) {
	return (signed char) *take(1, what);
}

int mf_cursor::read_i16(const char *what) {
	return (short) big_endian(take(2, what), 2);
}

unsigned long mf_cursor::read_u32(const char *what) {
	return big_endian(take(4, what), 4);
}

int mf_cursor::read_i32(const char *what) {
	return (int) (unsigned) big_endian(take(4, what), 4);
}

unsigned long long mf_cursor::read_u40(const char *what) {
	return big_endian(take(5, what), 5);
}

unsigned long long mf_cursor::read_u64(const char *what) {
	return big_endian(take(8, what), 8);
}

float mf_cursor::read_f32(const char *what) {
	unsigned bits = big_endian(take(4, what), 4);
	float f;
	memcpy(&f, &bits, sizeof(f));
	return f;
}

unsigned long long mf_cursor::read_uvarint(const char *what) {
	if (off > len) {
		fail(truncation, std::string(what) + ": offset " + std::to_string(off) + " is past the end");
	}

	try {
		size_t next;
		unsigned long long v = read_unsigned_varint(data, len, off, &next);
		off = next;
		return v;
	} catch (mf_error const &e) {
		if (e.kind == mf_truncated_data) {
			fail(truncation, std::string(what) + ": " + e.what());
		}
		fail(corruption, std::string(what) + ": " + e.what());
	}
}

long long mf_cursor::read_svarint(const char *what) {
	if (off > len) {
		fail(truncation, std::string(what) + ": offset " + std::to_string(off) + " is past the end");
	}

	try {
		size_t next;
		long long v = read_signed_varint(data, len, off, &next);
		off = next;
		return v;
	} catch (mf_error const &e) {
		if (e.kind == mf_truncated_data) {
			fail(truncation, std::string(what) + ": " + e.what());
		}
		fail(corruption, std::string(what) + ": " + e.what());
	}
}

std::string mf_cursor::read_string(const char *what) {
	unsigned long long n = read_uvarint(what);
	if (n > remaining()) {
		fail(truncation, std::string(what) + ": string of " + std::to_string(n) + " bytes at offset " + std::to_string(off) + " runs past the end");
	}

	const char *p = take(n, what);
	std::string s(p, n);

	std::string err = check_utf8(s);
	if (err.size() != 0) {
		fail(corruption, std::string(what) + ": " + err);
	}

	return s;
}
