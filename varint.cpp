#include <string>
#include <protozero/exception.hpp>
#include <protozero/varint.hpp>
#include "varint.hpp"
#include "errors.hpp"

unsigned long long read_unsigned_varint(const char *data, size_t len, size_t off, size_t *next) {
	if (off >= len) {
		throw mf_error(mf_truncated_data, "varint at offset " + std::to_string(off) + " starts past the end of the buffer");
	}

	// protozero would accept up to 10 bytes, so only let it see 5
	const char *start = data + off;
	const char *end = len - off > MF_MAX_VARINT_BYTES ? start + MF_MAX_VARINT_BYTES : data + len;
	const char *p = start;
	unsigned long long value;

	try {
		value = protozero::decode_varint(&p, end);
	} catch (protozero::end_of_buffer_exception const &) {
		if (end - start == MF_MAX_VARINT_BYTES) {
			throw mf_error(mf_varint_too_long, "varint at offset " + std::to_string(off) + " is longer than " + std::to_string(MF_MAX_VARINT_BYTES) + " bytes");
		}
		throw mf_error(mf_truncated_data, "varint at offset " + std::to_string(off) + " runs past the end of the buffer");
	} catch (protozero::varint_too_long_exception const &) {
		throw mf_error(mf_varint_too_long, "varint at offset " + std::to_string(off) + " is too long");
	}

	*next = p - data;
	return value;
}

long long read_signed_varint(const char *data, size_t len, size_t off, size_t *next) {
	unsigned long long zigzag = read_unsigned_varint(data, len, off, next);
	return protozero::decode_zigzag64(zigzag);
}
