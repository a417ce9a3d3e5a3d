#include <stdio.h>
#include <math.h>
#include <stdlib.h>
#include <string.h>
#include <cmath>
#include "text.hpp"
#include "projection.hpp"
#include "errors.hpp"

// Length of the sequence that lead byte c starts, and the range of second
// bytes that keep it well-formed. 0 if c cannot start a sequence.
static size_t utf8_sequence(unsigned char c, unsigned char *lo, unsigned char *hi) {
	*lo = 0x80;
	*hi = 0xBF;

	if (c < 0x80) {
		return 1;
	} else if (c >= 0xC2 && c <= 0xDF) {
		return 2;
	} else if (c >= 0xE0 && c <= 0xEF) {
		if (c == 0xE0) {
			*lo = 0xA0;
		} else if (c == 0xED) {
			*hi = 0x9F;
		}
		return 3;
	} else if (c >= 0xF0 && c <= 0xF4) {
		if (c == 0xF0) {
			*lo = 0x90;
		} else if (c == 0xF4) {
			*hi = 0x8F;
		}
		return 4;
	}

	return 0;
}

/**
 * Returns an empty string if `s` is well-formed UTF-8;
 * otherwise returns an error message showing the offending bytes.
 */
std::string check_utf8(std::string const &s) {
	for (size_t i = 0; i < s.size(); i++) {
		unsigned char lo, hi;
		size_t len = utf8_sequence(s[i], &lo, &hi);
		size_t fail = 0;

		if (len == 0) {
			fail = 1;
		} else if (len > 1) {
			if (i + len > s.size()) {
				fail = len;
			} else {
				unsigned char second = s[i + 1];
				if (second < lo || second > hi) {
					fail = len;
				}
				for (size_t j = 2; j < len; j++) {
					if ((s[i + j] & 0xC0) != 0x80) {
						fail = len;
					}
				}
			}
		}

		if (fail != 0) {
			std::string out = "\"" + s + "\" is not valid UTF-8 (";
			for (size_t j = 0; j < fail && i + j < s.size(); j++) {
				if (j != 0) {
					out += " ";
				}
				char tmp[6];
				snprintf(tmp, sizeof(tmp), "0x%02X", s[i + j] & 0xFF);
				out += std::string(tmp);
			}
			out += ")";
			return out;
		}

		i += len - 1;
	}

	return "";
}

int integer_zoom(std::string where, std::string text) {
	char *end;
	double d = strtod(text.c_str(), &end);
	if (text.size() == 0 || *end != '\0' || !std::isfinite(d) || d != floor(d) || d < 0 || d > MF_MAX_ZOOM) {
		fprintf(stderr, "%s: Expected integer zoom level from 0 to %d, not %s\n", where.c_str(), MF_MAX_ZOOM, text.c_str());
		exit(EXIT_ARGS);
	}
	return d;
}

long long integer_tile(std::string where, std::string text, int zoom) {
	char *end;
	long long v = strtoll(text.c_str(), &end, 10);
	if (text.size() == 0 || *end != '\0' || v < 0 || v >= (1LL << zoom)) {
		fprintf(stderr, "%s: Expected tile coordinate from 0 to %lld at zoom %d, not %s\n", where.c_str(), (1LL << zoom) - 1, zoom, text.c_str());
		exit(EXIT_ARGS);
	}
	return v;
}
