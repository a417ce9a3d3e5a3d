#include <stdio.h>
#include <stdlib.h>
#include "errors.hpp"

const char *mf_error_kind_name(mf_error_kind kind) {
	switch (kind) {
	case mf_unsupported_format:
		return "unsupported format";
	case mf_corrupt_header:
		return "corrupt header";
	case mf_truncated_data:
		return "truncated data";
	case mf_varint_too_long:
		return "varint too long";
	case mf_truncated_tile_block:
		return "truncated tile block";
	case mf_corrupt_tile_block:
		return "corrupt tile block";
	case mf_tile_out_of_range:
		return "tile out of range";
	case mf_no_coverage:
		return "no coverage";
	case mf_invalid_zoom:
		return "invalid zoom";
	case mf_io_error:
		return "i/o error";
	}

	fprintf(stderr, "mf_error_kind_name: can't happen (%d)\n", (int) kind);
	exit(EXIT_IMPOSSIBLE);
}

int mf_error_exit_code(mf_error_kind kind) {
	switch (kind) {
	case mf_io_error:
		return EXIT_OPEN;

	case mf_unsupported_format:
	case mf_corrupt_header:
		return EXIT_FORMAT;

	case mf_tile_out_of_range:
	case mf_no_coverage:
	case mf_invalid_zoom:
		return EXIT_ARGS;

	default:
		return EXIT_TILE;
	}
}
