#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <stdexcept>
#include <string>

// Process exit codes for mapsforge-decode

#define EXIT_ARGS 101
#define EXIT_OPEN 102
#define EXIT_PTHREAD 105
#define EXIT_FORMAT 106	 // unsupported or corrupt map file
#define EXIT_TILE 107	 // one or more tiles failed to decode
#define EXIT_IMPOSSIBLE 108

enum mf_error_kind {
	mf_unsupported_format,
	mf_corrupt_header,
	mf_truncated_data,
	mf_varint_too_long,
	mf_truncated_tile_block,
	mf_corrupt_tile_block,
	mf_tile_out_of_range,
	mf_no_coverage,
	mf_invalid_zoom,
	mf_io_error,
};

struct mf_error : std::runtime_error {
	mf_error_kind kind;

	mf_error(mf_error_kind k, std::string const &message)
	    : std::runtime_error(message), kind(k) {
	}
};

const char *mf_error_kind_name(mf_error_kind kind);

// Exit code for an error that ends the process
int mf_error_exit_code(mf_error_kind kind);

#endif
