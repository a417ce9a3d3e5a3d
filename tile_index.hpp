#ifndef TILE_INDEX_HPP
#define TILE_INDEX_HPP

#include <stddef.h>
#include <vector>
#include "header.hpp"

#define MF_INDEX_ENTRY_BYTES 5
#define MF_INDEX_WATER_FLAG 0x8000000000ULL
#define MF_INDEX_OFFSET_MASK 0x7FFFFFFFFFULL
#define MF_INDEX_SIGNATURE "+++IndexStart+++"
#define MF_INDEX_SIGNATURE_LEN 16

struct mf_tile_index_entry {
	unsigned long long offset = 0;	// absolute
	bool water = false;
	bool last = false;

	mf_tile_index_entry(unsigned long long noffset, bool nwater, bool nlast)
	    : offset(noffset), water(nwater), last(nlast) {
	}
};

// The offsets of one subfile's tile blocks, one per tile of the
// interval's base-zoom grid in row-major order.
// Rows and columns here are relative to the grid, not absolute tile numbers.
struct mf_tile_index {
	long long rows = 0;
	long long cols = 0;
	unsigned long long subfile_end = 0;
	std::vector<mf_tile_index_entry> entries{};

	// Throws mf_error(mf_tile_out_of_range) outside [0, rows) x [0, cols)
	size_t position(long long row, long long col) const;

	unsigned long long lookup(long long row, long long col) const {
		return entries[position(row, col)].offset;
	}

	bool is_last_tile(size_t entry) const {
		return entries[entry].last;
	}

	// A tile's block runs to the start of the next tile's block, or for the last tile to the end of the subfile
	void block_range(size_t entry, unsigned long long *start, unsigned long long *end) const;

	std::vector<mf_tile_index_entry>::const_iterator begin() const {
		return entries.begin();
	}

	std::vector<mf_tile_index_entry>::const_iterator end() const {
		return entries.end();
	}
};

mf_tile_index build_tile_index(const char *map, size_t len, mf_header const &header, mf_zoom_interval const &interval);

#endif
