#include <string.h>
#include <string>
#include "tile_index.hpp"
#include "cursor.hpp"
#include "errors.hpp"

size_t mf_tile_index::position(long long row, long long col) const {
	if (row < 0 || row >= rows || col < 0 || col >= cols) {
		throw mf_error(mf_tile_out_of_range, "tile index position " + std::to_string(row) + "," + std::to_string(col) + " is outside the " + std::to_string(rows) + "x" + std::to_string(cols) + " grid");
	}

	return row * cols + col;
}

void mf_tile_index::block_range(size_t entry, unsigned long long *start, unsigned long long *end) const {
	*start = entries[entry].offset;

	if (entries[entry].last) {
		*end = subfile_end;
	} else {
		*end = entries[entry + 1].offset;
	}
}

mf_tile_index build_tile_index(const char *map, size_t len, mf_header const &header, mf_zoom_interval const &interval) {
	std::string where = "tile index for zoom " + std::to_string(interval.min_zoom) + "-" + std::to_string(interval.max_zoom);

	mf_tile_index index;
	index.rows = interval.rows;
	index.cols = interval.cols;
	index.subfile_end = interval.start + interval.length;

	mf_cursor c(map, len, interval.start, mf_corrupt_header, mf_corrupt_header);

	if (header.debug) {
		const char *sig = c.take(MF_INDEX_SIGNATURE_LEN, where.c_str());
		if (memcmp(sig, MF_INDEX_SIGNATURE, MF_INDEX_SIGNATURE_LEN) != 0) {
			throw mf_error(mf_corrupt_header, where + ": missing index signature");
		}
	}

	unsigned long long count = interval.entry_count();
	if (count > c.remaining() / MF_INDEX_ENTRY_BYTES) {
		throw mf_error(mf_corrupt_header, where + ": " + std::to_string(count) + " entries run past the end of the file");
	}

	unsigned long long index_end = c.off + count * MF_INDEX_ENTRY_BYTES;
	if (index_end > index.subfile_end) {
		throw mf_error(mf_corrupt_header, where + ": " + std::to_string(count) + " entries run past the end of the subfile");
	}

	index.entries.reserve(count);
	unsigned long long prev = 0;

	for (unsigned long long i = 0; i < count; i++) {
		unsigned long long raw = c.read_u40(where.c_str());
		unsigned long long offset = interval.start + (raw & MF_INDEX_OFFSET_MASK);

		if (offset < index_end || offset >= index.subfile_end) {
			throw mf_error(mf_corrupt_header, where + ": entry " + std::to_string(i) + " points to " + std::to_string(offset) + ", outside the tile data");
		}
		if (i > 0 && offset <= prev) {
			throw mf_error(mf_corrupt_header, where + ": entry " + std::to_string(i) + " does not follow entry " + std::to_string(i - 1));
		}

		index.entries.emplace_back(offset, (raw & MF_INDEX_WATER_FLAG) != 0, i + 1 == count);
		prev = offset;
	}

	return index;
}
