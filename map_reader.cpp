#include <stdio.h>
#include <string.h>
#include <errno.h>
#include <fcntl.h>
#include <unistd.h>
#include <sys/stat.h>
#include <sys/mman.h>
#include <string>
#include <vector>
#include <memory>
#include <algorithm>
#include "map_reader.hpp"
#include "tile_block.hpp"
#include "projection.hpp"
#include "errors.hpp"

mf_source::~mf_source() {
	if (map != NULL) {
		if (munmap((void *) map, len) != 0) {
			perror("munmap");
		}
	}
}

size_t mf_source::interval_index(int zoom) const {
	int i = header.interval_for_zoom(zoom);
	if (i < 0) {
		throw mf_error(mf_no_coverage, "no zoom interval covers zoom " + std::to_string(zoom));
	}
	return i;
}

mf_zoom_interval const &mf_source::interval_for_zoom(int zoom) const {
	return header.zoom_intervals[interval_index(zoom)];
}

void mf_source::check_tile(int zoom, long long x, long long y) const {
	check_zoom(zoom);

	long long n = 1LL << zoom;
	if (x < 0 || y < 0 || x >= n || y >= n) {
		throw mf_error(mf_tile_out_of_range, "tile " + std::to_string(zoom) + "/" + std::to_string(x) + "/" + std::to_string(y) + " does not exist");
	}
}

unsigned subtile_mask(int diff, long long x, long long y) {
	if (diff <= 0) {
		return MF_ALL_SUBTILES;
	}

	if (diff == 1) {
		static const unsigned quadrants[4] = {
			0xCC00,	 // upper left
			0x3300,	 // upper right
			0x00CC,	 // lower left
			0x0033,	 // lower right
		};

		return quadrants[((y & 1) << 1) | (x & 1)];
	}

	// Two or more levels down, the tile lies within a single cell of the 4x4 grid
	long long sx = (x >> (diff - 2)) & 3;
	long long sy = (y >> (diff - 2)) & 3;
	return 0x8000 >> (sy * 4 + sx);
}

void mf_source::decode_base_tile(size_t interval, long long row, long long col, unsigned subtile_filter, std::vector<mf_feature> &out) const {
	mf_zoom_interval const &zi = header.zoom_intervals[interval];
	mf_tile_index const &index = indices[interval];

	// Nothing is stored for tiles outside the bounding box
	if (row < zi.first_row || row >= zi.first_row + zi.rows || col < zi.first_col || col >= zi.first_col + zi.cols) {
		return;
	}

	size_t entry = index.position(row - zi.first_row, col - zi.first_col);
	unsigned long long start, end;
	index.block_range(entry, &start, &end);

	std::vector<mf_feature> features = decode_tile_block(map, len, start, end, header, tile_origin(zi.base_zoom, row, col), subtile_filter);
	for (auto &f : features) {
		out.push_back(std::move(f));
	}
}

std::vector<mf_feature> mf_source::features_for_tile(int zoom, long long x, long long y) const {
	check_tile(zoom, x, y);

	size_t i = interval_index(zoom);
	mf_zoom_interval const &zi = header.zoom_intervals[i];
	std::vector<mf_feature> out;

	if (zoom >= zi.base_zoom) {
		int diff = zoom - zi.base_zoom;
		decode_base_tile(i, y >> diff, x >> diff, subtile_mask(diff, x, y), out);

		if (diff > 0) {
			// POIs carry no sub-tile bitmap, so keep only the ones inside this tile
			mf_latlon nw = tile_origin(zoom, y, x);
			mf_latlon se = tile_origin(zoom, y + 1, x + 1);

			out.erase(std::remove_if(out.begin(), out.end(), [&](mf_feature const &f) {
					  if (!f.is_poi()) {
						  return false;
					  }
					  mf_latlon const &p = f.poi().position;
					  return p.lat > nw.lat || p.lat < se.lat || p.lon < nw.lon || p.lon > se.lon;
				  }),
				  out.end());
		}
	} else {
		// A coarser tile is made of every base tile it contains, clipped to the index grid
		int diff = zi.base_zoom - zoom;
		long long row0 = std::max(y << diff, zi.first_row);
		long long row1 = std::min(((y + 1) << diff) - 1, zi.first_row + zi.rows - 1);
		long long col0 = std::max(x << diff, zi.first_col);
		long long col1 = std::min(((x + 1) << diff) - 1, zi.first_col + zi.cols - 1);

		for (long long row = row0; row <= row1; row++) {
			for (long long col = col0; col <= col1; col++) {
				decode_base_tile(i, row, col, MF_ALL_SUBTILES, out);
			}
		}
	}

	return out;
}

bool mf_source::is_water(int zoom, long long x, long long y) const {
	check_tile(zoom, x, y);

	size_t i = interval_index(zoom);
	mf_zoom_interval const &zi = header.zoom_intervals[i];
	mf_tile_index const &index = indices[i];

	long long row0, row1, col0, col1;
	if (zoom >= zi.base_zoom) {
		int diff = zoom - zi.base_zoom;
		row0 = row1 = y >> diff;
		col0 = col1 = x >> diff;
	} else {
		int diff = zi.base_zoom - zoom;
		row0 = y << diff;
		row1 = ((y + 1) << diff) - 1;
		col0 = x << diff;
		col1 = ((x + 1) << diff) - 1;
	}

	row0 = std::max(row0, zi.first_row);
	row1 = std::min(row1, zi.first_row + zi.rows - 1);
	col0 = std::max(col0, zi.first_col);
	col1 = std::min(col1, zi.first_col + zi.cols - 1);

	if (row0 > row1 || col0 > col1) {
		return false;
	}

	for (long long row = row0; row <= row1; row++) {
		for (long long col = col0; col <= col1; col++) {
			if (!index.entries[index.position(row - zi.first_row, col - zi.first_col)].water) {
				return false;
			}
		}
	}

	return true;
}

void mf_source::tile_range(int zoom, long long *min_x, long long *min_y, long long *max_x, long long *max_y) const {
	check_zoom(zoom);
	bbox_tile_range(header.bbox, zoom, min_y, min_x, max_y, max_x);
}

static void check_magic(int fd) {
	char magic[MF_MAGIC_LEN];
	ssize_t n = pread(fd, magic, MF_MAGIC_LEN, 0);

	if (n < 0) {
		int err = errno;
		close(fd);
		throw mf_error(mf_io_error, std::string("read: ") + strerror(err));
	}
	if (n < MF_MAGIC_LEN || memcmp(magic, MF_MAGIC, MF_MAGIC_LEN) != 0) {
		close(fd);
		throw mf_error(mf_unsupported_format, "not a mapsforge binary map file");
	}
}

std::unique_ptr<mf_source> open_map(const char *path) {
	int fd = open(path, O_RDONLY | O_CLOEXEC);
	if (fd < 0) {
		throw mf_error(mf_io_error, std::string("open: ") + strerror(errno));
	}

	check_magic(fd);

	struct stat st;
	if (fstat(fd, &st) != 0) {
		int err = errno;
		close(fd);
		throw mf_error(mf_io_error, std::string("fstat: ") + strerror(err));
	}

	std::unique_ptr<mf_source> src = std::make_unique<mf_source>();
	src->path = path;

	void *map = mmap(NULL, st.st_size, PROT_READ, MAP_PRIVATE, fd, 0);
	if (map == MAP_FAILED) {
		int err = errno;
		close(fd);
		throw mf_error(mf_io_error, std::string("mmap: ") + strerror(err));
	}
	src->map = (const char *) map;
	src->len = st.st_size;

	if (close(fd) != 0) {
		throw mf_error(mf_io_error, std::string("close: ") + strerror(errno));
	}

	src->header = parse_header(src->map, src->len);

	if (src->header.file_size != src->len && !quiet) {
		fprintf(stderr, "%s: Warning: file is %zu bytes but its header says %llu\n", path, src->len, src->header.file_size);
	}

	for (auto const &zi : src->header.zoom_intervals) {
		if (zi.start + zi.length > src->len && !quiet) {
			fprintf(stderr, "%s: Warning: subfile for zoom %d-%d extends %llu bytes past the end of the file\n", path, zi.min_zoom, zi.max_zoom, zi.start + zi.length - src->len);
		}

		src->indices.push_back(build_tile_index(src->map, src->len, src->header, zi));
	}

	return src;
}
