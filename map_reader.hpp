#ifndef MAP_READER_HPP
#define MAP_READER_HPP

#include <stddef.h>
#include <string>
#include <vector>
#include <memory>
#include "header.hpp"
#include "tile_index.hpp"
#include "feature.hpp"

extern int quiet;

// An open map file. The header and indices never change after open_map,
// so any number of threads may call the const methods at once.
struct mf_source {
	std::string path;
	const char *map = NULL;
	size_t len = 0;

	mf_header header;
	std::vector<mf_tile_index> indices{};  // parallel to header.zoom_intervals

	mf_source() {
	}

	mf_source(mf_source const &) = delete;
	mf_source &operator=(mf_source const &) = delete;

	~mf_source();

	// Throws mf_error(mf_no_coverage) if no interval covers zoom
	mf_zoom_interval const &interval_for_zoom(int zoom) const;

	// Features of tile x (column), y (row) at zoom
	std::vector<mf_feature> features_for_tile(int zoom, long long x, long long y) const;

	// Whether the index marks everything the tile covers as water
	bool is_water(int zoom, long long x, long long y) const;

	// Tiles at zoom covering the map's bounding box
	void tile_range(int zoom, long long *min_x, long long *min_y, long long *max_x, long long *max_y) const;

	mf_bbox const &bounds() const {
		return header.bbox;
	}

	// Index into header.zoom_intervals and indices; throws like interval_for_zoom
	size_t interval_index(int zoom) const;
	void check_tile(int zoom, long long x, long long y) const;
	void decode_base_tile(size_t interval, long long row, long long col, unsigned subtile_filter, std::vector<mf_feature> &out) const;
};

// Opens, maps and indexes a map file.
// Throws mf_error(mf_io_error, mf_unsupported_format or mf_corrupt_header).
std::unique_ptr<mf_source> open_map(const char *path);

// Bits of a way's sub-tile bitmap that touch tile (x, y), diff zoom levels
// below the base tile that contains it
unsigned subtile_mask(int diff, long long x, long long y);

#endif
