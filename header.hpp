#ifndef HEADER_HPP
#define HEADER_HPP

#include <stddef.h>
#include <string>
#include <vector>
#include <optional>
#include "projection.hpp"

#define MF_MAGIC "mapsforge binary OSM"
#define MF_MAGIC_LEN 20

#define MF_MIN_VERSION 3
#define MF_MAX_VERSION 5

// Header flag bits
#define MF_FLAG_DEBUG 0x80
#define MF_FLAG_START_POSITION 0x40
#define MF_FLAG_START_ZOOM 0x20
#define MF_FLAG_LANGUAGES 0x10
#define MF_FLAG_COMMENT 0x08
#define MF_FLAG_CREATOR 0x04

struct mf_bbox {
	int min_lat = 0;
	int min_lon = 0;
	int max_lat = 0;
	int max_lon = 0;

	bool contains(mf_latlon const &p) const {
		return p.lat >= min_lat && p.lat <= max_lat && p.lon >= min_lon && p.lon <= max_lon;
	}
};

enum mf_tag_value_type {
	mf_tag_literal,
	mf_tag_byte,	// %b
	mf_tag_short,	// %h
	mf_tag_int,	// %i
	mf_tag_float,	// %f
	mf_tag_string,	// %s
};

struct mf_tag {
	std::string key;
	std::string value;
	int /* mf_tag_value_type */ type = mf_tag_literal;

	// "key=value", for tags whose value is not stored per feature
	std::string literal() const {
		return key + "=" + value;
	}
};

struct mf_zoom_interval {
	int base_zoom = 0;
	int min_zoom = 0;
	int max_zoom = 0;
	unsigned long long start = 0;  // absolute offset of the subfile
	unsigned long long length = 0;

	// Tiles of the bounding box at the base zoom, which the tile index covers in row-major order
	long long first_row = 0;
	long long first_col = 0;
	long long rows = 0;
	long long cols = 0;

	unsigned long long entry_count() const {
		return rows * cols;
	}

	bool covers(int zoom) const {
		return zoom >= min_zoom && zoom <= max_zoom;
	}
};

struct mf_header {
	unsigned long version = 0;
	unsigned long long file_size = 0;
	unsigned long long creation_date = 0;  // milliseconds since 1970
	mf_bbox bbox;
	unsigned tile_size = 0;
	std::string projection;
	bool debug = false;
	std::optional<mf_latlon> start_position;
	std::optional<int> start_zoom;
	std::optional<std::string> preferred_languages;
	std::optional<std::string> comment;
	std::optional<std::string> created_by;
	std::vector<mf_tag> poi_tags{};
	std::vector<mf_tag> way_tags{};
	std::vector<mf_zoom_interval> zoom_intervals{};

	// Bytes from the start of the file to the end of the header
	size_t header_bytes = 0;

	// Index into zoom_intervals of the interval covering zoom, or -1
	int interval_for_zoom(int zoom) const;
};

mf_header parse_header(const char *map, size_t len);

// Tiles at zoom covering the bounding box. A south or east edge that falls
// exactly on a tile boundary does not pull in the tile beyond it.
void bbox_tile_range(mf_bbox const &bbox, int zoom, long long *min_row, long long *min_col, long long *max_row, long long *max_col);

#endif
