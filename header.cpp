#include <string.h>
#include <string>
#include <vector>
#include <algorithm>
#include "header.hpp"
#include "cursor.hpp"
#include "errors.hpp"

static mf_tag parse_tag(std::string const &s, unsigned long version, const char *table) {
	size_t eq = s.find('=');
	if (eq == std::string::npos) {
		throw mf_error(mf_corrupt_header, std::string(table) + " \"" + s + "\" is not of the form key=value");
	}

	mf_tag tag;
	tag.key = s.substr(0, eq);
	tag.value = s.substr(eq + 1);

	// Version 5 lets a tag leave its value to each feature
	if (version >= 5 && tag.value.size() == 2 && tag.value[0] == '%') {
		switch (tag.value[1]) {
		case 'b':
			tag.type = mf_tag_byte;
			break;
		case 'h':
			tag.type = mf_tag_short;
			break;
		case 'i':
			tag.type = mf_tag_int;
			break;
		case 'f':
			tag.type = mf_tag_float;
			break;
		case 's':
			tag.type = mf_tag_string;
			break;
		default:
			break;
		}
	}

	return tag;
}

static void check_bbox(mf_bbox const &b) {
	if (b.min_lat > b.max_lat || b.min_lon > b.max_lon) {
		throw mf_error(mf_corrupt_header, "bounding box " + std::to_string(b.min_lat) + "," + std::to_string(b.min_lon) + "," + std::to_string(b.max_lat) + "," + std::to_string(b.max_lon) + " is inverted");
	}
	if (b.min_lat < -90000000 || b.max_lat > 90000000 || b.min_lon < -180000000 || b.max_lon > 180000000) {
		throw mf_error(mf_corrupt_header, "bounding box " + std::to_string(b.min_lat) + "," + std::to_string(b.min_lon) + "," + std::to_string(b.max_lat) + "," + std::to_string(b.max_lon) + " is outside the world");
	}
}

static std::string interval_name(mf_zoom_interval const &zi) {
	return "zoom interval " + std::to_string(zi.min_zoom) + "-" + std::to_string(zi.max_zoom) + " (base " + std::to_string(zi.base_zoom) + ")";
}

// The intervals must partition their combined zoom range:
// sorted by base zoom, each must begin just past where the previous one ends.
static void check_intervals(mf_header const &h, size_t len) {
	if (h.zoom_intervals.size() == 0) {
		throw mf_error(mf_corrupt_header, "no zoom intervals");
	}

	for (auto const &zi : h.zoom_intervals) {
		if (zi.min_zoom > zi.max_zoom) {
			throw mf_error(mf_corrupt_header, interval_name(zi) + " has min zoom above max zoom");
		}
		if (zi.base_zoom < zi.min_zoom || zi.base_zoom > zi.max_zoom) {
			throw mf_error(mf_corrupt_header, interval_name(zi) + " has its base zoom outside the interval");
		}
		if (zi.max_zoom > MF_MAX_ZOOM) {
			throw mf_error(mf_corrupt_header, interval_name(zi) + " goes beyond zoom " + std::to_string(MF_MAX_ZOOM));
		}
		if (zi.start < h.header_bytes) {
			throw mf_error(mf_corrupt_header, interval_name(zi) + " has its subfile at " + std::to_string(zi.start) + ", inside the header");
		}
		if (zi.start >= len) {
			throw mf_error(mf_corrupt_header, interval_name(zi) + " has its subfile at " + std::to_string(zi.start) + ", past the end of the file");
		}
	}

	std::vector<mf_zoom_interval> sorted = h.zoom_intervals;
	std::stable_sort(sorted.begin(), sorted.end(), [](mf_zoom_interval const &a, mf_zoom_interval const &b) {
		return a.base_zoom < b.base_zoom;
	});

	for (size_t i = 1; i < sorted.size(); i++) {
		if (sorted[i].min_zoom <= sorted[i - 1].max_zoom) {
			throw mf_error(mf_corrupt_header, interval_name(sorted[i]) + " overlaps " + interval_name(sorted[i - 1]));
		}
		if (sorted[i].min_zoom != sorted[i - 1].max_zoom + 1) {
			throw mf_error(mf_corrupt_header, "gap between " + interval_name(sorted[i - 1]) + " and " + interval_name(sorted[i]));
		}
	}
}

void bbox_tile_range(mf_bbox const &bbox, int zoom, long long *min_row, long long *min_col, long long *max_row, long long *max_col) {
	latlon2tile_e6(mf_latlon(bbox.max_lat, bbox.min_lon), zoom, false, min_row, min_col);
	latlon2tile_e6(mf_latlon(bbox.min_lat, bbox.max_lon), zoom, true, max_row, max_col);

	// A bounding box that is a single tile corner would otherwise come out empty
	if (*max_row < *min_row) {
		*max_row = *min_row;
	}
	if (*max_col < *min_col) {
		*max_col = *min_col;
	}
}

static void set_grid(mf_zoom_interval &zi, mf_bbox const &bbox) {
	long long min_row, min_col, max_row, max_col;
	bbox_tile_range(bbox, zi.base_zoom, &min_row, &min_col, &max_row, &max_col);

	zi.first_row = min_row;
	zi.first_col = min_col;
	zi.rows = max_row - min_row + 1;
	zi.cols = max_col - min_col + 1;
}

int mf_header::interval_for_zoom(int zoom) const {
	int found = -1;

	for (size_t i = 0; i < zoom_intervals.size(); i++) {
		if (zoom_intervals[i].covers(zoom)) {
			if (found < 0 || zoom_intervals[i].base_zoom < zoom_intervals[found].base_zoom) {
				found = i;
			}
		}
	}

	return found;
}

mf_header parse_header(const char *map, size_t len) {
	// Nothing else is looked at until the magic matches
	if (len < MF_MAGIC_LEN || memcmp(map, MF_MAGIC, MF_MAGIC_LEN) != 0) {
		throw mf_error(mf_unsupported_format, "not a mapsforge binary map file");
	}

	mf_cursor c(map, len, MF_MAGIC_LEN, mf_corrupt_header, mf_corrupt_header);
	mf_header h;

	unsigned long header_size = c.read_u32("header size");
	if (header_size > c.remaining()) {
		throw mf_error(mf_corrupt_header, "header size " + std::to_string(header_size) + " is beyond the end of the file");
	}

	size_t header_end = c.off + header_size;
	c.len = header_end;

	h.version = c.read_u32("file version");
	if (h.version < MF_MIN_VERSION || h.version > MF_MAX_VERSION) {
		throw mf_error(mf_unsupported_format, "file version " + std::to_string(h.version) + " is not supported (only " + std::to_string(MF_MIN_VERSION) + " to " + std::to_string(MF_MAX_VERSION) + ")");
	}

	h.file_size = c.read_u64("file size");
	h.creation_date = c.read_u64("creation date");

	h.bbox.min_lat = c.read_i32("bounding box");
	h.bbox.min_lon = c.read_i32("bounding box");
	h.bbox.max_lat = c.read_i32("bounding box");
	h.bbox.max_lon = c.read_i32("bounding box");
	check_bbox(h.bbox);

	h.tile_size = c.read_u16("tile size");
	if (h.tile_size == 0) {
		throw mf_error(mf_corrupt_header, "tile size is 0");
	}

	h.projection = c.read_string("projection");
	if (h.projection != "Mercator") {
		throw mf_error(mf_unsupported_format, "projection \"" + h.projection + "\" is not supported");
	}

	unsigned flags = c.read_u8("header flags");
	h.debug = (flags & MF_FLAG_DEBUG) != 0;

	if (flags & MF_FLAG_START_POSITION) {
		int lat = c.read_i32("start position");
		int lon = c.read_i32("start position");
		h.start_position = mf_latlon(lat, lon);
	}
	if (flags & MF_FLAG_START_ZOOM) {
		h.start_zoom = c.read_u8("start zoom");
	}
	if (flags & MF_FLAG_LANGUAGES) {
		h.preferred_languages = c.read_string("preferred languages");
	}
	if (flags & MF_FLAG_COMMENT) {
		h.comment = c.read_string("comment");
	}
	if (flags & MF_FLAG_CREATOR) {
		h.created_by = c.read_string("created by");
	}

	unsigned npoi = c.read_u16("POI tag count");
	h.poi_tags.reserve(npoi);
	for (size_t i = 0; i < npoi; i++) {
		h.poi_tags.push_back(parse_tag(c.read_string("POI tag"), h.version, "POI tag"));
	}

	unsigned nway = c.read_u16("way tag count");
	h.way_tags.reserve(nway);
	for (size_t i = 0; i < nway; i++) {
		h.way_tags.push_back(parse_tag(c.read_string("way tag"), h.version, "way tag"));
	}

	unsigned nzoom = c.read_u8("zoom interval count");
	for (size_t i = 0; i < nzoom; i++) {
		mf_zoom_interval zi;

		zi.base_zoom = c.read_u8("base zoom");
		zi.min_zoom = c.read_u8("min zoom");
		zi.max_zoom = c.read_u8("max zoom");
		zi.start = c.read_u64("subfile start");
		zi.length = c.read_u64("subfile length");

		h.zoom_intervals.push_back(zi);
	}

	if (c.off != header_end) {
		throw mf_error(mf_corrupt_header, "header size is " + std::to_string(header_size) + " but its fields end " + std::to_string(header_end - c.off) + " bytes sooner");
	}
	h.header_bytes = header_end;

	check_intervals(h, len);

	for (auto &zi : h.zoom_intervals) {
		set_grid(zi, h.bbox);
	}

	return h;
}
