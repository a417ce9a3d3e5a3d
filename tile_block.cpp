#include <stdio.h>
#include <string.h>
#include <limits.h>
#include <string>
#include <vector>
#include <algorithm>
#include "tile_block.hpp"
#include "cursor.hpp"
#include "errors.hpp"

// Smallest possible records: a POI is two position deltas, layer, tag count and flags,
// a way is its size and sub-tile bitmap
#define MIN_POI_BYTES 5
#define MIN_WAY_BYTES 3
#define MIN_PATH_BYTES 3

static void check_signature(mf_cursor &c, const char *signature, const char *what) {
	size_t at = c.off;
	const char *p = c.take(MF_SIGNATURE_LEN, what);

	if (memcmp(p, signature, strlen(signature)) != 0) {
		c.fail(mf_corrupt_tile_block, std::string("missing ") + what + " signature at offset " + std::to_string(at));
	}
}

static int add_delta(mf_cursor const &c, long long base, long long delta, const char *what) {
	long long v = base + delta;

	if (v < INT_MIN || v > INT_MAX) {
		c.fail(mf_corrupt_tile_block, std::string(what) + ": coordinate " + std::to_string(v) + " at offset " + std::to_string(c.off) + " is out of range");
	}

	return v;
}

static mf_latlon read_position(mf_cursor &c, mf_latlon const &from, const char *what) {
	long long dlat = c.read_svarint(what);
	long long dlon = c.read_svarint(what);

	return mf_latlon(add_delta(c, from.lat, dlat, what), add_delta(c, from.lon, dlon, what));
}

static std::string format_float(float f) {
	char buf[50];
	snprintf(buf, sizeof(buf), "%g", f);
	return buf;
}

// Tag ids, then the values of any tags that leave them to the feature
static void read_tags(mf_cursor &c, std::vector<mf_tag> const &table, const char *kind, std::vector<std::string> &out) {
	unsigned long long n = c.read_uvarint("tag count");
	if (n > c.remaining()) {
		c.fail(c.truncation, std::string(kind) + ": " + std::to_string(n) + " tags at offset " + std::to_string(c.off) + " run past the end");
	}

	std::vector<const mf_tag *> tags;
	tags.reserve(n);

	for (size_t i = 0; i < n; i++) {
		unsigned long long id = c.read_uvarint("tag id");
		if (id >= table.size()) {
			throw mf_error(mf_corrupt_header, std::string(kind) + " tag id " + std::to_string(id) + " is beyond the " + std::to_string(table.size()) + " tags in the header");
		}
		tags.push_back(&table[id]);
	}

	for (auto tag : tags) {
		switch (tag->type) {
		case mf_tag_literal:
			out.push_back(tag->literal());
			break;

		case mf_tag_byte:
			out.push_back(tag->key + "=" + std::to_string(c.read_i8("tag value")));
			break;

		case mf_tag_short:
			out.push_back(tag->key + "=" + std::to_string(c.read_i16("tag value")));
			break;

		case mf_tag_int:
			out.push_back(tag->key + "=" + std::to_string(c.read_i32("tag value")));
			break;

		case mf_tag_float:
			out.push_back(tag->key + "=" + format_float(c.read_f32("tag value")));
			break;

		case mf_tag_string:
			out.push_back(tag->key + "=" + c.read_string("tag value"));
			break;
		}
	}
}

static void read_poi(mf_cursor &c, mf_header const &header, mf_latlon const &origin, std::vector<mf_feature> &out) {
	if (header.debug) {
		check_signature(c, MF_POI_SIGNATURE, "POI");
	}

	mf_feature f;
	mf_poi poi;

	poi.position = read_position(c, origin, "POI position");
	f.layer = std::min(c.read_u8("POI layer"), (unsigned) MF_MAX_LAYER);
	read_tags(c, header.poi_tags, "POI", f.tags);

	// Bits below MF_POI_ELEVATION are unassigned
	unsigned flags = c.read_u8("POI flags");
	if (flags & MF_POI_NAME) {
		f.name = c.read_string("POI name");
	}
	if (flags & MF_POI_HOUSE_NUMBER) {
		f.house_number = c.read_string("POI house number");
	}
	if (flags & MF_POI_ELEVATION) {
		f.elevation = c.read_svarint("POI elevation");
	}

	f.geometry = std::move(poi);
	out.push_back(std::move(f));
}

static std::vector<mf_latlon> read_path(mf_cursor &c, mf_latlon const &origin, bool double_delta) {
	unsigned long long n = c.read_uvarint("node count");
	if (n == 0) {
		c.fail(mf_corrupt_tile_block, "way path at offset " + std::to_string(c.off) + " has no nodes");
	}
	if (n > c.remaining() / 2) {
		c.fail(c.truncation, std::to_string(n) + " way nodes at offset " + std::to_string(c.off) + " run past the end");
	}

	std::vector<mf_latlon> path;
	path.reserve(n);

	mf_latlon here = read_position(c, origin, "way node");
	path.push_back(here);

	// With double deltas, each delta is a change to the previous step rather than the step itself
	long long step_lat = 0, step_lon = 0;
	for (size_t i = 1; i < n; i++) {
		long long dlat = c.read_svarint("way node");
		long long dlon = c.read_svarint("way node");

		if (double_delta) {
			step_lat += dlat;
			step_lon += dlon;
		} else {
			step_lat = dlat;
			step_lon = dlon;
		}

		here = mf_latlon(add_delta(c, here.lat, step_lat, "way node"), add_delta(c, here.lon, step_lon, "way node"));
		path.push_back(here);
	}

	return path;
}

static void read_way(mf_cursor &c, mf_header const &header, mf_latlon const &origin, unsigned subtile_filter, std::vector<mf_feature> &out) {
	if (header.debug) {
		check_signature(c, MF_WAY_SIGNATURE, "way");
	}

	unsigned long long size = c.read_uvarint("way size");
	if (size > c.remaining()) {
		c.fail(c.truncation, "way of " + std::to_string(size) + " bytes at offset " + std::to_string(c.off) + " runs past the end");
	}

	size_t way_end = c.off + size;

	// Within the way, running out of bytes means the size was wrong, not that the block is short
	mf_cursor w(c.data, way_end, c.off, mf_corrupt_tile_block, mf_corrupt_tile_block);
	c.skip(size, "way");

	unsigned bitmap = w.read_u16("way sub-tile bitmap");
	if ((bitmap & subtile_filter) == 0) {
		return;
	}

	mf_feature f;
	mf_way way;

	way.subtile_bitmap = bitmap;
	f.layer = std::min(w.read_u8("way layer"), (unsigned) MF_MAX_LAYER);
	read_tags(w, header.way_tags, "way", f.tags);

	unsigned flags = w.read_u8("way flags");
	if (flags & MF_WAY_NAME) {
		f.name = w.read_string("way name");
	}
	if (flags & MF_WAY_HOUSE_NUMBER) {
		f.house_number = w.read_string("way house number");
	}
	if (flags & MF_WAY_ELEVATION) {
		f.elevation = w.read_svarint("way elevation");
	}
	if (flags & MF_WAY_REF) {
		way.ref = w.read_string("way reference");
	}
	if (flags & MF_WAY_LABEL_POSITION) {
		way.label_position = read_position(w, origin, "way label position");
	}

	unsigned long long npaths = 1;
	if (flags & MF_WAY_PATH_COUNT) {
		npaths = w.read_uvarint("way path count");
		if (npaths == 0) {
			w.fail(mf_corrupt_tile_block, "way at offset " + std::to_string(way_end - size) + " has no paths");
		}
		if (npaths > w.remaining() / MIN_PATH_BYTES) {
			w.fail(mf_corrupt_tile_block, std::to_string(npaths) + " way paths run past the end of the way");
		}
	}

	way.is_area = (flags & MF_WAY_AREA) != 0;
	bool double_delta = (flags & MF_WAY_DOUBLE_DELTA) != 0;

	way.paths.reserve(npaths);
	for (size_t i = 0; i < npaths; i++) {
		way.paths.push_back(read_path(w, origin, double_delta));
	}

	if (!w.at_end()) {
		w.fail(mf_corrupt_tile_block, "way at offset " + std::to_string(way_end - size) + " has " + std::to_string(w.remaining()) + " bytes beyond its last node");
	}

	f.geometry = std::move(way);
	out.push_back(std::move(f));
}

std::vector<mf_feature> decode_tile_block(const char *map, size_t len, unsigned long long start, unsigned long long end, mf_header const &header, mf_latlon const &origin, unsigned subtile_filter) {
	// A file cut short still decodes as far as it goes
	size_t limit = end < len ? end : len;

	mf_cursor c(map, limit, start, mf_truncated_tile_block, mf_corrupt_tile_block);
	std::vector<mf_feature> features;

	if (header.debug) {
		check_signature(c, MF_TILE_SIGNATURE, "tile");
	}

	size_t signature = header.debug ? MF_SIGNATURE_LEN : 0;

	// A count larger than the remaining bytes could hold means the block is short
	unsigned long long npoi = c.read_uvarint("POI count");
	if (npoi > c.remaining() / (MIN_POI_BYTES + signature)) {
		c.fail(c.truncation, std::to_string(npoi) + " POIs in tile at " + std::to_string(start) + " run past the end of the block");
	}

	for (size_t i = 0; i < npoi; i++) {
		read_poi(c, header, origin, features);
	}

	unsigned long long nway = c.read_uvarint("way count");
	if (nway > c.remaining() / (MIN_WAY_BYTES + signature)) {
		c.fail(c.truncation, std::to_string(nway) + " ways in tile at " + std::to_string(start) + " run past the end of the block");
	}

	for (size_t i = 0; i < nway; i++) {
		read_way(c, header, origin, subtile_filter, features);
	}

	if (c.off != end) {
		if (end > len) {
			c.fail(mf_truncated_tile_block, "tile at " + std::to_string(start) + " ends at " + std::to_string(end) + ", past the end of the file");
		}
		c.fail(mf_corrupt_tile_block, "tile at " + std::to_string(start) + " has " + std::to_string(end - c.off) + " bytes after its last way");
	}

	return features;
}
