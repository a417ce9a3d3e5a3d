#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>
#include "text.hpp"
#include "varint.hpp"
#include "projection.hpp"
#include "header.hpp"
#include "tile_index.hpp"
#include "tile_block.hpp"
#include "map_reader.hpp"
#include "errors.hpp"
#include <protozero/varint.hpp>
#include <unistd.h>
#include <limits.h>
#include <string.h>
#include <iterator>
#include <optional>

int quiet = true;

// Writes map files the way a map writer would, so the reader can be checked against known contents

struct map_builder {
	std::string out;

	void u8(unsigned v) {
		out.push_back(v & 0xFF);
	}

	void big_endian(unsigned long long v, size_t n) {
		for (size_t i = n; i > 0; i--) {
			out.push_back((v >> ((i - 1) * 8)) & 0xFF);
		}
	}

	void u16(unsigned v) {
		big_endian(v, 2);
	}

	void u32(unsigned long v) {
		big_endian(v, 4);
	}

	void i32(int v) {
		big_endian((unsigned) v, 4);
	}

	void u40(unsigned long long v) {
		big_endian(v, 5);
	}

	void u64(unsigned long long v) {
		big_endian(v, 8);
	}

	void f32(float f) {
		unsigned bits;
		memcpy(&bits, &f, sizeof(bits));
		big_endian(bits, 4);
	}

	void uvarint(unsigned long long v) {
		protozero::write_varint(std::back_inserter(out), v);
	}

	void svarint(long long v) {
		uvarint(protozero::encode_zigzag64(v));
	}

	void str(std::string const &s) {
		uvarint(s.size());
		out += s;
	}

	void signature(std::string s, size_t len) {
		s.resize(len, ' ');
		out += s;
	}
};

struct test_interval {
	int base_zoom = 10;
	int min_zoom = 10;
	int max_zoom = 12;
	std::vector<std::string> blocks{};
	std::vector<bool> water{};

	// Replaces the index that would be computed from the blocks
	std::vector<unsigned long long> raw_index{};
};

struct test_map {
	unsigned long version = 5;
	mf_bbox bbox;
	std::string projection = "Mercator";
	bool debug = false;
	std::optional<mf_latlon> start_position{};
	int start_zoom = -1;
	std::string languages;
	std::string comment;
	std::string created_by;
	std::vector<std::string> poi_tags{};
	std::vector<std::string> way_tags{};
	std::vector<test_interval> intervals{};
	long extra_header_bytes = 0;

	test_map() {
		// Exactly tile 10/550/335
		bbox.min_lat = 52500000;
		bbox.min_lon = 13400000;
		bbox.max_lat = 52600000;
		bbox.max_lon = 13600000;
	}

	std::string encode_header(std::vector<unsigned long long> const &starts, std::vector<unsigned long long> const &lengths, unsigned long long file_size) const {
		map_builder b;

		b.u32(version);
		b.u64(file_size);
		b.u64(1700000000000ULL);
		b.i32(bbox.min_lat);
		b.i32(bbox.min_lon);
		b.i32(bbox.max_lat);
		b.i32(bbox.max_lon);
		b.u16(256);
		b.str(projection);

		unsigned flags = 0;
		if (debug) {
			flags |= MF_FLAG_DEBUG;
		}
		if (start_position) {
			flags |= MF_FLAG_START_POSITION;
		}
		if (start_zoom >= 0) {
			flags |= MF_FLAG_START_ZOOM;
		}
		if (languages.size() > 0) {
			flags |= MF_FLAG_LANGUAGES;
		}
		if (comment.size() > 0) {
			flags |= MF_FLAG_COMMENT;
		}
		if (created_by.size() > 0) {
			flags |= MF_FLAG_CREATOR;
		}
		b.u8(flags);

		if (start_position) {
			b.i32(start_position->lat);
			b.i32(start_position->lon);
		}
		if (start_zoom >= 0) {
			b.u8(start_zoom);
		}
		if (languages.size() > 0) {
			b.str(languages);
		}
		if (comment.size() > 0) {
			b.str(comment);
		}
		if (created_by.size() > 0) {
			b.str(created_by);
		}

		b.u16(poi_tags.size());
		for (auto const &t : poi_tags) {
			b.str(t);
		}
		b.u16(way_tags.size());
		for (auto const &t : way_tags) {
			b.str(t);
		}

		b.u8(intervals.size());
		for (size_t i = 0; i < intervals.size(); i++) {
			b.u8(intervals[i].base_zoom);
			b.u8(intervals[i].min_zoom);
			b.u8(intervals[i].max_zoom);
			b.u64(starts[i]);
			b.u64(lengths[i]);
		}

		return b.out;
	}

	std::string encode_subfile(test_interval const &zi) const {
		map_builder s;

		if (debug) {
			s.signature(MF_INDEX_SIGNATURE, MF_INDEX_SIGNATURE_LEN);
		}

		if (zi.raw_index.size() > 0) {
			for (auto e : zi.raw_index) {
				s.u40(e);
			}
		} else {
			unsigned long long offset = s.out.size() + zi.blocks.size() * MF_INDEX_ENTRY_BYTES;
			for (size_t i = 0; i < zi.blocks.size(); i++) {
				bool water = i < zi.water.size() && zi.water[i];
				s.u40(offset | (water ? MF_INDEX_WATER_FLAG : 0));
				offset += zi.blocks[i].size();
			}
		}

		for (auto const &block : zi.blocks) {
			s.out += block;
		}

		return s.out;
	}

	std::string encode() const {
		std::vector<std::string> subfiles;
		for (auto const &zi : intervals) {
			subfiles.push_back(encode_subfile(zi));
		}

		std::vector<unsigned long long> starts(intervals.size()), lengths(intervals.size());
		size_t pos = MF_MAGIC_LEN + 4 + encode_header(starts, lengths, 0).size();
		for (size_t i = 0; i < subfiles.size(); i++) {
			starts[i] = pos;
			lengths[i] = subfiles[i].size();
			pos += subfiles[i].size();
		}

		std::string header = encode_header(starts, lengths, pos);

		map_builder b;
		b.out = MF_MAGIC;
		b.u32(header.size() + extra_header_bytes);
		b.out += header;
		for (auto const &s : subfiles) {
			b.out += s;
		}

		return b.out;
	}
};

struct temp_map {
	std::string path;

	temp_map(std::string const &data) {
		path = "/tmp/map.XXXXXX";
		int fd = mkstemp((char *) path.c_str());
		REQUIRE(fd >= 0);
		REQUIRE(write(fd, data.data(), data.size()) == (ssize_t) data.size());
		REQUIRE(close(fd) == 0);
	}

	~temp_map() {
		unlink(path.c_str());
	}

	std::unique_ptr<mf_source> open() const {
		return open_map(path.c_str());
	}
};

template <typename F>
mf_error_kind error_kind(F f) {
	try {
		f();
	} catch (mf_error const &e) {
		return e.kind;
	}

	FAIL("no mf_error was thrown");
	return mf_io_error;
}

static const mf_latlon berlin_origin = tile_origin(10, 335, 550);

static void add_poi(map_builder &b, mf_latlon const &origin, mf_latlon const &p, std::vector<unsigned> const &tags, const char *name) {
	b.svarint(p.lat - origin.lat);
	b.svarint(p.lon - origin.lon);
	b.u8(MF_DEFAULT_LAYER);
	b.uvarint(tags.size());
	for (auto t : tags) {
		b.uvarint(t);
	}
	b.u8(name != NULL ? MF_POI_NAME : 0);
	if (name != NULL) {
		b.str(name);
	}
}

static std::string way_body(unsigned bitmap, std::vector<unsigned> const &tags, bool area, mf_latlon const &origin, std::vector<std::vector<mf_latlon>> const &paths) {
	map_builder w;

	w.u16(bitmap);
	w.u8(MF_DEFAULT_LAYER);
	w.uvarint(tags.size());
	for (auto t : tags) {
		w.uvarint(t);
	}

	unsigned flags = area ? MF_WAY_AREA : 0;
	if (paths.size() != 1) {
		flags |= MF_WAY_PATH_COUNT;
	}
	w.u8(flags);
	if (paths.size() != 1) {
		w.uvarint(paths.size());
	}

	for (auto const &path : paths) {
		w.uvarint(path.size());

		mf_latlon prev = origin;
		for (auto const &p : path) {
			w.svarint(p.lat - prev.lat);
			w.svarint(p.lon - prev.lon);
			prev = p;
		}
	}

	return w.out;
}

static void add_way(map_builder &b, std::string const &body) {
	b.uvarint(body.size());
	b.out += body;
}

static std::string poi_block(mf_latlon const &origin, mf_latlon const &p, std::vector<unsigned> const &tags, const char *name) {
	map_builder t;
	t.uvarint(1);
	add_poi(t, origin, p, tags, name);
	t.uvarint(0);
	return t.out;
}

static std::string empty_block() {
	map_builder t;
	t.uvarint(0);
	t.uvarint(0);
	return t.out;
}

static test_map cafe_map() {
	test_map m;
	m.poi_tags = {"amenity=cafe", "cuisine=coffee_shop"};
	m.way_tags = {"highway=residential", "building=yes"};

	test_interval zi;
	zi.blocks.push_back(poi_block(berlin_origin, mf_latlon(52550000, 13450000), {0, 1}, "Kiez Kaffee"));
	m.intervals.push_back(zi);

	return m;
}

// Two tiles side by side, 10/550/335 and 10/551/335
static test_map two_tile_map() {
	test_map m = cafe_map();
	m.bbox.max_lon = 13800000;

	mf_latlon east = tile_origin(10, 335, 551);
	m.intervals[0].blocks.push_back(poi_block(east, mf_latlon(52550000, 13750000), {0}, "Am Ufer"));

	return m;
}

TEST_CASE("UTF-8 enforcement", "[utf8]") {
	REQUIRE(check_utf8("") == std::string(""));
	REQUIRE(check_utf8("hello world") == std::string(""));
	REQUIRE(check_utf8("Καλημέρα κόσμε") == std::string(""));
	REQUIRE(check_utf8("こんにちは 世界") == std::string(""));
	REQUIRE(check_utf8("👋🌏") == std::string(""));
	REQUIRE(check_utf8("Hola m\xF3n") == std::string("\"Hola m\xF3n\" is not valid UTF-8 (0xF3 0x6E)"));

	// Largest code points on either side of the surrogates, and the largest of all
	REQUIRE(check_utf8("\xED\x9F\xBF") == std::string(""));
	REQUIRE(check_utf8("\xEE\x80\x80") == std::string(""));
	REQUIRE(check_utf8("\xF4\x8F\xBF\xBF") == std::string(""));

	// Overlong encodings
	REQUIRE(check_utf8("\xC0\xAF") == std::string("\"\xC0\xAF\" is not valid UTF-8 (0xC0)"));
	REQUIRE(check_utf8("\xC1\xBF") == std::string("\"\xC1\xBF\" is not valid UTF-8 (0xC1)"));
	REQUIRE(check_utf8("\xE0\x80\xAF") == std::string("\"\xE0\x80\xAF\" is not valid UTF-8 (0xE0 0x80 0xAF)"));
	REQUIRE(check_utf8("\xF0\x80\x80\xAF") == std::string("\"\xF0\x80\x80\xAF\" is not valid UTF-8 (0xF0 0x80 0x80 0xAF)"));

	// Surrogates, and code points past U+10FFFF
	REQUIRE(check_utf8("\xED\xA0\x80") == std::string("\"\xED\xA0\x80\" is not valid UTF-8 (0xED 0xA0 0x80)"));
	REQUIRE(check_utf8("\xF4\x90\x80\x80") == std::string("\"\xF4\x90\x80\x80\" is not valid UTF-8 (0xF4 0x90 0x80 0x80)"));
	REQUIRE(check_utf8("\xF5\x80\x80\x80") == std::string("\"\xF5\x80\x80\x80\" is not valid UTF-8 (0xF5)"));
	REQUIRE(check_utf8("\xF8\x88\x80\x80\x80") == std::string("\"\xF8\x88\x80\x80\x80\" is not valid UTF-8 (0xF8)"));
	REQUIRE(check_utf8("\xFF") == std::string("\"\xFF\" is not valid UTF-8 (0xFF)"));

	// A continuation byte with nothing before it
	REQUIRE(check_utf8("\x80") == std::string("\"\x80\" is not valid UTF-8 (0x80)"));
}

TEST_CASE("Varint decoding", "[varint]") {
	size_t next;

	REQUIRE(read_unsigned_varint("\x7F", 1, 0, &next) == 127);
	REQUIRE(next == 1);
	REQUIRE(read_unsigned_varint("\x96\x01", 2, 0, &next) == 150);
	REQUIRE(next == 2);
	REQUIRE(read_unsigned_varint("\x00\xAC\x02\x00", 4, 1, &next) == 300);
	REQUIRE(next == 3);
	REQUIRE(read_unsigned_varint("\xFF\xFF\xFF\xFF\x7F", 5, 0, &next) == (1ULL << 35) - 1);
	REQUIRE(next == 5);

	REQUIRE(read_signed_varint("\x00", 1, 0, &next) == 0);
	REQUIRE(read_signed_varint("\x01", 1, 0, &next) == -1);
	REQUIRE(read_signed_varint("\x02", 1, 0, &next) == 1);
	REQUIRE(read_signed_varint("\x03", 1, 0, &next) == -2);
}

TEST_CASE("Varint errors", "[varint]") {
	size_t next;

	REQUIRE(error_kind([&] { read_unsigned_varint("", 0, 0, &next); }) == mf_truncated_data);
	REQUIRE(error_kind([&] { read_unsigned_varint("\x80", 1, 0, &next); }) == mf_truncated_data);
	REQUIRE(error_kind([&] { read_unsigned_varint("\x96\x80", 2, 1, &next); }) == mf_truncated_data);
	REQUIRE(error_kind([&] { read_signed_varint("\x81\x81", 2, 0, &next); }) == mf_truncated_data);

	REQUIRE(error_kind([&] { read_unsigned_varint("\x80\x80\x80\x80\x80\x01", 6, 0, &next); }) == mf_varint_too_long);
	REQUIRE(error_kind([&] { read_signed_varint("\xFF\xFF\xFF\xFF\xFF\xFF\xFF", 7, 0, &next); }) == mf_varint_too_long);
}

TEST_CASE("Varint edges of the supported range", "[varint]") {
	std::vector<unsigned long long> unsigned_values = {0, 1, 127, 128, 16383, 16384, UINT_MAX, (1ULL << 35) - 1};
	for (auto v : unsigned_values) {
		std::string buf;
		protozero::write_varint(std::back_inserter(buf), v);

		size_t next;
		REQUIRE(read_unsigned_varint(buf.data(), buf.size(), 0, &next) == v);
		REQUIRE(next == buf.size());
	}

	std::vector<long long> signed_values = {0, -1, 1, -64, 64, INT_MIN, INT_MAX, -(1LL << 34), (1LL << 34) - 1};
	for (auto v : signed_values) {
		std::string buf;
		protozero::write_varint(std::back_inserter(buf), protozero::encode_zigzag64(v));

		size_t next;
		REQUIRE(read_signed_varint(buf.data(), buf.size(), 0, &next) == v);
		REQUIRE(next == buf.size());
	}
}

TEST_CASE("Tile origins map back to their tiles", "[projection]") {
	for (int z = 0; z <= 20; z += 4) {
		long long n = 1LL << z;
		std::vector<long long> coords = {0, n / 3, n / 2, n - 1};

		for (auto row : coords) {
			for (auto col : coords) {
				double lat, lon;
				tile2latlon(row, col, z, &lat, &lon);

				long long r, c;
				latlon2tile(lat, lon, z, &r, &c);
				REQUIRE(r == row);
				REQUIRE(c == col);
			}
		}
	}

	REQUIRE(error_kind([] { check_zoom(31); }) == mf_invalid_zoom);
	REQUIRE(error_kind([] { check_zoom(-1); }) == mf_invalid_zoom);
}

TEST_CASE("Tiles for positions on tile edges", "[projection]") {
	struct {
		int zoom;
		int lat, lon;
		bool bias_low;
		long long col, row;
	} tests[] = {
		{0, 90, -180, false, 0, 0},
		{0, 90, -180, true, 0, 0},
		{0, -90, 180, false, 0, 0},
		{0, -90, 180, true, 0, 0},
		{1, 90, -180, false, 0, 0},
		{1, 0, 0, false, 1, 1},
		{1, 0, 0, true, 0, 0},
		{1, 1, 0, false, 1, 0},
		{1, 1, 0, true, 0, 0},
		{1, 0, -1, false, 0, 1},
		{1, 0, -1, true, 0, 0},
		{1, 0, 1, false, 1, 1},
		{1, 0, 1, true, 1, 0},
		{1, -1, 0, false, 1, 1},
		{1, -1, 0, true, 0, 1},
		{1, -90, 180, false, 1, 1},
		{1, -90, 180, true, 1, 1},
		{2, 80, -100, false, 0, 0},
		{2, 80, -100, true, 0, 0},
		{2, 45, -90, false, 1, 1},
		{2, 10, -10, false, 1, 1},
	};

	for (auto const &t : tests) {
		long long row, col;
		latlon2tile_e6(mf_latlon(t.lat * 1000000, t.lon * 1000000), t.zoom, t.bias_low, &row, &col);

		INFO(t.lat << "," << t.lon << " at zoom " << t.zoom << (t.bias_low ? " biased low" : ""));
		REQUIRE(col == t.col);
		REQUIRE(row == t.row);
	}
}

TEST_CASE("Tiles covering a bounding box", "[projection]") {
	struct {
		int zoom;
		int min_lat, min_lon, max_lat, max_lon;
		long long col, row;
		long long index;
	} tests[] = {
		{1, -90, -180, 90, 180, 1, 1, 3},
		{2, -50, -90, 50, 90, 1, 1, 0},
		{2, -50, -90, 50, 90, 1, 2, 2},
		{2, -50, -90, 50, 90, 2, 2, 3},
		{2, -50, -90, 50, 90, 0, 0, -1},
		{2, -50, -90, 50, 90, 2, 3, -1},
		{2, -50, -100, 80, 90, 0, 0, 0},
		{2, -50, -100, 80, 90, 1, 0, 1},
		{2, -50, -100, 80, 90, 0, 1, 3},
		{2, -50, -100, 80, 90, 1, 1, 4},
		{2, -50, -100, 80, 90, 2, 2, 8},
		{2, -50, -100, 80, 90, 0, 3, -1},
		{2, -50, -100, 80, 90, 3, 1, -1},
	};

	for (auto const &t : tests) {
		mf_bbox bbox;
		bbox.min_lat = t.min_lat * 1000000;
		bbox.min_lon = t.min_lon * 1000000;
		bbox.max_lat = t.max_lat * 1000000;
		bbox.max_lon = t.max_lon * 1000000;

		long long min_row, min_col, max_row, max_col;
		bbox_tile_range(bbox, t.zoom, &min_row, &min_col, &max_row, &max_col);

		long long index = -1;
		if (t.row >= min_row && t.row <= max_row && t.col >= min_col && t.col <= max_col) {
			index = (t.row - min_row) * (max_col - min_col + 1) + (t.col - min_col);
		}

		INFO("tile " << t.col << "," << t.row << " at zoom " << t.zoom);
		REQUIRE(index == t.index);
	}
}

TEST_CASE("Header fields", "[header]") {
	test_map m = cafe_map();
	m.comment = "Berlin Mitte";
	std::string data = m.encode();

	mf_header h = parse_header(data.data(), data.size());
	REQUIRE(h.version == 5);
	REQUIRE(h.file_size == data.size());
	REQUIRE(h.bbox.min_lat == 52500000);
	REQUIRE(h.bbox.max_lon == 13600000);
	REQUIRE(h.tile_size == 256);
	REQUIRE(h.projection == "Mercator");
	REQUIRE(!h.debug);
	REQUIRE(h.comment);
	REQUIRE(*h.comment == "Berlin Mitte");
	REQUIRE(!h.created_by);
	REQUIRE(h.poi_tags.size() == 2);
	REQUIRE(h.poi_tags[1].literal() == "cuisine=coffee_shop");
	REQUIRE(h.way_tags[0].key == "highway");

	REQUIRE(h.zoom_intervals.size() == 1);
	REQUIRE(h.zoom_intervals[0].rows == 1);
	REQUIRE(h.zoom_intervals[0].cols == 1);
	REQUIRE(h.zoom_intervals[0].first_row == 335);
	REQUIRE(h.zoom_intervals[0].first_col == 550);
	REQUIRE(h.interval_for_zoom(11) == 0);
	REQUIRE(h.interval_for_zoom(13) == -1);
}

TEST_CASE("Optional header fields", "[header]") {
	test_map m = cafe_map();
	m.start_position = mf_latlon(52520008, 13404954);
	m.start_zoom = 14;
	m.languages = "de,en";
	m.comment = "Berlin Mitte";
	m.created_by = "mapsforge-map-writer-0.25.0";
	std::string data = m.encode();

	mf_header h = parse_header(data.data(), data.size());
	REQUIRE(h.start_position);
	REQUIRE(*h.start_position == mf_latlon(52520008, 13404954));
	REQUIRE(h.start_zoom);
	REQUIRE(*h.start_zoom == 14);
	REQUIRE(*h.preferred_languages == "de,en");
	REQUIRE(*h.comment == "Berlin Mitte");
	REQUIRE(*h.created_by == "mapsforge-map-writer-0.25.0");

	// The tag tables follow the last optional field
	REQUIRE(h.poi_tags.size() == 2);
	REQUIRE(h.poi_tags[0].literal() == "amenity=cafe");
	REQUIRE(h.zoom_intervals.size() == 1);

	// Any subset of the fields, in the same order
	m = cafe_map();
	m.start_zoom = 0;
	m.created_by = "osmosis";
	data = m.encode();

	h = parse_header(data.data(), data.size());
	REQUIRE(!h.start_position);
	REQUIRE(*h.start_zoom == 0);
	REQUIRE(!h.preferred_languages);
	REQUIRE(!h.comment);
	REQUIRE(*h.created_by == "osmosis");
	REQUIRE(h.way_tags.size() == 2);
}

TEST_CASE("Header errors", "[header]") {
	SECTION("bad magic") {
		std::string data = cafe_map().encode();
		data[0] = 'M';
		REQUIRE(error_kind([&] { parse_header(data.data(), data.size()); }) == mf_unsupported_format);

		temp_map t(data);
		REQUIRE(error_kind([&] { t.open(); }) == mf_unsupported_format);
	}

	SECTION("too short for the magic") {
		temp_map t("mapsforge");
		REQUIRE(error_kind([&] { t.open(); }) == mf_unsupported_format);
	}

	SECTION("missing file") {
		REQUIRE(error_kind([] { open_map("/nonexistent/berlin.map"); }) == mf_io_error);
	}

	SECTION("unsupported versions") {
		test_map m = cafe_map();
		m.version = 2;
		std::string data = m.encode();
		REQUIRE(error_kind([&] { parse_header(data.data(), data.size()); }) == mf_unsupported_format);

		m.version = 6;
		data = m.encode();
		REQUIRE(error_kind([&] { parse_header(data.data(), data.size()); }) == mf_unsupported_format);
	}

	SECTION("projection") {
		test_map m = cafe_map();
		m.projection = "Lambert";
		std::string data = m.encode();
		REQUIRE(error_kind([&] { parse_header(data.data(), data.size()); }) == mf_unsupported_format);
	}

	SECTION("overlapping intervals") {
		test_map m = cafe_map();
		test_interval zi = m.intervals[0];
		zi.base_zoom = 14;
		zi.min_zoom = 12;
		zi.max_zoom = 16;
		zi.blocks = {empty_block()};
		m.intervals.push_back(zi);

		std::string data = m.encode();
		REQUIRE(error_kind([&] { parse_header(data.data(), data.size()); }) == mf_corrupt_header);
	}

	SECTION("gap between intervals") {
		test_map m = cafe_map();
		test_interval zi = m.intervals[0];
		zi.base_zoom = 14;
		zi.min_zoom = 14;
		zi.max_zoom = 16;
		zi.blocks = {empty_block()};
		m.intervals.push_back(zi);

		std::string data = m.encode();
		REQUIRE(error_kind([&] { parse_header(data.data(), data.size()); }) == mf_corrupt_header);
	}

	SECTION("base zoom outside its interval") {
		test_map m = cafe_map();
		m.intervals[0].base_zoom = 9;
		std::string data = m.encode();
		REQUIRE(error_kind([&] { parse_header(data.data(), data.size()); }) == mf_corrupt_header);
	}

	SECTION("header size disagrees with its fields") {
		test_map m = cafe_map();
		m.extra_header_bytes = 3;
		std::string data = m.encode();
		REQUIRE(error_kind([&] { parse_header(data.data(), data.size()); }) == mf_corrupt_header);
	}

	SECTION("header cut short") {
		std::string data = cafe_map().encode();
		data.resize(60);
		REQUIRE(error_kind([&] { parse_header(data.data(), data.size()); }) == mf_corrupt_header);
	}
}

TEST_CASE("Tile index", "[index]") {
	test_map m = two_tile_map();
	std::string data = m.encode();
	mf_header h = parse_header(data.data(), data.size());

	REQUIRE(h.zoom_intervals[0].cols == 2);
	REQUIRE(h.zoom_intervals[0].rows == 1);

	mf_tile_index index = build_tile_index(data.data(), data.size(), h, h.zoom_intervals[0]);
	REQUIRE(index.entries.size() == 2);
	REQUIRE(index.lookup(0, 0) < index.lookup(0, 1));
	REQUIRE(index.lookup(0, 0) == h.zoom_intervals[0].start + 2 * MF_INDEX_ENTRY_BYTES);
	REQUIRE(!index.is_last_tile(0));
	REQUIRE(index.is_last_tile(1));

	unsigned long long start, end;
	index.block_range(1, &start, &end);
	REQUIRE(start == index.lookup(0, 1));
	REQUIRE(end == data.size());

	REQUIRE(error_kind([&] { index.lookup(0, 2); }) == mf_tile_out_of_range);
	REQUIRE(error_kind([&] { index.lookup(1, 0); }) == mf_tile_out_of_range);
	REQUIRE(error_kind([&] { index.lookup(-1, 0); }) == mf_tile_out_of_range);
}

TEST_CASE("Tile index errors", "[index]") {
	SECTION("offsets out of order") {
		test_map m = two_tile_map();
		m.intervals[0].raw_index = {20, 10};
		std::string data = m.encode();
		mf_header h = parse_header(data.data(), data.size());

		REQUIRE(error_kind([&] { build_tile_index(data.data(), data.size(), h, h.zoom_intervals[0]); }) == mf_corrupt_header);
	}

	SECTION("offset inside the index") {
		test_map m = two_tile_map();
		m.intervals[0].raw_index = {2, 20};
		std::string data = m.encode();
		mf_header h = parse_header(data.data(), data.size());

		REQUIRE(error_kind([&] { build_tile_index(data.data(), data.size(), h, h.zoom_intervals[0]); }) == mf_corrupt_header);
	}

	SECTION("missing signature") {
		test_map m = cafe_map();
		m.debug = true;
		std::string data = m.encode();
		mf_header h = parse_header(data.data(), data.size());
		data[h.zoom_intervals[0].start] = '-';

		REQUIRE(error_kind([&] { build_tile_index(data.data(), data.size(), h, h.zoom_intervals[0]); }) == mf_corrupt_header);
	}
}

TEST_CASE("A POI with two tags and a name", "[decode]") {
	temp_map t(cafe_map().encode());
	std::unique_ptr<mf_source> src = t.open();

	std::vector<mf_feature> features = src->features_for_tile(10, 550, 335);
	REQUIRE(features.size() == 1);

	mf_feature const &f = features[0];
	REQUIRE(f.is_poi());
	REQUIRE(f.poi().position == mf_latlon(52550000, 13450000));
	REQUIRE(f.layer == MF_DEFAULT_LAYER);
	REQUIRE(f.tags == std::vector<std::string>{"amenity=cafe", "cuisine=coffee_shop"});
	REQUIRE(f.name);
	REQUIRE(*f.name == "Kiez Kaffee");
	REQUIRE(!f.house_number);
	REQUIRE(!f.elevation);

	// Finer zooms only see the POI in the tile that contains it
	REQUIRE(src->features_for_tile(11, 1100, 671).size() == 1);
	REQUIRE(src->features_for_tile(11, 1100, 670).size() == 0);
	REQUIRE(src->features_for_tile(11, 1101, 671).size() == 0);
	REQUIRE(src->features_for_tile(12, 2201, 1342).size() == 1);
	REQUIRE(src->features_for_tile(12, 2200, 1342).size() == 0);

	// Base tiles outside the bounding box hold nothing
	REQUIRE(src->features_for_tile(10, 551, 335).size() == 0);
}

TEST_CASE("Requests outside the map", "[decode]") {
	temp_map t(cafe_map().encode());
	std::unique_ptr<mf_source> src = t.open();

	REQUIRE(error_kind([&] { src->features_for_tile(10, 1024, 335); }) == mf_tile_out_of_range);
	REQUIRE(error_kind([&] { src->features_for_tile(10, 550, 1024); }) == mf_tile_out_of_range);
	REQUIRE(error_kind([&] { src->features_for_tile(10, -1, 335); }) == mf_tile_out_of_range);
	REQUIRE(error_kind([&] { src->features_for_tile(9, 275, 167); }) == mf_no_coverage);
	REQUIRE(error_kind([&] { src->features_for_tile(13, 4400, 2680); }) == mf_no_coverage);
	REQUIRE(error_kind([&] { src->features_for_tile(31, 0, 0); }) == mf_invalid_zoom);
	REQUIRE(error_kind([&] { src->interval_for_zoom(5); }) == mf_no_coverage);

	REQUIRE(src->interval_for_zoom(12).base_zoom == 10);
}

TEST_CASE("POI layers, elevations and unassigned flags", "[decode]") {
	test_map m = cafe_map();

	map_builder b;
	b.uvarint(2);

	b.svarint(52520000 - berlin_origin.lat);
	b.svarint(13410000 - berlin_origin.lon);
	b.u8(200);
	b.uvarint(1);
	b.uvarint(0);
	b.u8(MF_POI_NAME | MF_POI_ELEVATION | 0x1F);
	b.str("Fernsehturm");
	b.svarint(368);

	b.svarint(52510000 - berlin_origin.lat);
	b.svarint(13420000 - berlin_origin.lon);
	b.u8(0);
	b.uvarint(0);
	b.u8(MF_POI_ELEVATION | 0x01);
	b.svarint(-12);

	b.uvarint(1);
	std::string body = way_body(0xFFFF, {0}, false, berlin_origin, {{mf_latlon(52600000, 13400000), mf_latlon(52600000, 13500000)}});
	body[2] = '\xFF';
	add_way(b, body);
	m.intervals[0].blocks = {b.out};

	temp_map t(m.encode());
	std::unique_ptr<mf_source> src = t.open();

	std::vector<mf_feature> features = src->features_for_tile(10, 550, 335);
	REQUIRE(features.size() == 3);

	REQUIRE(features[0].layer == MF_MAX_LAYER);
	REQUIRE(*features[0].name == "Fernsehturm");
	REQUIRE(*features[0].elevation == 368);
	REQUIRE(!features[0].house_number);
	REQUIRE(features[0].tags == std::vector<std::string>{"amenity=cafe"});

	REQUIRE(features[1].layer == 0);
	REQUIRE(features[1].poi().position == mf_latlon(52510000, 13420000));
	REQUIRE(*features[1].elevation == -12);
	REQUIRE(!features[1].name);
	REQUIRE(features[1].tags.size() == 0);

	REQUIRE(features[2].is_way());
	REQUIRE(features[2].layer == MF_MAX_LAYER);
}

TEST_CASE("Record counts the block cannot hold", "[decode]") {
	std::string data = cafe_map().encode();
	mf_header h = parse_header(data.data(), data.size());

	SECTION("more POIs than bytes for them") {
		// Every 5 bytes would be a POI with a tag id beyond the header's table
		map_builder b;
		b.uvarint(1000);
		for (size_t i = 0; i < 200; i++) {
			b.out += std::string("\x00\x00\x00\x01\x05", 5);
		}

		REQUIRE(error_kind([&] { decode_tile_block(b.out.data(), b.out.size(), 0, b.out.size(), h, berlin_origin); }) == mf_truncated_tile_block);
	}

	SECTION("more ways than bytes for them") {
		map_builder b;
		b.uvarint(0);
		b.uvarint(10);
		b.out += std::string(20, '\0');

		REQUIRE(error_kind([&] { decode_tile_block(b.out.data(), b.out.size(), 0, b.out.size(), h, berlin_origin); }) == mf_truncated_tile_block);
	}

	SECTION("a count nearly as large as a big block") {
		map_builder b;
		b.uvarint(7999992);
		b.out.resize(8 * 1000 * 1000, '\0');

		REQUIRE(error_kind([&] { decode_tile_block(b.out.data(), b.out.size(), 0, b.out.size(), h, berlin_origin); }) == mf_truncated_tile_block);
	}

	SECTION("more paths than bytes for them") {
		map_builder w;
		w.u16(0xFFFF);
		w.u8(MF_DEFAULT_LAYER);
		w.uvarint(0);
		w.u8(MF_WAY_PATH_COUNT);
		w.uvarint(4);
		w.out += std::string(9, '\x01');

		map_builder b;
		b.uvarint(0);
		b.uvarint(1);
		add_way(b, w.out);

		REQUIRE(error_kind([&] { decode_tile_block(b.out.data(), b.out.size(), 0, b.out.size(), h, berlin_origin); }) == mf_corrupt_tile_block);
	}
}

TEST_CASE("A way with two sub-paths", "[decode]") {
	test_map m = cafe_map();

	std::vector<std::vector<mf_latlon>> paths = {
		{mf_latlon(52600000, 13400000), mf_latlon(52600000, 13500000), mf_latlon(52550000, 13500000), mf_latlon(52600000, 13400000)},
		{mf_latlon(52580000, 13420000), mf_latlon(52580000, 13440000), mf_latlon(52570000, 13420000)},
	};

	map_builder b;
	b.uvarint(0);
	b.uvarint(1);
	add_way(b, way_body(0xFFFF, {1}, true, berlin_origin, paths));
	m.intervals[0].blocks = {b.out};

	temp_map t(m.encode());
	std::unique_ptr<mf_source> src = t.open();

	std::vector<mf_feature> features = src->features_for_tile(10, 550, 335);
	REQUIRE(features.size() == 1);
	REQUIRE(features[0].is_way());
	REQUIRE(features[0].tags == std::vector<std::string>{"building=yes"});

	mf_way const &w = features[0].way();
	REQUIRE(w.is_area);
	REQUIRE(w.paths == paths);
	REQUIRE(!w.ref);
	REQUIRE(!w.label_position);
}

TEST_CASE("Way extras", "[decode]") {
	test_map m = cafe_map();
	mf_latlon origin = berlin_origin;

	map_builder w;
	w.u16(0xFFFF);
	w.u8(7);
	w.uvarint(1);
	w.uvarint(0);
	w.u8(MF_WAY_NAME | MF_WAY_ELEVATION | MF_WAY_REF | MF_WAY_LABEL_POSITION | MF_WAY_DOUBLE_DELTA);
	w.str("Torstraße");
	w.svarint(-12);
	w.str("B 96a");
	w.svarint(-50000);
	w.svarint(60000);
	w.uvarint(3);
	w.svarint(-100);
	w.svarint(200);
	w.svarint(10);
	w.svarint(20);
	w.svarint(5);
	w.svarint(5);

	map_builder b;
	b.uvarint(0);
	b.uvarint(1);
	add_way(b, w.out);
	m.intervals[0].blocks = {b.out};

	std::string data = m.encode();
	mf_header h = parse_header(data.data(), data.size());
	unsigned long long start = h.zoom_intervals[0].start + MF_INDEX_ENTRY_BYTES;
	std::vector<mf_feature> features = decode_tile_block(data.data(), data.size(), start, data.size(), h, origin);

	REQUIRE(features.size() == 1);
	mf_feature const &f = features[0];
	REQUIRE(f.layer == 7);
	REQUIRE(*f.name == "Torstraße");
	REQUIRE(*f.elevation == -12);
	REQUIRE(*f.way().ref == "B 96a");
	REQUIRE(*f.way().label_position == mf_latlon(origin.lat - 50000, origin.lon + 60000));
	REQUIRE(!f.way().is_area);

	// Each delta after the first adds to the previous step
	std::vector<mf_latlon> expect = {
		mf_latlon(origin.lat - 100, origin.lon + 200),
		mf_latlon(origin.lat - 90, origin.lon + 220),
		mf_latlon(origin.lat - 75, origin.lon + 245),
	};
	REQUIRE(f.way().paths.size() == 1);
	REQUIRE(f.way().paths[0] == expect);
}

TEST_CASE("Ways are limited to the sub-tiles they touch", "[decode]") {
	REQUIRE(subtile_mask(0, 550, 335) == 0xFFFF);
	REQUIRE(subtile_mask(1, 1100, 670) == 0xCC00);
	REQUIRE(subtile_mask(1, 1101, 670) == 0x3300);
	REQUIRE(subtile_mask(1, 1100, 671) == 0x00CC);
	REQUIRE(subtile_mask(1, 1101, 671) == 0x0033);
	REQUIRE(subtile_mask(2, 2200, 1340) == 0x8000);
	REQUIRE(subtile_mask(2, 2203, 1343) == 0x0001);
	REQUIRE(subtile_mask(2, 2201, 1342) == 0x0040);
	REQUIRE(subtile_mask(3, 4401, 2681) == 0x8000);
	REQUIRE(subtile_mask(3, 4402, 2680) == 0x4000);

	test_map m = cafe_map();

	map_builder b;
	b.uvarint(0);
	b.uvarint(2);
	add_way(b, way_body(0x8000, {0}, false, berlin_origin, {{mf_latlon(52690000, 13360000), mf_latlon(52680000, 13370000)}}));
	add_way(b, way_body(0x0033, {0}, false, berlin_origin, {{mf_latlon(52500000, 13700000), mf_latlon(52490000, 13705000)}}));
	m.intervals[0].blocks = {b.out};

	temp_map t(m.encode());
	std::unique_ptr<mf_source> src = t.open();

	REQUIRE(src->features_for_tile(10, 550, 335).size() == 2);

	std::vector<mf_feature> nw = src->features_for_tile(11, 1100, 670);
	REQUIRE(nw.size() == 1);
	REQUIRE(nw[0].way().subtile_bitmap == 0x8000);

	std::vector<mf_feature> se = src->features_for_tile(11, 1101, 671);
	REQUIRE(se.size() == 1);
	REQUIRE(se[0].way().subtile_bitmap == 0x0033);

	REQUIRE(src->features_for_tile(11, 1101, 670).size() == 0);
	REQUIRE(src->features_for_tile(12, 2200, 1340).size() == 1);
	REQUIRE(src->features_for_tile(12, 2201, 1340).size() == 0);
	REQUIRE(src->features_for_tile(12, 2203, 1343).size() == 1);
}

TEST_CASE("Tag values stored with the feature", "[decode]") {
	test_map m = cafe_map();
	m.poi_tags = {"ele=%i", "width=%f", "level=%b", "lanes=%h", "addr:street=%s", "shop=bakery"};

	map_builder b;
	b.uvarint(1);
	b.svarint(52550000 - berlin_origin.lat);
	b.svarint(13450000 - berlin_origin.lon);
	b.u8(MF_DEFAULT_LAYER);
	b.uvarint(6);
	for (unsigned id : {5, 0, 1, 2, 3, 4}) {
		b.uvarint(id);
	}
	b.i32(1234);
	b.f32(2.5);
	b.u8(0xFD);
	b.u16(4);
	b.str("Linienstraße");
	b.u8(MF_POI_HOUSE_NUMBER);
	b.str("12a");
	b.uvarint(0);
	m.intervals[0].blocks = {b.out};

	temp_map t(m.encode());
	std::unique_ptr<mf_source> src = t.open();

	std::vector<mf_feature> features = src->features_for_tile(10, 550, 335);
	REQUIRE(features.size() == 1);
	REQUIRE(features[0].tags == std::vector<std::string>{"shop=bakery", "ele=1234", "width=2.5", "level=-3", "lanes=4", "addr:street=Linienstraße"});
	REQUIRE(*features[0].house_number == "12a");

	// Before version 5 the same tags are literal
	m.version = 4;
	m.intervals[0].blocks = {poi_block(berlin_origin, mf_latlon(52550000, 13450000), {0}, NULL)};
	temp_map t4(m.encode());
	std::unique_ptr<mf_source> src4 = t4.open();

	features = src4->features_for_tile(10, 550, 335);
	REQUIRE(features[0].tags == std::vector<std::string>{"ele=%i"});
}

TEST_CASE("Debug signatures", "[decode]") {
	test_map m = cafe_map();
	m.debug = true;

	map_builder b;
	b.signature(MF_TILE_SIGNATURE "z10x550y335", MF_SIGNATURE_LEN);
	b.uvarint(1);
	b.signature(MF_POI_SIGNATURE "1", MF_SIGNATURE_LEN);
	add_poi(b, berlin_origin, mf_latlon(52550000, 13450000), {0}, NULL);
	b.uvarint(1);
	b.signature(MF_WAY_SIGNATURE "2", MF_SIGNATURE_LEN);
	add_way(b, way_body(0xFFFF, {0}, false, berlin_origin, {{mf_latlon(52600000, 13400000), mf_latlon(52600000, 13500000)}}));
	m.intervals[0].blocks = {b.out};

	{
		temp_map t(m.encode());
		std::unique_ptr<mf_source> src = t.open();
		REQUIRE(src->header.debug);

		std::vector<mf_feature> features = src->features_for_tile(10, 550, 335);
		REQUIRE(features.size() == 2);
		REQUIRE(features[0].is_poi());
		REQUIRE(features[1].is_way());
	}

	m.intervals[0].blocks[0][MF_SIGNATURE_LEN + 1] = '#';
	temp_map t(m.encode());
	std::unique_ptr<mf_source> src = t.open();
	REQUIRE(error_kind([&] { src->features_for_tile(10, 550, 335); }) == mf_corrupt_tile_block);
}

TEST_CASE("Inconsistent tile blocks", "[decode]") {
	test_map m = cafe_map();

	SECTION("way size disagrees with its contents") {
		std::string body = way_body(0xFFFF, {0}, false, berlin_origin, {{mf_latlon(52600000, 13400000), mf_latlon(52600000, 13500000)}});
		map_builder b;
		b.uvarint(0);
		b.uvarint(1);
		b.uvarint(body.size() + 1);
		b.out += body;
		b.u8(0);
		m.intervals[0].blocks = {b.out};
	}

	SECTION("way with no nodes") {
		map_builder b;
		b.uvarint(0);
		b.uvarint(1);
		add_way(b, way_body(0xFFFF, {0}, false, berlin_origin, {{}}));
		m.intervals[0].blocks = {b.out};
	}

	SECTION("bytes after the last way") {
		m.intervals[0].blocks[0] += "\x01";
	}

	SECTION("name that is not UTF-8") {
		m.intervals[0].blocks = {poi_block(berlin_origin, mf_latlon(52550000, 13450000), {0}, "Caf\xE9")};
	}

	temp_map t(m.encode());
	std::unique_ptr<mf_source> src = t.open();
	REQUIRE(error_kind([&] { src->features_for_tile(10, 550, 335); }) == mf_corrupt_tile_block);
}

TEST_CASE("Tag ids beyond the header's tables", "[decode]") {
	test_map m = cafe_map();
	m.intervals[0].blocks = {poi_block(berlin_origin, mf_latlon(52550000, 13450000), {2}, NULL)};

	temp_map t(m.encode());
	std::unique_ptr<mf_source> src = t.open();
	REQUIRE(error_kind([&] { src->features_for_tile(10, 550, 335); }) == mf_corrupt_header);
}

TEST_CASE("A truncated file still decodes its other tiles", "[decode]") {
	std::string data = two_tile_map().encode();
	data.resize(data.size() - 3);

	temp_map t(data);
	std::unique_ptr<mf_source> src = t.open();

	std::vector<mf_feature> features = src->features_for_tile(10, 550, 335);
	REQUIRE(features.size() == 1);
	REQUIRE(*features[0].name == "Kiez Kaffee");

	REQUIRE(error_kind([&] { src->features_for_tile(10, 551, 335); }) == mf_truncated_tile_block);

	// The failure leaves the source usable
	REQUIRE(src->features_for_tile(10, 550, 335).size() == 1);
}

TEST_CASE("Zooms below the base zoom", "[decode]") {
	test_map m = two_tile_map();
	m.intervals[0].min_zoom = 9;

	temp_map t(m.encode());
	std::unique_ptr<mf_source> src = t.open();

	std::vector<mf_feature> features = src->features_for_tile(9, 275, 167);
	REQUIRE(features.size() == 2);
	REQUIRE(*features[0].name == "Kiez Kaffee");
	REQUIRE(*features[1].name == "Am Ufer");

	REQUIRE(src->features_for_tile(9, 274, 167).size() == 0);
}

TEST_CASE("Water tiles and map extent", "[source]") {
	test_map m = two_tile_map();
	m.intervals[0].min_zoom = 9;
	m.intervals[0].water = {false, true};

	temp_map t(m.encode());
	std::unique_ptr<mf_source> src = t.open();

	REQUIRE(!src->is_water(10, 550, 335));
	REQUIRE(src->is_water(10, 551, 335));
	REQUIRE(src->is_water(12, 2207, 1343));
	REQUIRE(!src->is_water(9, 275, 167));
	REQUIRE(!src->is_water(10, 552, 335));

	long long min_x, min_y, max_x, max_y;
	src->tile_range(10, &min_x, &min_y, &max_x, &max_y);
	REQUIRE(min_x == 550);
	REQUIRE(max_x == 551);
	REQUIRE(min_y == 335);
	REQUIRE(max_y == 335);

	REQUIRE(src->bounds().max_lon == 13800000);
}
