#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <getopt.h>
#include <pthread.h>
#include <string>
#include <vector>
#include <map>
#include <memory>
#include "map_reader.hpp"
#include "projection.hpp"
#include "platform.hpp"
#include "errors.hpp"
#include "text.hpp"

int quiet = false;
size_t CPUS;

struct zxy {
	int z;
	long long x;
	long long y;

	zxy(int nz, long long nx, long long ny)
	    : z(nz), x(nx), y(ny) {
	}

	bool operator<(zxy const &other) const {
		if (z < other.z) {
			return true;
		}
		if (z == other.z) {
			if (y < other.y) {
				return true;
			}
			if (y == other.y) {
				if (x < other.x) {
					return true;
				}
			}
		}

		return false;
	}
};

static std::string quote(std::string const &s) {
	std::string out = "\"";
	for (char c : s) {
		if (c == '"' || c == '\\') {
			out.push_back('\\');
		}
		out.push_back(c);
	}
	out.push_back('"');
	return out;
}

static std::string format_latlon(mf_latlon const &p) {
	char buf[80];
	snprintf(buf, sizeof(buf), "%.6f,%.6f", p.lat_degrees(), p.lon_degrees());
	return buf;
}

static std::string describe_feature(mf_feature const &f) {
	std::string out;

	if (f.is_poi()) {
		out += "poi " + format_latlon(f.poi().position);
	} else {
		mf_way const &w = f.way();
		out += w.is_area ? "area" : "way";

		char buf[20];
		snprintf(buf, sizeof(buf), " %04X", w.subtile_bitmap);
		out += buf;
	}

	out += " layer=" + std::to_string(f.layer);
	if (f.name) {
		out += " name=" + quote(*f.name);
	}
	if (f.house_number) {
		out += " housenumber=" + quote(*f.house_number);
	}
	if (f.elevation) {
		out += " elevation=" + std::to_string(*f.elevation);
	}

	if (f.is_way()) {
		mf_way const &w = f.way();

		if (w.ref) {
			out += " ref=" + quote(*w.ref);
		}
		if (w.label_position) {
			out += " label=" + format_latlon(*w.label_position);
		}
	}

	for (size_t i = 0; i < f.tags.size(); i++) {
		out += (i == 0 ? " [" : ", ") + quote(f.tags[i]);
	}
	if (f.tags.size() > 0) {
		out += "]";
	}
	out += "\n";

	if (f.is_way()) {
		for (auto const &path : f.way().paths) {
			out += "\t";
			for (size_t i = 0; i < path.size(); i++) {
				if (i != 0) {
					out += " ";
				}
				out += format_latlon(path[i]);
			}
			out += "\n";
		}
	}

	return out;
}

// Throws mf_error if the tile can't be decoded
static std::string describe_tile(mf_source const &src, zxy const &tile) {
	std::vector<mf_feature> features = src.features_for_tile(tile.z, tile.x, tile.y);

	std::string out = std::to_string(tile.z) + "/" + std::to_string(tile.x) + "/" + std::to_string(tile.y) + ": " + std::to_string(features.size()) + " features";
	if (src.is_water(tile.z, tile.x, tile.y)) {
		out += ", water";
	}
	out += "\n";

	for (auto const &f : features) {
		out += describe_feature(f);
	}

	return out;
}

struct arg {
	mf_source const *src = NULL;
	std::vector<zxy> inputs{};
	std::map<zxy, std::string> outputs{};
	size_t failures = 0;
};

void *decode_worker(void *v) {
	arg *a = (arg *) v;

	for (auto const &tile : a->inputs) {
		try {
			a->outputs.emplace(tile, describe_tile(*a->src, tile));
		} catch (mf_error const &e) {
			// The rest of the zoom level is still worth printing
			a->outputs.emplace(tile, std::to_string(tile.z) + "/" + std::to_string(tile.x) + "/" + std::to_string(tile.y) + ": " + mf_error_kind_name(e.kind) + ": " + e.what() + "\n");
			a->failures++;
		}
	}

	return NULL;
}

// Returns the number of tiles that failed to decode
size_t dispatch_tasks(mf_source const &src, int zoom) {
	long long min_x, min_y, max_x, max_y;
	src.tile_range(zoom, &min_x, &min_y, &max_x, &max_y);

	std::vector<pthread_t> pthreads(CPUS);
	std::vector<arg> args(CPUS);

	for (size_t i = 0; i < CPUS; i++) {
		args[i].src = &src;
	}

	size_t count = 0;
	for (long long y = min_y; y <= max_y; y++) {
		for (long long x = min_x; x <= max_x; x++) {
			args[count].inputs.emplace_back(zoom, x, y);
			count = (count + 1) % CPUS;
		}
	}

	if (!quiet) {
		fprintf(stderr, "%s: zoom %d: %lld tiles across %zu threads\n", src.path.c_str(), zoom, (max_x - min_x + 1) * (max_y - min_y + 1), CPUS);
	}

	for (size_t i = 0; i < CPUS; i++) {
		if (pthread_create(&pthreads[i], NULL, decode_worker, &args[i]) != 0) {
			perror("pthread_create");
			exit(EXIT_PTHREAD);
		}
	}

	std::map<zxy, std::string> outputs;
	size_t failures = 0;

	for (size_t i = 0; i < CPUS; i++) {
		void *retval;

		if (pthread_join(pthreads[i], &retval) != 0) {
			perror("pthread_join");
			exit(EXIT_PTHREAD);
		}

		for (auto &o : args[i].outputs) {
			outputs.insert(std::move(o));
		}
		failures += args[i].failures;
	}

	for (auto const &o : outputs) {
		fputs(o.second.c_str(), stdout);
	}

	return failures;
}

void print_header(mf_source const &src) {
	mf_header const &h = src.header;

	printf("file: %s\n", src.path.c_str());
	printf("version: %lu\n", h.version);
	printf("file size: %llu\n", h.file_size);
	printf("creation date: %llu\n", h.creation_date);
	printf("bounds: %s %s\n", format_latlon(mf_latlon(h.bbox.min_lat, h.bbox.min_lon)).c_str(), format_latlon(mf_latlon(h.bbox.max_lat, h.bbox.max_lon)).c_str());
	printf("tile size: %u\n", h.tile_size);
	printf("projection: %s\n", h.projection.c_str());
	printf("debug: %s\n", h.debug ? "yes" : "no");

	if (h.start_position) {
		printf("start position: %s\n", format_latlon(*h.start_position).c_str());
	}
	if (h.start_zoom) {
		printf("start zoom: %d\n", *h.start_zoom);
	}
	if (h.preferred_languages) {
		printf("preferred languages: %s\n", h.preferred_languages->c_str());
	}
	if (h.comment) {
		printf("comment: %s\n", h.comment->c_str());
	}
	if (h.created_by) {
		printf("created by: %s\n", h.created_by->c_str());
	}

	printf("POI tags: %zu\n", h.poi_tags.size());
	for (size_t i = 0; i < h.poi_tags.size(); i++) {
		printf("\t%zu: %s\n", i, h.poi_tags[i].literal().c_str());
	}
	printf("way tags: %zu\n", h.way_tags.size());
	for (size_t i = 0; i < h.way_tags.size(); i++) {
		printf("\t%zu: %s\n", i, h.way_tags[i].literal().c_str());
	}

	for (auto const &zi : h.zoom_intervals) {
		printf("zoom %d-%d: base %d, subfile %llu+%llu, %lldx%lld tiles from %d/%lld/%lld\n", zi.min_zoom, zi.max_zoom, zi.base_zoom, zi.start, zi.length, zi.cols, zi.rows, zi.base_zoom, zi.first_col, zi.first_row);
	}
}

void usage(char **argv) {
	fprintf(stderr, "Usage: %s [-H] [-q] [-j threads] [-z zoom] file.map [zoom x y]\n", argv[0]);
	exit(EXIT_ARGS);
}

int main(int argc, char **argv) {
	bool show_header = false;
	int zoom = -1;

	CPUS = get_num_avail_cpus();

	struct option long_options[] = {
		{"header", no_argument, 0, 'H'},
		{"quiet", no_argument, 0, 'q'},
		{"threads", required_argument, 0, 'j'},
		{"zoom", required_argument, 0, 'z'},

		{0, 0, 0, 0},
	};

	std::string getopt_str;
	for (size_t lo = 0; long_options[lo].name != NULL; lo++) {
		if (long_options[lo].val > ' ') {
			getopt_str.push_back(long_options[lo].val);

			if (long_options[lo].has_arg == required_argument) {
				getopt_str.push_back(':');
			}
		}
	}

	extern int optind;
	extern char *optarg;
	int i;

	int option_index = 0;
	while ((i = getopt_long(argc, argv, getopt_str.c_str(), long_options, &option_index)) != -1) {
		switch (i) {
		case 0:
			break;

		case 'H':
			show_header = true;
			break;

		case 'q':
			quiet = true;
			break;

		case 'j': {
			char *end;
			long n = strtol(optarg, &end, 10);
			if (*optarg == '\0' || *end != '\0' || n < 1) {
				fprintf(stderr, "%s: Expected a positive number of threads, not %s\n", argv[0], optarg);
				exit(EXIT_ARGS);
			}
			CPUS = n;
			break;
		}

		case 'z':
			zoom = integer_zoom(argv[0], optarg);
			break;

		default:
			usage(argv);
		}
	}

	if (argc - optind != 1 && argc - optind != 4) {
		usage(argv);
	}

	const char *fname = argv[optind];

	try {
		std::unique_ptr<mf_source> src = open_map(fname);

		if (show_header || (argc - optind == 1 && zoom < 0)) {
			print_header(*src);
		}

		if (argc - optind == 4) {
			int z = integer_zoom(argv[0], argv[optind + 1]);
			long long x = integer_tile(argv[0], argv[optind + 2], z);
			long long y = integer_tile(argv[0], argv[optind + 3], z);

			fputs(describe_tile(*src, zxy(z, x, y)).c_str(), stdout);
		}

		if (zoom >= 0) {
			// Throws mf_no_coverage before any threads start
			src->interval_for_zoom(zoom);

			size_t failures = dispatch_tasks(*src, zoom);
			if (failures > 0) {
				fprintf(stderr, "%s: %zu tiles at zoom %d could not be decoded\n", fname, failures, zoom);
				exit(EXIT_TILE);
			}
		}
	} catch (mf_error const &e) {
		fprintf(stderr, "%s: %s: %s\n", fname, mf_error_kind_name(e.kind), e.what());
		exit(mf_error_exit_code(e.kind));
	}

	return 0;
}
