#include <stdio.h>
#include <string.h>
#include <stdlib.h>
#include <math.h>
#include <cmath>
#include <string>
#include "projection.hpp"
#include "errors.hpp"

// Fraction of a tile within which a position is considered to lie on the tile edge
#define EDGE_EPSILON 1e-6

void check_zoom(int zoom) {
	if (zoom < 0 || zoom > MF_MAX_ZOOM) {
		throw mf_error(mf_invalid_zoom, "zoom level " + std::to_string(zoom) + " is outside 0.." + std::to_string(MF_MAX_ZOOM));
	}
}

static long long axis_tile(double v, long long n) {
	long long t;

	// Snap to the edge if floating point error left us just short of it,
	// so that the origin of a tile maps back to that tile
	double r = std::round(v);
	if (std::fabs(v - r) < EDGE_EPSILON) {
		t = r;
	} else {
		t = std::floor(v);
	}

	if (t < 0) {
		t = 0;
	}
	if (t > n - 1) {
		t = n - 1;
	}

	return t;
}

// http://wiki.openstreetmap.org/wiki/Slippy_map_tilenames
void latlon2tile(double lat, double lon, int zoom, long long *row, long long *col) {
	check_zoom(zoom);

	// Place infinite and NaN coordinates on the edge of the Mercator plane

	int lat_class = std::fpclassify(lat);
	int lon_class = std::fpclassify(lon);

	if (lat_class == FP_INFINITE || lat_class == FP_NAN) {
		lat = MF_LAT_MAX;
	}
	if (lon_class == FP_INFINITE || lon_class == FP_NAN) {
		lon = MF_LON_MAX;
	}

	if (lat < -MF_LAT_MAX) {
		lat = -MF_LAT_MAX;
	}
	if (lat > MF_LAT_MAX) {
		lat = MF_LAT_MAX;
	}
	if (lon < -MF_LON_MAX) {
		lon = -MF_LON_MAX;
	}
	if (lon > MF_LON_MAX) {
		lon = MF_LON_MAX;
	}

	double lat_rad = lat * M_PI / 180;
	long long n = 1LL << zoom;

	*col = axis_tile(n * ((lon + 180) / 360), n);
	*row = axis_tile(n * (1 - (log(tan(lat_rad) + 1 / cos(lat_rad)) / M_PI)) / 2, n);
}

// http://wiki.openstreetmap.org/wiki/Slippy_map_tilenames
void tile2latlon(long long row, long long col, int zoom, double *lat, double *lon) {
	check_zoom(zoom);

	unsigned long long n = 1LL << zoom;
	*lon = 360.0 * col / n - 180.0;
	*lat = atan(sinh(M_PI * (1 - 2.0 * row / n))) * 180.0 / M_PI;
}

int degrees_to_microdegrees(double degrees) {
	return (int) (degrees * 1000000.0);
}

mf_latlon tile_origin(int zoom, long long row, long long col) {
	double lat, lon;
	tile2latlon(row, col, zoom, &lat, &lon);
	return mf_latlon(degrees_to_microdegrees(lat), degrees_to_microdegrees(lon));
}

void latlon2tile_e6(mf_latlon const &p, int zoom, bool bias_low, long long *row, long long *col) {
	latlon2tile(p.lat_degrees(), p.lon_degrees(), zoom, row, col);

	if (bias_low) {
		mf_latlon origin = tile_origin(zoom, *row, *col);

		if (origin.lat == p.lat && *row > 0) {
			(*row)--;
		}
		if (origin.lon == p.lon && *col > 0) {
			(*col)--;
		}
	}
}
