#ifndef PROJECTION_HPP
#define PROJECTION_HPP

#define MF_MAX_ZOOM 30

// Web Mercator stops short of the poles
#define MF_LAT_MAX 85.051128
#define MF_LON_MAX 180.0

// A geographic position in microdegrees
struct mf_latlon {
	int lat = 0;
	int lon = 0;

	mf_latlon() {
	}

	mf_latlon(int nlat, int nlon)
	    : lat(nlat), lon(nlon) {
	}

	double lat_degrees() const {
		return lat / 1000000.0;
	}

	double lon_degrees() const {
		return lon / 1000000.0;
	}

	bool operator==(mf_latlon const &o) const {
		return lat == o.lat && lon == o.lon;
	}

	bool operator!=(mf_latlon const &o) const {
		return !(*this == o);
	}
};

// Throws mf_error(mf_invalid_zoom) unless 0 <= zoom <= MF_MAX_ZOOM
void check_zoom(int zoom);

void latlon2tile(double lat, double lon, int zoom, long long *row, long long *col);
void tile2latlon(long long row, long long col, int zoom, double *lat, double *lon);

// With bias_low, a position exactly on the north or west edge of a tile
// is assigned to the neighboring tile instead
void latlon2tile_e6(mf_latlon const &p, int zoom, bool bias_low, long long *row, long long *col);

// North-west corner of a tile
mf_latlon tile_origin(int zoom, long long row, long long col);

int degrees_to_microdegrees(double degrees);

#endif
