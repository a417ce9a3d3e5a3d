#ifndef FEATURE_HPP
#define FEATURE_HPP

#include <string>
#include <vector>
#include <variant>
#include <optional>
#include "projection.hpp"

#define MF_DEFAULT_LAYER 5
#define MF_MAX_LAYER 10

struct mf_poi {
	mf_latlon position;
};

struct mf_way {
	// Each sub-path is a ring or line of its own
	std::vector<std::vector<mf_latlon>> paths{};
	bool is_area = false;
	std::optional<std::string> ref;
	std::optional<mf_latlon> label_position;

	// One bit for each tile of the 4x4 grid two zoom levels below the base tile,
	// most significant bit first in row-major order
	unsigned subtile_bitmap = 0xFFFF;
};

struct mf_feature {
	int layer = MF_DEFAULT_LAYER;
	std::vector<std::string> tags{};  // key=value, in record order
	std::optional<std::string> name;
	std::optional<std::string> house_number;
	std::optional<long long> elevation;

	std::variant<mf_poi, mf_way> geometry;

	bool is_poi() const {
		return std::holds_alternative<mf_poi>(geometry);
	}

	bool is_way() const {
		return std::holds_alternative<mf_way>(geometry);
	}

	mf_poi const &poi() const {
		return std::get<mf_poi>(geometry);
	}

	mf_way const &way() const {
		return std::get<mf_way>(geometry);
	}
};

#endif
