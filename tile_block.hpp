#ifndef TILE_BLOCK_HPP
#define TILE_BLOCK_HPP

#include <stddef.h>
#include <vector>
#include "header.hpp"
#include "feature.hpp"

// Debug signatures, each padded to MF_SIGNATURE_LEN bytes
#define MF_TILE_SIGNATURE "###TileStart"
#define MF_POI_SIGNATURE "***POIStart"
#define MF_WAY_SIGNATURE "---WayStart"
#define MF_SIGNATURE_LEN 32

// POI optional fields
#define MF_POI_NAME 0x80
#define MF_POI_HOUSE_NUMBER 0x40
#define MF_POI_ELEVATION 0x20

// Way optional fields
#define MF_WAY_NAME 0x80
#define MF_WAY_HOUSE_NUMBER 0x40
#define MF_WAY_ELEVATION 0x20
#define MF_WAY_REF 0x10
#define MF_WAY_LABEL_POSITION 0x08
#define MF_WAY_PATH_COUNT 0x04
#define MF_WAY_DOUBLE_DELTA 0x02
#define MF_WAY_AREA 0x01

#define MF_ALL_SUBTILES 0xFFFF

// Decode the tile block occupying [start, end) of the map.
//
// origin is the north-west corner of the block's tile, which the first
// position of every POI and way path is relative to. Ways whose sub-tile
// bitmap has no bit in common with subtile_filter are skipped.
//
// Throws mf_error: mf_truncated_tile_block if the block ends early (including
// when the file itself is shorter than end), mf_corrupt_tile_block if it is
// inconsistent, mf_corrupt_header for a tag id beyond the header's tables.
std::vector<mf_feature> decode_tile_block(const char *map, size_t len, unsigned long long start, unsigned long long end, mf_header const &header, mf_latlon const &origin, unsigned subtile_filter = MF_ALL_SUBTILES);

#endif
