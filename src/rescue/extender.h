#pragma once

#include <cstdint>

#include "rescue/rescue_map.h"

/**
 * Grow every finished run of the map by margin bytes on both sides.
 *
 * Sectors next to a successful read are more likely to be readable than
 * sectors far from any, so the bytes within margin of a finished run that
 * are not finished become non-tried (retry candidates). Finished bytes and
 * bytes farther than margin from any finished run keep their status.
 *
 * @param map Input map
 * @param margin Extension on each side, in bytes
 * @return The retry-priority map, same size as the input
 */
rescue_map_t extend_finished(const rescue_map_t &map, uint64_t margin);
