#pragma once

#include <string>

#include "rescue/rescue_map.h"
#include "rescue/range_list.h"

/**
 * How a set of wanted byte ranges is written back for ddrescue.
 */
enum class output_style_t
{
	retry, ///< copy of the input map, wanted bytes not yet finished set to non-tried
	domain ///< fresh map for --domain-mapfile: wanted bytes finished, the rest bad-sector
};

bool parse_output_style(const std::string &text, output_style_t &style);

/**
 * Turn a target set (absolute image byte ranges) into a map for ddrescue.
 * Targets beyond the end of the input map are dropped.
 */
rescue_map_t render_targets(const range_list_t &targets, const rescue_map_t &input, output_style_t style);
