#include "rescue/map_output.h"
#include "utils.h"

#include <algorithm>

bool parse_output_style(const std::string &text, output_style_t &style)
{
	if (text == "retry")
	{
		style = output_style_t::retry;
		return true;
	}
	if (text == "domain")
	{
		style = output_style_t::domain;
		return true;
	}
	return false;
}

rescue_map_t render_targets(const range_list_t &targets, const rescue_map_t &input, output_style_t style)
{
	ENTRY("{} ranges, {} bytes", targets.count(), targets.total());

	if (style == output_style_t::retry)
	{
		rescue_map_t result = input;
		result.set_unfinished_status(targets, rescue_status_t::non_tried);
		return result;
	}

	rescue_map_t result(input.size(), rescue_status_t::bad_sector);
	for (const auto &range : targets.items())
	{
		if (range.start >= input.size())
			break;
		uint64_t end = std::min(range.end(), input.size());
		result.set_status(range.start, end - range.start, rescue_status_t::finished);
	}
	return result;
}
