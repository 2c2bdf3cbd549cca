#include "rescue/extender.h"
#include "utils.h"

#include <algorithm>

rescue_map_t extend_finished(const rescue_map_t &map, uint64_t margin)
{
	ENTRY("margin={}", margin);

	rescue_map_t result = map;
	if (margin == 0)
		return result;

	// Regions are canonical, so each finished region is a maximal run
	range_list_t margins;
	uint64_t size = map.size();
	for (const auto &region : map.regions())
	{
		if (region.status != rescue_status_t::finished)
			continue;

		uint64_t before = region.start > margin ? region.start - margin : 0;
		uint64_t after = std::min(size, region.end() + std::min(margin, size - region.end()));
		margins.add(before, region.start - before);
		margins.add(region.end(), after - region.end());
	}

	rs_log("{} bytes within {} of a finished region", margins.total(), margin);
	result.set_unfinished_status(margins, rescue_status_t::non_tried);
	return result;
}
