#include <gtest/gtest.h>

#include "rescue/map_output.h"

namespace
{

rescue_map_t input_map()
{
	return rescue_map_t::parse("0 4096 +\n4096 4096 -\n8192 8192 ?\n");
}

} // anonymous namespace

TEST(MapOutput, ParseStyle)
{
	output_style_t style = output_style_t::domain;
	EXPECT_TRUE(parse_output_style("retry", style));
	EXPECT_EQ(style, output_style_t::retry);
	EXPECT_TRUE(parse_output_style("domain", style));
	EXPECT_EQ(style, output_style_t::domain);
	EXPECT_FALSE(parse_output_style("fast", style));
}

TEST(MapOutput, RetryMarksUnfinishedTargetsNonTried)
{
	range_list_t targets;
	targets.add(0, 6000);

	auto output = render_targets(targets, input_map(), output_style_t::retry);
	EXPECT_EQ(output, rescue_map_t::parse("0 4096 +\n4096 1904 ?\n6000 2192 -\n8192 8192 ?\n"));
}

TEST(MapOutput, DomainMarksOnlyTargetsFinished)
{
	range_list_t targets;
	targets.add(4096, 1024);
	targets.add(100000, 10); // past the end

	auto output = render_targets(targets, input_map(), output_style_t::domain);
	EXPECT_EQ(output, rescue_map_t::parse("0 4096 -\n4096 1024 +\n5120 11264 -\n"));
}

TEST(MapOutput, OutputCoversTheInput)
{
	range_list_t targets;
	targets.add(8000, 100000);

	for (auto style : {output_style_t::retry, output_style_t::domain})
	{
		auto output = render_targets(targets, input_map(), style);
		EXPECT_EQ(output.size(), input_map().size());
		EXPECT_EQ(output.regions().front().start, 0u);
	}
}
