#include "rescue/range_list.h"

#include <iterator>

void range_list_t::add(uint64_t start, uint64_t size)
{
	if (size == 0)
		return;

	uint64_t end = start + size;

	// First range that could touch us: the one starting at or before start
	auto it = ranges_.upper_bound(start);
	if (it != ranges_.begin())
	{
		auto previous = std::prev(it);
		if (previous->second >= start)
		{
			if (previous->second >= end)
				return;
			start = previous->first;
			it = previous;
		}
	}

	// Swallow every range that starts inside (or right at the end of) the new one
	while (it != ranges_.end() && it->first <= end)
	{
		if (it->second > end)
			end = it->second;
		it = ranges_.erase(it);
	}

	ranges_[start] = end;
}

void range_list_t::add(const range_list_t &other)
{
	for (const auto &[start, end] : other.ranges_)
		add(start, end - start);
}

bool range_list_t::contains(uint64_t position) const
{
	auto it = ranges_.upper_bound(position);
	if (it == ranges_.begin())
		return false;
	--it;
	return position < it->second;
}

bool range_list_t::overlaps(uint64_t start, uint64_t size) const
{
	if (size == 0)
		return false;
	uint64_t end = start + size;
	auto it = ranges_.lower_bound(end);
	if (it == ranges_.begin())
		return false;
	--it;
	return it->second > start;
}

uint64_t range_list_t::total() const
{
	uint64_t sum = 0;
	for (const auto &[start, end] : ranges_)
		sum += end - start;
	return sum;
}

std::vector<range_t> range_list_t::items() const
{
	std::vector<range_t> result;
	result.reserve(ranges_.size());
	for (const auto &[start, end] : ranges_)
		result.push_back({start, end - start});
	return result;
}

range_list_t range_list_t::scaled(uint64_t multiplier, uint64_t offset) const
{
	range_list_t result;
	for (const auto &[start, end] : ranges_)
		result.ranges_[offset + start * multiplier] = offset + end * multiplier;
	return result;
}

bool range_list_t::is_subset_of(const range_list_t &other) const
{
	for (const auto &[start, end] : ranges_)
	{
		auto it = other.ranges_.upper_bound(start);
		if (it == other.ranges_.begin())
			return false;
		--it;
		if (it->second < end)
			return false;
	}
	return true;
}
