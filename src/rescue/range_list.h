#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <vector>

/**
 * A contiguous range [start, start + size) in some unit (blocks or bytes).
 */
struct range_t
{
	uint64_t start;
	uint64_t size;

	uint64_t end() const { return start + size; }
	bool operator==(const range_t &other) const = default;
};

/**
 * Ordered set of non-overlapping ranges.
 * Ranges may be added in any order; touching or overlapping ranges are
 * coalesced, so the union is independent of insertion order.
 */
class range_list_t
{
	// start -> end
	std::map<uint64_t, uint64_t> ranges_;

public:
	void add(uint64_t start, uint64_t size);
	void add(const range_t &range) { add(range.start, range.size); }
	void add(const range_list_t &other);

	bool contains(uint64_t position) const;
	bool overlaps(uint64_t start, uint64_t size) const;
	bool empty() const { return ranges_.empty(); }
	void clear() { ranges_.clear(); }

	/**
	 * Number of ranges after coalescing.
	 */
	size_t count() const { return ranges_.size(); }

	/**
	 * Sum of all range sizes.
	 */
	uint64_t total() const;

	std::vector<range_t> items() const;

	/**
	 * Converts the units of every range, e.g. blocks to bytes.
	 * @param multiplier Size of one unit in the new unit
	 * @param offset Added to every converted start
	 */
	range_list_t scaled(uint64_t multiplier, uint64_t offset = 0) const;

	/**
	 * True if every element of this list is also in other.
	 */
	bool is_subset_of(const range_list_t &other) const;

	bool operator==(const range_list_t &other) const = default;
};
