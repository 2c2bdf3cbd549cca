#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <istream>
#include <ostream>
#include <filesystem>

#include "rescue/range_list.h"

/**
 * Block status vocabulary of the ddrescue mapfile.
 */
enum class rescue_status_t : char
{
	non_tried = '?',   ///< never read
	non_trimmed = '*', ///< failed in the copying pass, edges not trimmed yet
	non_scraped = '/', ///< trimmed, interior not scraped yet
	bad_sector = '-',  ///< read attempted sector by sector and failed
	finished = '+'     ///< read completely
};

bool is_rescue_status(char c);
std::string string_from_status(rescue_status_t status);

/**
 * Explicit rule for combining two maps byte by byte.
 */
enum class merge_policy_t
{
	prefer_finished,  ///< finished if either side is finished
	prefer_unfinished ///< finished only if both are; otherwise the unfinished side
};

struct region_t
{
	uint64_t start;
	uint64_t size;
	rescue_status_t status;

	uint64_t end() const { return start + size; }
	bool operator==(const region_t &other) const = default;
};

/**
 * Region-status map: an ordered, gap-free partition of [0, size) into
 * regions of a single status, in canonical form (adjacent regions never
 * share a status).
 *
 * This is the ddrescue mapfile, both as input (how much of the image is
 * trustworthy) and as output (what to read next).
 */
class rescue_map_t
{
	std::vector<region_t> regions_;

	void coalesce();
	size_t find_region(uint64_t offset) const;

public:
	rescue_map_t() = default;

	/**
	 * A map of the given size with a single status.
	 */
	explicit rescue_map_t(uint64_t size, rescue_status_t status = rescue_status_t::non_tried);

	/**
	 * Parse a ddrescue mapfile.
	 * @throws format_error on syntax errors or when the blocks do not tile the image
	 */
	static rescue_map_t parse(std::istream &in);
	static rescue_map_t parse(const std::string &text);
	static rescue_map_t load(const std::filesystem::path &path);

	/**
	 * Serialize in ddrescue mapfile syntax, with a comment header holding the size.
	 */
	void write(std::ostream &out) const;
	std::string serialize() const;
	void save(const std::filesystem::path &path) const;

	uint64_t size() const { return regions_.empty() ? 0 : regions_.back().end(); }
	const std::vector<region_t> &regions() const { return regions_; }

	/**
	 * @throws std::out_of_range if offset is not inside the map
	 */
	rescue_status_t status_at(uint64_t offset) const;

	/**
	 * True if every byte of [offset, offset+length) is finished.
	 * Bytes beyond the end of the map are never finished.
	 */
	bool is_finished(uint64_t offset, uint64_t length) const;

	/**
	 * Set the status of a range, growing the map if needed (the grown
	 * part between the old end and offset becomes non-tried).
	 */
	void set_status(uint64_t offset, uint64_t length, rescue_status_t status);

	/**
	 * Give every byte inside ranges that is not finished the given status.
	 * Finished bytes and bytes outside ranges are left alone; ranges
	 * beyond the end of the map are ignored.
	 */
	void set_unfinished_status(const range_list_t &ranges, rescue_status_t status);

	static rescue_map_t merge(const rescue_map_t &a, const rescue_map_t &b, merge_policy_t policy);

	bool operator==(const rescue_map_t &other) const = default;
};
