#include "rescue/rescue_map.h"
#include "errors.h"
#include "utils.h"

#include <algorithm>
#include <fstream>
#include <sstream>

bool is_rescue_status(char c)
{
	return c == '?' || c == '*' || c == '/' || c == '-' || c == '+';
}

std::string string_from_status(rescue_status_t status)
{
	switch (status)
	{
	case rescue_status_t::non_tried:
		return "non-tried";
	case rescue_status_t::non_trimmed:
		return "non-trimmed";
	case rescue_status_t::non_scraped:
		return "non-scraped";
	case rescue_status_t::bad_sector:
		return "bad-sector";
	case rescue_status_t::finished:
		return "finished";
	}
	return "unknown";
}

namespace
{

// Order of the ddrescue phases; a later phase knows more about the bytes
int rank(rescue_status_t status)
{
	switch (status)
	{
	case rescue_status_t::non_tried:
		return 0;
	case rescue_status_t::non_trimmed:
		return 1;
	case rescue_status_t::non_scraped:
		return 2;
	case rescue_status_t::bad_sector:
		return 3;
	case rescue_status_t::finished:
		return 4;
	}
	return 0;
}

rescue_status_t combine(rescue_status_t a, rescue_status_t b, merge_policy_t policy)
{
	bool a_done = a == rescue_status_t::finished;
	bool b_done = b == rescue_status_t::finished;

	if (policy == merge_policy_t::prefer_unfinished && a_done != b_done)
		return a_done ? b : a;

	return rank(a) >= rank(b) ? a : b;
}

// Current-status characters of the ddrescue status line
bool is_current_status(const std::string &token)
{
	static const std::string valid = "?*/-FGR+";
	return token.size() == 1 && valid.find(token[0]) != std::string::npos;
}

std::vector<std::string> split_tokens(const std::string &line)
{
	std::vector<std::string> tokens;
	std::istringstream stream(line);
	std::string token;
	while (stream >> token)
		tokens.push_back(token);
	return tokens;
}

const std::string kSizeHeader = "# image size:";

} // anonymous namespace

rescue_map_t::rescue_map_t(uint64_t size, rescue_status_t status)
{
	if (size > 0)
		regions_.push_back({0, size, status});
}

void rescue_map_t::coalesce()
{
	std::vector<region_t> result;
	result.reserve(regions_.size());
	for (const auto &region : regions_)
	{
		if (region.size == 0)
			continue;
		if (!result.empty() && result.back().status == region.status && result.back().end() == region.start)
			result.back().size += region.size;
		else
			result.push_back(region);
	}
	regions_ = std::move(result);
}

size_t rescue_map_t::find_region(uint64_t offset) const
{
	auto it = std::upper_bound(regions_.begin(), regions_.end(), offset,
							   [](uint64_t value, const region_t &region)
							   { return value < region.start; });
	if (it == regions_.begin())
		throw std::out_of_range(fmt::format("offset {} is before the map", offset));
	--it;
	if (offset >= it->end())
		throw std::out_of_range(fmt::format("offset {} is beyond the map end {}", offset, size()));
	return static_cast<size_t>(it - regions_.begin());
}

rescue_map_t rescue_map_t::parse(std::istream &in)
{
	rescue_map_t map;
	std::string line;
	size_t lineno = 0;
	bool have_status_line = false;
	bool have_declared_size = false;
	uint64_t declared_size = 0;

	while (std::getline(in, line))
	{
		lineno++;
		if (!line.empty() && line.back() == '\r')
			line.pop_back();

		if (line.starts_with(kSizeHeader))
		{
			auto tokens = split_tokens(line.substr(kSizeHeader.size()));
			if (tokens.size() != 1 || !parse_number(tokens[0], declared_size))
				throw format_error(lineno, "invalid image size header");
			have_declared_size = true;
			continue;
		}

		auto first = line.find_first_not_of(" \t");
		if (first == std::string::npos || line[first] == '#')
			continue;

		auto tokens = split_tokens(line);
		uint64_t pos;
		if (tokens.size() < 2 || !parse_number(tokens[0], pos))
			throw format_error(lineno, fmt::format("cannot parse '{}'", line));

		uint64_t size;
		bool block_line = parse_number(tokens[1], size);

		if (!block_line)
		{
			// current_pos current_status [current_pass]
			if (have_status_line || !map.regions_.empty())
				throw format_error(lineno, "unexpected status line");
			if (!is_current_status(tokens[1]) || tokens.size() > 3)
				throw format_error(lineno, fmt::format("invalid status line '{}'", line));
			if (tokens.size() == 3)
			{
				uint64_t pass;
				if (!parse_number(tokens[2], pass))
					throw format_error(lineno, fmt::format("invalid pass '{}'", tokens[2]));
			}
			have_status_line = true;
			continue;
		}

		if (tokens.size() != 3)
			throw format_error(lineno, fmt::format("expected 'pos size status', got '{}'", line));
		if (tokens[2].size() != 1 || !is_rescue_status(tokens[2][0]))
			throw format_error(lineno, fmt::format("invalid block status '{}'", tokens[2]));
		if (size == 0)
			throw format_error(lineno, "zero-sized block");
		if (pos + size < pos)
			throw format_error(lineno, "block wraps around");

		uint64_t expected = map.size();
		if (map.regions_.empty() && pos > 0)
		{
			// ddrescue treats anything before the first block as non-tried
			map.regions_.push_back({0, pos, rescue_status_t::non_tried});
		}
		else if (pos < expected)
		{
			throw format_error(lineno, fmt::format("block at {} overlaps the previous block ending at {}", pos, expected));
		}
		else if (pos > expected)
		{
			throw format_error(lineno, fmt::format("gap between {} and {}", expected, pos));
		}

		map.regions_.push_back({pos, size, static_cast<rescue_status_t>(tokens[2][0])});
	}

	if (in.bad())
		throw std::runtime_error("error reading mapfile");

	if (have_declared_size)
	{
		if (declared_size < map.size())
			throw format_error(0, fmt::format("blocks extend to {}, beyond the declared image size {}", map.size(), declared_size));
		if (declared_size > map.size())
			map.regions_.push_back({map.size(), declared_size - map.size(), rescue_status_t::non_tried});
	}

	map.coalesce();
	return map;
}

rescue_map_t rescue_map_t::parse(const std::string &text)
{
	std::istringstream stream(text);
	return parse(stream);
}

rescue_map_t rescue_map_t::load(const std::filesystem::path &path)
{
	std::ifstream file(path);
	if (!file.is_open())
		throw std::runtime_error("Cannot open mapfile: " + path.string());
	return parse(file);
}

void rescue_map_t::write(std::ostream &out) const
{
	out << "# Mapfile. Created by reiserscope\n";
	out << fmt::format("{} 0x{:08X}\n", kSizeHeader, size());
	out << "# current_pos  current_status  current_pass\n";
	out << "0x00000000     ?               1\n";
	out << "#      pos        size  status\n";
	for (const auto &region : regions_)
		out << fmt::format("0x{:08X}  0x{:08X}  {}\n", region.start, region.size, static_cast<char>(region.status));
}

std::string rescue_map_t::serialize() const
{
	std::ostringstream stream;
	write(stream);
	return stream.str();
}

void rescue_map_t::save(const std::filesystem::path &path) const
{
	std::ofstream file(path);
	if (!file.is_open())
		throw std::runtime_error("Cannot create mapfile: " + path.string());
	write(file);
	if (!file.good())
		throw std::runtime_error("Error writing mapfile: " + path.string());
}

rescue_status_t rescue_map_t::status_at(uint64_t offset) const
{
	return regions_[find_region(offset)].status;
}

bool rescue_map_t::is_finished(uint64_t offset, uint64_t length) const
{
	if (length == 0)
		return true;
	if (offset + length > size())
		return false;

	for (size_t i = find_region(offset); i < regions_.size() && regions_[i].start < offset + length; i++)
	{
		if (regions_[i].status != rescue_status_t::finished)
			return false;
	}
	return true;
}

void rescue_map_t::set_status(uint64_t offset, uint64_t length, rescue_status_t status)
{
	if (length == 0)
		return;

	uint64_t end = offset + length;
	if (end > size())
		regions_.push_back({size(), end - size(), rescue_status_t::non_tried});

	std::vector<region_t> result;
	result.reserve(regions_.size() + 2);
	bool inserted = false;
	for (const auto &region : regions_)
	{
		if (region.end() <= offset || region.start >= end)
		{
			if (!inserted && region.start >= end)
			{
				result.push_back({offset, length, status});
				inserted = true;
			}
			result.push_back(region);
			continue;
		}
		if (region.start < offset)
			result.push_back({region.start, offset - region.start, region.status});
		if (!inserted)
		{
			result.push_back({offset, length, status});
			inserted = true;
		}
		if (region.end() > end)
			result.push_back({end, region.end() - end, region.status});
	}
	if (!inserted)
		result.push_back({offset, length, status});

	regions_ = std::move(result);
	coalesce();
}

rescue_map_t rescue_map_t::merge(const rescue_map_t &a, const rescue_map_t &b, merge_policy_t policy)
{
	rescue_map_t left = a;
	rescue_map_t right = b;
	uint64_t total = std::max(a.size(), b.size());
	if (left.size() < total)
		left.regions_.push_back({left.size(), total - left.size(), rescue_status_t::non_tried});
	if (right.size() < total)
		right.regions_.push_back({right.size(), total - right.size(), rescue_status_t::non_tried});

	rescue_map_t result;
	size_t i = 0;
	size_t j = 0;
	uint64_t pos = 0;
	while (pos < total)
	{
		const region_t &l = left.regions_[i];
		const region_t &r = right.regions_[j];
		uint64_t end = std::min(l.end(), r.end());
		result.regions_.push_back({pos, end - pos, combine(l.status, r.status, policy)});
		pos = end;
		if (l.end() == end)
			i++;
		if (r.end() == end)
			j++;
	}

	result.coalesce();
	return result;
}

void rescue_map_t::set_unfinished_status(const range_list_t &ranges, rescue_status_t status)
{
	auto items = ranges.items();
	std::vector<region_t> result;
	result.reserve(regions_.size() + items.size() * 2);

	size_t j = 0;
	for (const auto &region : regions_)
	{
		if (region.status == rescue_status_t::finished)
		{
			result.push_back(region);
			continue;
		}

		uint64_t pos = region.start;
		while (pos < region.end())
		{
			while (j < items.size() && items[j].end() <= pos)
				j++;

			if (j < items.size() && items[j].start <= pos)
			{
				uint64_t end = std::min(items[j].end(), region.end());
				result.push_back({pos, end - pos, status});
				pos = end;
			}
			else
			{
				uint64_t end = region.end();
				if (j < items.size())
					end = std::min(end, items[j].start);
				result.push_back({pos, end - pos, region.status});
				pos = end;
			}
		}
	}

	regions_ = std::move(result);
	coalesce();
}
