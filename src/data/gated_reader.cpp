#include "data/gated_reader.h"
#include "errors.h"
#include "utils.h"

gated_reader_t::gated_reader_t(std::shared_ptr<datasource_t> image, const rescue_map_t &map, uint64_t partition_start)
	: image_(std::move(image)), map_(map), partition_start_(partition_start)
{
	if (!image_)
		throw std::runtime_error("Null datasource");
}

void gated_reader_t::set_geometry(uint64_t block_size, uint64_t block_count)
{
	rs_log("geometry: {} blocks of {} bytes at {}", block_count, block_size, partition_start_);
	block_size_ = block_size;
	block_count_ = block_count;
}

void gated_reader_t::check_address(uint64_t address) const
{
	if (block_count_ != 0 && address >= block_count_)
		throw out_of_range_reference_error(address, address, "block address");
	if (block_offset(address) + block_size_ > map_.size())
		throw out_of_range_reference_error(address, address, "block address (past the map end)");
}

bool gated_reader_t::is_block_complete(uint64_t address) const
{
	check_address(address);
	return map_.is_finished(block_offset(address), block_size_);
}

std::optional<block_t> gated_reader_t::read_block(uint64_t address)
{
	check_address(address);

	uint64_t offset = block_offset(address);
	requested_.add(offset, block_size_);

	if (!map_.is_finished(offset, block_size_))
	{
		rs_log("block {} is a hole", address);
		return std::nullopt;
	}

	return image_->read_block(offset, block_size_);
}

std::optional<block_t> gated_reader_t::read_bytes(uint64_t offset, uint64_t size)
{
	uint64_t absolute = partition_start_ + offset;
	requested_.add(absolute, size);

	if (!map_.is_finished(absolute, size))
	{
		rs_log("bytes {}+{} are a hole", absolute, size);
		return std::nullopt;
	}

	return image_->read_block(absolute, size);
}
