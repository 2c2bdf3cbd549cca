#pragma once

#include <vector>
#include <cstdint>
#include <fstream>
#include <stdexcept>
#include <filesystem>
#include <memory>
#include <string>
#include "utils.h"

// A block of continuous data
class block_t
{
	std::vector<uint8_t> data_;

public:
	block_t(const std::vector<uint8_t> &data) : data_(data) {}
	block_t(std::vector<uint8_t> &&data) : data_(std::move(data)) {}

	const uint8_t *bytes() const { return data_.data(); }
	size_t size() const { return data_.size(); }
};

//  The interface to a data source
class datasource_t
{
public:
	virtual ~datasource_t() = default;
	virtual std::string description() const = 0;
	virtual block_t read_block(uint64_t offset, uint64_t size) = 0;
	virtual uint64_t size() const = 0;
};

class file_datasource_t : public datasource_t
{
	std::filesystem::path path_;
	std::ifstream file_;
	uint64_t size_;

public:
	file_datasource_t(const std::filesystem::path &file_path)
		: path_(file_path), file_(file_path, std::ios::binary)
	{
		if (!file_.is_open())
		{
			throw std::runtime_error("Cannot open file: " + file_path.string());
		}

		size_ = std::filesystem::file_size(file_path);
	}

	std::string description() const override
	{
		return path_.string();
	}

	uint64_t size() const override
	{
		return size_;
	}

	block_t read_block(uint64_t offset, uint64_t size) override
	{
		if (offset + size > size_)
		{
			throw std::out_of_range(fmt::format("Read beyond end of {} ({}+{} > {})", path_.string(), offset, size, size_));
		}

		std::vector<uint8_t> data(size);
		file_.seekg(static_cast<std::streamoff>(offset));
		file_.read(reinterpret_cast<char *>(data.data()), static_cast<std::streamsize>(size));

		if (!file_.good())
		{
			throw std::runtime_error("Error reading from " + path_.string());
		}

		return block_t(std::move(data));
	}
};

// An image held in memory; used for synthetic volumes
class memory_datasource_t : public datasource_t
{
	std::vector<uint8_t> data_;

public:
	memory_datasource_t(std::vector<uint8_t> data) : data_(std::move(data)) {}

	std::string description() const override
	{
		return fmt::format("memory ({} bytes)", data_.size());
	}

	uint64_t size() const override
	{
		return data_.size();
	}

	block_t read_block(uint64_t offset, uint64_t size) override
	{
		if (offset + size > data_.size())
		{
			throw std::out_of_range("Read beyond end of memory image");
		}
		return block_t(std::vector<uint8_t>(data_.begin() + static_cast<std::ptrdiff_t>(offset),
											data_.begin() + static_cast<std::ptrdiff_t>(offset + size)));
	}
};
