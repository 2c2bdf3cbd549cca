#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <tuple>
#include <vector>

#include "rescue/map_output.h"

enum class command_t
{
	bitmap,
	tree,
	folder,
	ls,
	find,
	cat,
	extend
};

/**
 * Everything one invocation needs, from the command line.
 */
struct triage_config_t
{
	command_t command = command_t::bitmap;
	std::filesystem::path image;
	std::filesystem::path mapfile;
	std::vector<std::string> arguments; ///< after the command
	std::filesystem::path out;          ///< empty for stdout

	uint64_t partition_start = 0;
	bool metadata_only = false;
	output_style_t output = output_style_t::retry;
	uint8_t fill = 0;
	uint64_t margin = 512;
	bool verbose = false;

	uint16_t level = 0;     ///< tree
	bool recursive = false; ///< ls -R
};

/**
 * Split argv into positional arguments and --key=value flags.
 * A bare --flag is stored as "true".
 */
std::tuple<std::vector<std::string>, std::map<std::string, std::string>> parse_arguments(int argc, char *argv[]);

template <typename T>
T get_arg(const std::map<std::string, std::string> &flags, const std::string &key, const T &default_value = T{});

template <>
uint64_t get_arg<uint64_t>(const std::map<std::string, std::string> &flags, const std::string &key, const uint64_t &default_value);

template <>
bool get_arg<bool>(const std::map<std::string, std::string> &flags, const std::string &key, const bool &default_value);

template <>
std::string get_arg<std::string>(const std::map<std::string, std::string> &flags, const std::string &key, const std::string &default_value);

/**
 * Build the configuration.
 * @throws std::invalid_argument with a message for the user on bad usage
 */
triage_config_t make_config(int argc, char *argv[]);

void print_usage(const char *program);
