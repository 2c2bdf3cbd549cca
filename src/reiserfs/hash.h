#pragma once

#include <cstdint>
#include <optional>
#include <string>

// Directory name hashes, bit-compatible with the kernel implementations.
// Names are hashed as signed chars.
uint32_t r5_hash(const std::string &name);
uint32_t tea_hash(const std::string &name);
uint32_t yura_hash(const std::string &name);

std::string string_from_hash_code(uint32_t code);

/**
 * Offset a name is stored under in its directory, without the generation
 * number: 1 for ".", 2 for "..", else the hash value (never below 128).
 * @param hash_code Superblock hash function code
 * @return The offset, or std::nullopt for an unknown hash code
 */
std::optional<uint32_t> name_offset(uint32_t hash_code, const std::string &name);
