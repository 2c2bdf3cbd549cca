#include "reiserfs/hash.h"
#include "reiserfs/reiserfs.h"

namespace
{

// Sign-extends like the kernel's (u32) cast of a signed char
uint32_t sbyte(char c)
{
	return static_cast<uint32_t>(static_cast<int32_t>(static_cast<signed char>(c)));
}

const uint32_t kTeaDelta = 0x9E3779B9;
const int kTeaFullRounds = 10;
const int kTeaPartRounds = 6;

void tea_core(uint32_t &h0, uint32_t &h1, uint32_t a, uint32_t b, uint32_t c, uint32_t d, int rounds)
{
	uint32_t sum = 0;
	uint32_t b0 = h0;
	uint32_t b1 = h1;
	for (int n = rounds; n > 0; n--)
	{
		sum += kTeaDelta;
		b0 += ((b1 << 4) + a) ^ (b1 + sum) ^ ((b1 >> 5) + b);
		b1 += ((b0 << 4) + c) ^ (b0 + sum) ^ ((b0 >> 5) + d);
	}
	h0 += b0;
	h1 += b1;
}

uint32_t word(const char *p)
{
	return sbyte(p[0]) | sbyte(p[1]) << 8 | sbyte(p[2]) << 16 | sbyte(p[3]) << 24;
}

} // anonymous namespace

uint32_t r5_hash(const std::string &name)
{
	uint32_t a = 0;
	// The kernel stops at the first NUL, whatever the length
	for (char c : name)
	{
		if (c == '\0')
			break;
		int32_t value = static_cast<signed char>(c);
		a += static_cast<uint32_t>(value * 16);
		a += static_cast<uint32_t>(value >> 4);
		a *= 11;
	}
	return a;
}

uint32_t tea_hash(const std::string &name)
{
	uint32_t h0 = 0x9464a485;
	uint32_t h1 = 0x542e1a94;
	uint32_t a, b, c, d;

	const char *msg = name.data();
	int len = static_cast<int>(name.size());

	uint32_t pad = static_cast<uint32_t>(len) | (static_cast<uint32_t>(len) << 8);
	pad |= pad << 16;

	while (len >= 16)
	{
		a = word(msg);
		b = word(msg + 4);
		c = word(msg + 8);
		d = word(msg + 12);
		tea_core(h0, h1, a, b, c, d, kTeaPartRounds);
		len -= 16;
		msg += 16;
	}

	if (len >= 12)
	{
		a = word(msg);
		b = word(msg + 4);
		c = word(msg + 8);
		d = pad;
		for (int i = 12; i < len; i++)
			d = (d << 8) | sbyte(msg[i]);
	}
	else if (len >= 8)
	{
		a = word(msg);
		b = word(msg + 4);
		c = d = pad;
		for (int i = 8; i < len; i++)
			c = (c << 8) | sbyte(msg[i]);
	}
	else if (len >= 4)
	{
		a = word(msg);
		b = c = d = pad;
		for (int i = 4; i < len; i++)
			b = (b << 8) | sbyte(msg[i]);
	}
	else
	{
		a = b = c = d = pad;
		for (int i = 0; i < len; i++)
			a = (a << 8) | sbyte(msg[i]);
	}

	tea_core(h0, h1, a, b, c, d, kTeaFullRounds);
	return h0 ^ h1;
}

uint32_t yura_hash(const std::string &name)
{
	int len = static_cast<int>(name.size());
	if (len == 0)
		return 0;

	// Arithmetic wraps at 32 bits, as in the kernel
	uint32_t pow = 1;
	for (int i = 1; i < len; i++)
		pow *= 10;

	uint32_t a = (sbyte(name[0]) - 48) * pow;

	int i;
	for (i = 1; i < len; i++)
	{
		uint32_t c = sbyte(name[i]) - 48;
		pow = 1;
		for (int j = i; j < len - 1; j++)
			pow *= 10;
		a += c * pow;
	}
	// Positions up to 39 are padded with '0', which adds nothing
	if (i < 40)
		i = 40;
	for (; i < 256; i++)
	{
		uint32_t c = static_cast<uint32_t>(i);
		pow = 1;
		for (int j = i; j < len - 1; j++)
			pow *= 10;
		a += c * pow;
	}

	return a << 7;
}

std::string string_from_hash_code(uint32_t code)
{
	switch (code)
	{
	case kHashTea:
		return "tea";
	case kHashYura:
		return "yura";
	case kHashR5:
		return "r5";
	case kHashUnset:
		return "unset";
	}
	return "unknown";
}

std::optional<uint32_t> name_offset(uint32_t hash_code, const std::string &name)
{
	if (name == ".")
		return kDotOffset;
	if (name == "..")
		return kDotDotOffset;

	uint32_t hash;
	switch (hash_code)
	{
	case kHashTea:
		hash = tea_hash(name);
		break;
	case kHashYura:
		hash = yura_hash(name);
		break;
	case kHashR5:
		hash = r5_hash(name);
		break;
	default:
		return std::nullopt;
	}

	hash &= 0x7FFFFF80;
	if (hash == 0)
		hash = 128;
	return hash;
}
