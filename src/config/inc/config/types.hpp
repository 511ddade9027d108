#ifndef POWMINER_CONFIG_TYPES_HPP
#define POWMINER_CONFIG_TYPES_HPP

#include <cstdint>

namespace powminer
{
namespace config
{
	enum class Search_mode : uint8_t
	{
		SEQUENTIAL = 0,
		PARALLEL = 1
	};

	enum class Payload_encoding : uint8_t
	{
		TEXT = 0,
		HEX
	};
}
}
#endif
