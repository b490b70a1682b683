#pragma once

#include <string>
#include <string_view>

namespace ItemParity
{
	// Lower-cases every letter of UTF-8 text, not just ASCII: "ŽELEZNÝ MEČ" -> "železný meč".
	// Malformed UTF-8 falls back to ASCII-only lower-casing of the raw bytes.
	[[nodiscard]] std::string ToLowerUtf8(std::string_view a_text);

	// Case-insensitive equality under Unicode case folding ("ÉPÉE" == "épée").
	[[nodiscard]] bool EqualsIgnoreCaseUtf8(std::string_view a_first, std::string_view a_second);
}
