#pragma once

#include <string>
#include <string_view>

namespace ItemParity
{
	// Upper-cases and turns spaces into underscores: "instant heal" -> "INSTANT_HEAL".
	[[nodiscard]] std::string NormalizeName(std::string_view a_name);

	// Lower-cases and turns underscores into spaces: "INSTANT_HEAL" -> "instant heal".
	[[nodiscard]] std::string Humanize(std::string_view a_name);

	// Lower-cases everything, then upper-cases the first letter of every whitespace-delimited word.
	// Underscores are not delimiters.
	[[nodiscard]] std::string CapitalizeFully(std::string_view a_text);

	[[nodiscard]] std::string StripColorCodes(std::string_view a_text);
}
