#pragma once

#include <cstddef>
#include <string_view>

namespace ItemParity::detail
{
	[[nodiscard]] constexpr char ToLowerAscii(char a_char) noexcept
	{
		return (a_char >= 'A' && a_char <= 'Z') ? static_cast<char>(a_char + ('a' - 'A')) : a_char;
	}

	[[nodiscard]] constexpr char ToUpperAscii(char a_char) noexcept
	{
		return (a_char >= 'a' && a_char <= 'z') ? static_cast<char>(a_char - ('a' - 'A')) : a_char;
	}

	[[nodiscard]] constexpr bool IsWhitespaceAscii(char a_char) noexcept
	{
		return a_char == ' ' || a_char == '\t' || a_char == '\r' || a_char == '\n' || a_char == '\f' || a_char == '\v';
	}

	// Folds one character of a symbolic name: upper-case, and space treated as underscore.
	[[nodiscard]] constexpr char FoldNameChar(char a_char) noexcept
	{
		return a_char == ' ' ? '_' : ToUpperAscii(a_char);
	}

	[[nodiscard]] constexpr bool EqualsIgnoreCaseAscii(std::string_view a_lhs, std::string_view a_rhs) noexcept
	{
		if (a_lhs.size() != a_rhs.size()) {
			return false;
		}

		for (std::size_t i = 0; i < a_lhs.size(); ++i) {
			if (ToLowerAscii(a_lhs[i]) != ToLowerAscii(a_rhs[i])) {
				return false;
			}
		}
		return true;
	}

	// "Instant Health", "instant_health" and "INSTANT_HEALTH" all compare equal.
	[[nodiscard]] constexpr bool EqualsNormalizedName(std::string_view a_lhs, std::string_view a_rhs) noexcept
	{
		if (a_lhs.size() != a_rhs.size()) {
			return false;
		}

		for (std::size_t i = 0; i < a_lhs.size(); ++i) {
			if (FoldNameChar(a_lhs[i]) != FoldNameChar(a_rhs[i])) {
				return false;
			}
		}
		return true;
	}

	// Length of the colour code starting at a_pos, or 0 if there is none.
	// Recognises '&' and the UTF-8 section sign followed by 0-9, a-f, k-o, r or x.
	[[nodiscard]] constexpr std::size_t ColorCodeLengthAt(std::string_view a_text, std::size_t a_pos) noexcept
	{
		std::size_t markerLen = 0;
		if (a_pos < a_text.size() && a_text[a_pos] == '&') {
			markerLen = 1;
		} else if (a_pos + 1 < a_text.size() &&
				   static_cast<unsigned char>(a_text[a_pos]) == 0xC2 &&
				   static_cast<unsigned char>(a_text[a_pos + 1]) == 0xA7) {
			markerLen = 2;
		} else {
			return 0;
		}

		if (a_pos + markerLen >= a_text.size()) {
			return 0;
		}

		const char code = ToLowerAscii(a_text[a_pos + markerLen]);
		const bool isCode = (code >= '0' && code <= '9') ||
		                    (code >= 'a' && code <= 'f') ||
		                    (code >= 'k' && code <= 'o') ||
		                    code == 'r' || code == 'x';
		return isCode ? markerLen + 1 : 0;
	}
}
