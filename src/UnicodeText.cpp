#include "ItemParity/UnicodeText.h"

#include "ItemParity/AsciiText.h"

#include <cstdint>
#include <limits>

#include <unicode/locid.h>
#include <unicode/stringoptions.h>
#include <unicode/stringpiece.h>
#include <unicode/unistr.h>
#include <unicode/utf8.h>

namespace ItemParity
{
	namespace
	{
		[[nodiscard]] bool IsWellFormedUtf8(std::string_view a_text)
		{
			if (a_text.size() > static_cast<std::size_t>(std::numeric_limits<std::int32_t>::max())) {
				return false;
			}

			const auto* bytes = reinterpret_cast<const std::uint8_t*>(a_text.data());
			const auto length = static_cast<std::int32_t>(a_text.size());
			std::int32_t offset = 0;
			while (offset < length) {
				UChar32 codePoint = 0;
				U8_NEXT(bytes, offset, length, codePoint);
				if (codePoint < 0) {
					return false;
				}
			}
			return true;
		}

		[[nodiscard]] icu::UnicodeString FromUtf8(std::string_view a_text)
		{
			return icu::UnicodeString::fromUTF8(
				icu::StringPiece(a_text.data(), static_cast<std::int32_t>(a_text.size())));
		}

		[[nodiscard]] std::string ToLowerAsciiCopy(std::string_view a_text)
		{
			std::string out(a_text);
			for (auto& c : out) {
				c = detail::ToLowerAscii(c);
			}
			return out;
		}
	}

	std::string ToLowerUtf8(std::string_view a_text)
	{
		if (!IsWellFormedUtf8(a_text)) {
			return ToLowerAsciiCopy(a_text);
		}

		auto text = FromUtf8(a_text);
		text.toLower(icu::Locale::getRoot());

		std::string out;
		text.toUTF8String(out);
		return out;
	}

	bool EqualsIgnoreCaseUtf8(std::string_view a_first, std::string_view a_second)
	{
		if (!IsWellFormedUtf8(a_first) || !IsWellFormedUtf8(a_second)) {
			return detail::EqualsIgnoreCaseAscii(a_first, a_second);
		}
		return FromUtf8(a_first).caseCompare(FromUtf8(a_second), U_FOLD_CASE_DEFAULT) == 0;
	}
}
