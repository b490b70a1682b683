#include "ItemParity/TextFormat.h"

#include "ItemParity/AsciiText.h"
#include "ItemParity/UnicodeText.h"

namespace ItemParity
{
	std::string NormalizeName(std::string_view a_name)
	{
		std::string out;
		out.reserve(a_name.size());
		for (const char c : a_name) {
			out.push_back(detail::FoldNameChar(c));
		}
		return out;
	}

	std::string Humanize(std::string_view a_name)
	{
		std::string out(a_name);
		for (auto& c : out) {
			if (c == '_') {
				c = ' ';
			}
		}
		return ToLowerUtf8(out);
	}

	std::string CapitalizeFully(std::string_view a_text)
	{
		std::string out;
		out.reserve(a_text.size());

		bool wordStart = true;
		for (const char c : a_text) {
			if (detail::IsWhitespaceAscii(c)) {
				out.push_back(c);
				wordStart = true;
				continue;
			}

			out.push_back(wordStart ? detail::ToUpperAscii(c) : detail::ToLowerAscii(c));
			wordStart = false;
		}
		return out;
	}

	std::string StripColorCodes(std::string_view a_text)
	{
		std::string out;
		out.reserve(a_text.size());

		std::size_t pos = 0;
		while (pos < a_text.size()) {
			if (const auto codeLen = detail::ColorCodeLengthAt(a_text, pos); codeLen > 0) {
				pos += codeLen;
				continue;
			}
			out.push_back(a_text[pos]);
			++pos;
		}
		return out;
	}
}
