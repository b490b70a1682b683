#include "ItemParity/AliasTable.h"

#include "ItemParity/TextFormat.h"

namespace ItemParity
{
	namespace
	{
		[[nodiscard]] std::string RenderDisplay(std::string_view a_name)
		{
			std::string spaced(a_name);
			for (auto& c : spaced) {
				if (c == '_') {
					c = ' ';
				}
			}
			return CapitalizeFully(spaced);
		}
	}

	std::string ResolveToLegacy(const AliasTable& a_table, std::string_view a_name)
	{
		auto normalized = NormalizeName(a_name);
		if (const auto* entry = FindAliasByName(a_table, normalized)) {
			return std::string(entry->legacyName);
		}
		return normalized;
	}

	std::string ResolveDisplay(const AliasTable& a_table, std::string_view a_legacyName)
	{
		const auto normalized = NormalizeName(a_legacyName);
		if (const auto* entry = FindAliasByLegacyName(a_table, normalized)) {
			return RenderDisplay(DisplayNameOf(*entry));
		}
		return RenderDisplay(normalized);
	}
}
