#include "ItemParity/Namer.h"

namespace ItemParity
{
	namespace
	{
		[[nodiscard]] std::string BuildNotFoundMessage(std::string_view a_resolvedName, std::string_view a_guidance)
		{
			std::string message = "Invalid name '";
			message += a_resolvedName;
			message += "'! For valid names, see: ";
			message += a_guidance;
			return message;
		}
	}

	NotFoundError::NotFoundError(std::string a_query, std::string a_resolvedName, std::string a_guidance) :
		std::runtime_error(BuildNotFoundMessage(a_resolvedName, a_guidance)),
		_query(std::move(a_query)),
		_resolvedName(std::move(a_resolvedName)),
		_guidance(std::move(a_guidance))
	{}

	std::string HumanizeCapitalized(std::string_view a_name)
	{
		return CapitalizeFully(Humanize(a_name));
	}

	std::string DescribeStatusEffect(std::string_view a_legacyName)
	{
		return ResolveDisplay(kStatusEffectTable, a_legacyName);
	}

	std::string DescribeEnchantment(std::string_view a_legacyName)
	{
		return ResolveDisplay(kEnchantmentTable, a_legacyName);
	}

	std::string DisplayNameFor(const AliasTable& a_table, std::string_view a_name)
	{
		return ResolveDisplay(a_table, ResolveToLegacy(a_table, a_name));
	}
}
