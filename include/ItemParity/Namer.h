#pragma once

#include "ItemParity/AliasCatalogs.h"
#include "ItemParity/AliasTable.h"
#include "ItemParity/TextFormat.h"

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace ItemParity
{
	inline constexpr std::string_view kStatusEffectNamesGuidance =
		"https://hub.spigotmc.org/javadocs/bukkit/org/bukkit/potion/PotionEffectType.html";
	inline constexpr std::string_view kEnchantmentNamesGuidance =
		"https://hub.spigotmc.org/javadocs/spigot/org/bukkit/enchantments/Enchantment.html";

	// Raised when the host catalog has no entry for a name, even after alias translation.
	class NotFoundError : public std::runtime_error
	{
	public:
		NotFoundError(std::string a_query, std::string a_resolvedName, std::string a_guidance);

		[[nodiscard]] const std::string& Query() const noexcept { return _query; }
		[[nodiscard]] const std::string& ResolvedName() const noexcept { return _resolvedName; }
		[[nodiscard]] const std::string& Guidance() const noexcept { return _guidance; }

	private:
		std::string _query;
		std::string _resolvedName;
		std::string _guidance;
	};

	// Translates a_query to its legacy name and looks it up in the host catalog.
	// a_lookup: (std::string_view) -> std::optional<Handle>.
	template <class Lookup>
	[[nodiscard]] auto FindCatalogEntry(
		const AliasTable& a_table,
		std::string_view a_query,
		Lookup&& a_lookup,
		std::string_view a_guidance) -> typename std::invoke_result_t<Lookup&, std::string_view>::value_type
	{
		const auto legacyName = ResolveToLegacy(a_table, a_query);
		auto handle = a_lookup(std::string_view{ legacyName });
		if (!handle) {
			throw NotFoundError(std::string(a_query), legacyName, std::string(a_guidance));
		}
		return std::move(*handle);
	}

	template <class Lookup>
	[[nodiscard]] auto FindStatusEffect(std::string_view a_query, Lookup&& a_lookup)
	{
		return FindCatalogEntry(kStatusEffectTable, a_query, std::forward<Lookup>(a_lookup), kStatusEffectNamesGuidance);
	}

	template <class Lookup>
	[[nodiscard]] auto FindEnchantment(std::string_view a_query, Lookup&& a_lookup)
	{
		return FindCatalogEntry(kEnchantmentTable, a_query, std::forward<Lookup>(a_lookup), kEnchantmentNamesGuidance);
	}

	[[nodiscard]] std::string HumanizeCapitalized(std::string_view a_name);

	// Enumerations are humanized through their ToString() spelling.
	template <class Enum, std::enable_if_t<std::is_enum_v<Enum>, int> = 0>
	[[nodiscard]] std::string Humanize(Enum a_value)
	{
		return Humanize(ToString(a_value));
	}

	template <class Enum, std::enable_if_t<std::is_enum_v<Enum>, int> = 0>
	[[nodiscard]] std::string HumanizeCapitalized(Enum a_value)
	{
		return HumanizeCapitalized(ToString(a_value));
	}

	[[nodiscard]] std::string DescribeStatusEffect(std::string_view a_legacyName);
	[[nodiscard]] std::string DescribeEnchantment(std::string_view a_legacyName);

	// Display name for any spelling of a name: translated to legacy first, then rendered.
	[[nodiscard]] std::string DisplayNameFor(const AliasTable& a_table, std::string_view a_name);
}
