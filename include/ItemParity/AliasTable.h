#pragma once

#include "ItemParity/AsciiText.h"

#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace ItemParity
{
	struct AliasEntry
	{
		std::string_view canonicalName{};
		std::string_view legacyName{};
		std::optional<std::string_view> displayName{};
	};

	struct AliasTable
	{
		std::string_view catalogName{};
		std::span<const AliasEntry> entries{};
	};

	[[nodiscard]] constexpr std::string_view DisplayNameOf(const AliasEntry& a_entry) noexcept
	{
		return a_entry.displayName.value_or(a_entry.legacyName);
	}

	// Matches the canonical name, or the display name when one is set explicitly.
	[[nodiscard]] constexpr const AliasEntry* FindAliasByName(const AliasTable& a_table, std::string_view a_name) noexcept
	{
		for (const auto& entry : a_table.entries) {
			if (detail::EqualsNormalizedName(entry.canonicalName, a_name)) {
				return &entry;
			}
			if (entry.displayName && detail::EqualsNormalizedName(*entry.displayName, a_name)) {
				return &entry;
			}
		}
		return nullptr;
	}

	[[nodiscard]] constexpr const AliasEntry* FindAliasByLegacyName(const AliasTable& a_table, std::string_view a_legacyName) noexcept
	{
		for (const auto& entry : a_table.entries) {
			if (detail::EqualsNormalizedName(entry.legacyName, a_legacyName)) {
				return &entry;
			}
		}
		return nullptr;
	}

	// Any-name -> legacy name. Unknown names are returned normalized, on the assumption that
	// they are already in legacy form.
	[[nodiscard]] std::string ResolveToLegacy(const AliasTable& a_table, std::string_view a_name);

	// Legacy name -> "Capitalized Display Name". Unknown names are rendered as-is.
	[[nodiscard]] std::string ResolveDisplay(const AliasTable& a_table, std::string_view a_legacyName);
}
