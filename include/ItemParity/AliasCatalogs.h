#pragma once

#include "ItemParity/AliasTable.h"

#include <array>
#include <cstdint>
#include <string_view>

namespace ItemParity
{
	enum class AliasCatalog : std::uint8_t
	{
		kStatusEffect,
		kEnchantment,
	};

	namespace detail
	{
		[[nodiscard]] constexpr AliasEntry MakeAlias(std::string_view a_canonical, std::string_view a_legacy) noexcept
		{
			return AliasEntry{ .canonicalName = a_canonical, .legacyName = a_legacy, .displayName = std::nullopt };
		}

		[[nodiscard]] constexpr AliasEntry MakeAlias(
			std::string_view a_canonical,
			std::string_view a_legacy,
			std::string_view a_display) noexcept
		{
			return AliasEntry{ .canonicalName = a_canonical, .legacyName = a_legacy, .displayName = a_display };
		}

		// Shown to players under its current-scheme name.
		[[nodiscard]] constexpr AliasEntry MakeCanonicalDisplayAlias(std::string_view a_canonical, std::string_view a_legacy) noexcept
		{
			return MakeAlias(a_canonical, a_legacy, a_canonical);
		}
	}

	// Only names that differ between the schemes are listed; everything else is identical in both.
	inline constexpr std::array<AliasEntry, 5> kStatusEffectAliases{
		detail::MakeAlias("SLOW", "SLOW", "Slowness"),
		detail::MakeAlias("STRENGTH", "INCREASE_DAMAGE"),
		detail::MakeAlias("JUMP_BOOST", "JUMP"),
		detail::MakeAlias("INSTANT_HEAL", "INSTANT_HEALTH"),
		detail::MakeAlias("REGEN", "REGENERATION")
	};

	inline constexpr std::array<AliasEntry, 23> kEnchantmentAliases{
		detail::MakeCanonicalDisplayAlias("PROTECTION", "PROTECTION_ENVIRONMENTAL"),
		detail::MakeCanonicalDisplayAlias("FIRE_PROTECTION", "PROTECTION_FIRE"),
		detail::MakeCanonicalDisplayAlias("FEATHER_FALLING", "PROTECTION_FALL"),
		detail::MakeCanonicalDisplayAlias("BLAST_PROTECTION", "PROTECTION_EXPLOSIONS"),
		detail::MakeCanonicalDisplayAlias("PROJECTILE_PROTECTION", "PROTECTION_PROJECTILE"),
		detail::MakeCanonicalDisplayAlias("RESPIRATION", "OXYGEN"),
		detail::MakeCanonicalDisplayAlias("AQUA_AFFINITY", "WATER_WORKER"),
		detail::MakeCanonicalDisplayAlias("THORN", "THORNS"),
		detail::MakeCanonicalDisplayAlias("CURSE_OF_VANISHING", "VANISHING_CURSE"),
		detail::MakeCanonicalDisplayAlias("CURSE_OF_BINDING", "BINDING_CURSE"),
		detail::MakeCanonicalDisplayAlias("SHARPNESS", "DAMAGE_ALL"),
		detail::MakeCanonicalDisplayAlias("SMITE", "DAMAGE_UNDEAD"),
		detail::MakeCanonicalDisplayAlias("BANE_OF_ARTHROPODS", "DAMAGE_ARTHROPODS"),
		detail::MakeCanonicalDisplayAlias("LOOTING", "LOOT_BONUS_MOBS"),
		detail::MakeCanonicalDisplayAlias("SWEEPING_EDGE", "SWEEPING"),
		detail::MakeCanonicalDisplayAlias("EFFICIENCY", "DIG_SPEED"),
		detail::MakeCanonicalDisplayAlias("UNBREAKING", "DURABILITY"),
		detail::MakeCanonicalDisplayAlias("FORTUNE", "LOOT_BONUS_BLOCKS"),
		detail::MakeCanonicalDisplayAlias("POWER", "ARROW_DAMAGE"),
		detail::MakeCanonicalDisplayAlias("PUNCH", "ARROW_KNOCKBACK"),
		detail::MakeCanonicalDisplayAlias("FLAME", "ARROW_FIRE"),
		detail::MakeCanonicalDisplayAlias("INFINITY", "ARROW_INFINITE"),
		detail::MakeCanonicalDisplayAlias("LUCK_OF_THE_SEA", "LUCK")
	};

	inline constexpr AliasTable kStatusEffectTable{ .catalogName = "status effect", .entries = kStatusEffectAliases };
	inline constexpr AliasTable kEnchantmentTable{ .catalogName = "enchantment", .entries = kEnchantmentAliases };

	[[nodiscard]] constexpr const AliasTable& GetAliasTable(AliasCatalog a_catalog) noexcept
	{
		return a_catalog == AliasCatalog::kEnchantment ? kEnchantmentTable : kStatusEffectTable;
	}

	[[nodiscard]] constexpr std::string_view ToString(AliasCatalog a_catalog) noexcept
	{
		switch (a_catalog) {
		case AliasCatalog::kStatusEffect:
			return "STATUS_EFFECT";
		case AliasCatalog::kEnchantment:
			return "ENCHANTMENT";
		}
		return "UNKNOWN";
	}
}
