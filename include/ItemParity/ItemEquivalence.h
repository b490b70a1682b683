#pragma once

#include "ItemParity/ItemRecord.h"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ItemParity
{
	// Sub-types of this type are generated mechanically (bow draw state) and carry no identity.
	inline constexpr std::string_view kDefaultSubTypeExemptType = "BOW";
	inline constexpr std::string_view kInstallationItemTagSuffix = "_Item";

	struct EquivalenceSettings
	{
		bool legacySubTypes{ false };
		// Tag key of the owning installation. Empty (the default) skips both installation tag checks.
		std::string installationKey{};
		std::vector<std::string> subTypeExemptTypes{ std::string(kDefaultSubTypeExemptType) };
		bool debugLog{ false };
	};

	// First check that told two items apart, in evaluation order.
	enum class SimilarityMismatch : std::uint8_t
	{
		kNone,
		kMissingItem,
		kType,
		kMetadataPresence,
		kSubType,
		kDisplayName,
		kLore,
		kInstallationTag,
		kInstallationItemTag,
	};

	[[nodiscard]] constexpr std::string_view ToString(SimilarityMismatch a_mismatch) noexcept
	{
		switch (a_mismatch) {
		case SimilarityMismatch::kNone:
			return "NONE";
		case SimilarityMismatch::kMissingItem:
			return "MISSING_ITEM";
		case SimilarityMismatch::kType:
			return "TYPE";
		case SimilarityMismatch::kMetadataPresence:
			return "METADATA_PRESENCE";
		case SimilarityMismatch::kSubType:
			return "SUB_TYPE";
		case SimilarityMismatch::kDisplayName:
			return "DISPLAY_NAME";
		case SimilarityMismatch::kLore:
			return "LORE";
		case SimilarityMismatch::kInstallationTag:
			return "INSTALLATION_TAG";
		case SimilarityMismatch::kInstallationItemTag:
			return "INSTALLATION_ITEM_TAG";
		}
		return "UNKNOWN";
	}

	[[nodiscard]] bool IsSubTypeExempt(const EquivalenceSettings& a_settings, std::string_view a_typeId);

	[[nodiscard]] std::string InstallationItemTagKey(const EquivalenceSettings& a_settings);

	// Absent -> "", then lower-cased with colour codes removed.
	[[nodiscard]] std::string NormalizeDisplayName(const std::optional<std::string>& a_name);

	// Absent lore only equals absent lore. Lines match when identical, or equal ignoring case once
	// colour codes are stripped.
	[[nodiscard]] bool LoreEquals(
		const std::optional<std::vector<std::string>>& a_first,
		const std::optional<std::vector<std::string>>& a_second);

	// Neither item tagged -> equal; only one tagged -> different; both -> values must match.
	[[nodiscard]] bool TagEquals(const ItemRecord& a_first, const ItemRecord& a_second, std::string_view a_key);

	[[nodiscard]] SimilarityMismatch CompareItems(
		const ItemRecord* a_first,
		const ItemRecord* a_second,
		const EquivalenceSettings& a_settings);

	// Type, sub-type (legacy hosts only), display name, lore and installation tags must agree.
	// Installation tags are only compared when the settings name an installation key.
	// Amount, damage and flags are ignored. A missing item is never similar to anything.
	[[nodiscard]] bool IsSimilar(
		const ItemRecord* a_first,
		const ItemRecord* a_second,
		const EquivalenceSettings& a_settings);
}
