#include "ItemParity/ItemEquivalence.h"

#include "ItemParity/TextFormat.h"
#include "ItemParity/UnicodeText.h"

#include <algorithm>

#include <spdlog/spdlog.h>

namespace ItemParity
{
	namespace
	{
		[[nodiscard]] bool LoreLineEquals(const std::string& a_first, const std::string& a_second)
		{
			if (a_first == a_second) {
				return true;
			}
			return EqualsIgnoreCaseUtf8(StripColorCodes(a_first), StripColorCodes(a_second));
		}
	}

	bool IsSubTypeExempt(const EquivalenceSettings& a_settings, std::string_view a_typeId)
	{
		return std::find(a_settings.subTypeExemptTypes.begin(), a_settings.subTypeExemptTypes.end(), a_typeId) !=
		       a_settings.subTypeExemptTypes.end();
	}

	std::string InstallationItemTagKey(const EquivalenceSettings& a_settings)
	{
		return a_settings.installationKey + std::string(kInstallationItemTagSuffix);
	}

	std::string NormalizeDisplayName(const std::optional<std::string>& a_name)
	{
		if (!a_name) {
			return {};
		}
		return StripColorCodes(ToLowerUtf8(*a_name));
	}

	bool LoreEquals(
		const std::optional<std::vector<std::string>>& a_first,
		const std::optional<std::vector<std::string>>& a_second)
	{
		if (!a_first || !a_second) {
			return !a_first && !a_second;
		}
		if (a_first->size() != a_second->size()) {
			return false;
		}

		for (std::size_t i = 0; i < a_first->size(); ++i) {
			if (!LoreLineEquals((*a_first)[i], (*a_second)[i])) {
				return false;
			}
		}
		return true;
	}

	bool TagEquals(const ItemRecord& a_first, const ItemRecord& a_second, std::string_view a_key)
	{
		const auto first = GetTag(a_first, a_key);
		const auto second = GetTag(a_second, a_key);

		if (!first && !second) {
			return true;
		}
		if (!first || !second) {
			return false;
		}
		return *first == *second;
	}

	SimilarityMismatch CompareItems(
		const ItemRecord* a_first,
		const ItemRecord* a_second,
		const EquivalenceSettings& a_settings)
	{
		if (!a_first || !a_second) {
			return SimilarityMismatch::kMissingItem;
		}

		const auto& first = *a_first;
		const auto& second = *a_second;

		if (first.typeId != second.typeId) {
			return SimilarityMismatch::kType;
		}
		if (first.hasMetadata != second.hasMetadata) {
			return SimilarityMismatch::kMetadataPresence;
		}
		if (a_settings.legacySubTypes &&
		    first.legacySubType != second.legacySubType &&
		    !IsSubTypeExempt(a_settings, first.typeId)) {
			return SimilarityMismatch::kSubType;
		}

		if (NormalizeDisplayName(first.displayName) != NormalizeDisplayName(second.displayName)) {
			return SimilarityMismatch::kDisplayName;
		}
		if (!LoreEquals(first.lore, second.lore)) {
			return SimilarityMismatch::kLore;
		}

		// No installation key means no installation tags to compare.
		if (a_settings.installationKey.empty()) {
			return SimilarityMismatch::kNone;
		}
		if (!TagEquals(first, second, a_settings.installationKey)) {
			return SimilarityMismatch::kInstallationTag;
		}
		if (!TagEquals(first, second, InstallationItemTagKey(a_settings))) {
			return SimilarityMismatch::kInstallationItemTag;
		}

		return SimilarityMismatch::kNone;
	}

	bool IsSimilar(
		const ItemRecord* a_first,
		const ItemRecord* a_second,
		const EquivalenceSettings& a_settings)
	{
		const auto mismatch = CompareItems(a_first, a_second, a_settings);
		if (mismatch != SimilarityMismatch::kNone && a_settings.debugLog) {
			spdlog::debug(
				"ItemParity: items not similar (check={}, first={}, second={}).",
				ToString(mismatch),
				a_first ? std::string_view{ a_first->typeId } : std::string_view{ "<none>" },
				a_second ? std::string_view{ a_second->typeId } : std::string_view{ "<none>" });
		}
		return mismatch == SimilarityMismatch::kNone;
	}
}
