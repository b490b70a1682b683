#include "parity_checks_common.h"

#include <array>
#include <initializer_list>
#include <utility>

namespace ParityChecks
{
	namespace
	{
		using ItemParity::CompareItems;
		using ItemParity::EquivalenceSettings;
		using ItemParity::IsSimilar;
		using ItemParity::ItemRecord;
		using ItemParity::SimilarityMismatch;

		constexpr std::string_view kInstallKey = "installX";

		[[nodiscard]] EquivalenceSettings MakeSettings(bool a_legacySubTypes)
		{
			EquivalenceSettings settings{};
			settings.legacySubTypes = a_legacySubTypes;
			settings.installationKey = std::string(kInstallKey);
			return settings;
		}

		[[nodiscard]] ItemRecord MakeSword()
		{
			ItemRecord item{};
			item.typeId = "DIAMOND_SWORD";
			item.legacySubType = 0;
			item.hasMetadata = true;
			item.displayName = "&bFrostbite";
			item.lore = std::vector<std::string>{ "&7Forged in ice", "&7Level 3" };
			return item;
		}

		[[nodiscard]] bool ExpectMismatch(
			std::string_view a_label,
			const ItemRecord* a_first,
			const ItemRecord* a_second,
			const EquivalenceSettings& a_settings,
			SimilarityMismatch a_expected)
		{
			const auto actual = CompareItems(a_first, a_second, a_settings);
			if (actual != a_expected) {
				std::cerr << "equivalence: " << a_label << " expected " << ItemParity::ToString(a_expected)
						  << " but got " << ItemParity::ToString(actual) << "\n";
				return false;
			}
			if (IsSimilar(a_first, a_second, a_settings) != (a_expected == SimilarityMismatch::kNone)) {
				std::cerr << "equivalence: " << a_label << " IsSimilar disagrees with CompareItems\n";
				return false;
			}
			return true;
		}
		[[nodiscard]] bool CheckUnkeyedSettingsIgnoreTags()
		{
			const EquivalenceSettings unkeyed{};

			auto blankTagged = MakeSword();
			blankTagged.tags.emplace("", "abc");
			blankTagged.tags.emplace("_Item", "menu_key");
			const auto untagged = MakeSword();

			auto renamed = MakeSword();
			renamed.displayName = "Icebite";
			renamed.tags.emplace("", "abc");

			return ExpectMismatch("unkeyed settings skip tags", &blankTagged, &untagged, unkeyed, SimilarityMismatch::kNone) &&
			       ExpectMismatch("unkeyed settings still compare names", &blankTagged, &renamed, unkeyed, SimilarityMismatch::kDisplayName);
		}
	}

	bool CheckMissingItems()
	{
		const auto settings = MakeSettings(true);
		const auto sword = MakeSword();

		return ExpectMismatch("null first", nullptr, &sword, settings, SimilarityMismatch::kMissingItem) &&
		       ExpectMismatch("null second", &sword, nullptr, settings, SimilarityMismatch::kMissingItem) &&
		       ExpectMismatch("both null", nullptr, nullptr, settings, SimilarityMismatch::kMissingItem);
	}

	bool CheckReflexiveAndSymmetric()
	{
		auto tagged = MakeSword();
		tagged.tags.emplace(std::string(kInstallKey), "abc");

		auto renamed = MakeSword();
		renamed.displayName = "Icebite";

		ItemRecord bare{};
		bare.typeId = "STONE";

		auto bow = MakeSword();
		bow.typeId = "BOW";
		bow.legacySubType = 7;

		const std::array<const ItemRecord*, 5> items{ &tagged, &renamed, &bare, &bow, nullptr };

		for (const bool legacy : { false, true }) {
			const auto settings = MakeSettings(legacy);
			for (const auto* first : items) {
				if (first && !IsSimilar(first, first, settings)) {
					std::cerr << "equivalence: expected " << first->typeId << " to be similar to itself\n";
					return false;
				}
				for (const auto* second : items) {
					if (IsSimilar(first, second, settings) != IsSimilar(second, first, settings)) {
						std::cerr << "equivalence: expected IsSimilar to be symmetric\n";
						return false;
					}
				}
			}
		}
		return true;
	}

	bool CheckIgnoredFields()
	{
		const auto settings = MakeSettings(false);

		auto first = MakeSword();
		first.amount = 1;
		first.damage = 0;
		first.flags = { "HIDE_ENCHANTS", "HIDE_ATTRIBUTES" };

		auto second = MakeSword();
		second.amount = 64;
		second.damage = 1200;
		second.flags = { "HIDE_ATTRIBUTES", "HIDE_ENCHANTS", "HIDE_UNBREAKABLE" };
		second.tags.emplace("SomeOtherPlugin", "xyz");

		return ExpectMismatch("amount/damage/flags/foreign tags", &first, &second, settings, SimilarityMismatch::kNone);
	}

	bool CheckSubTypeExemption()
	{
		const auto legacy = MakeSettings(true);
		const auto modern = MakeSettings(false);

		auto bowA = MakeSword();
		bowA.typeId = "BOW";
		bowA.legacySubType = 0;
		auto bowB = bowA;
		bowB.legacySubType = 384;

		auto woolA = MakeSword();
		woolA.typeId = "WOOL";
		woolA.legacySubType = 1;
		auto woolB = woolA;
		woolB.legacySubType = 14;

		auto woolNoSubType = woolA;
		woolNoSubType.legacySubType.reset();

		auto customExempt = legacy;
		customExempt.subTypeExemptTypes.push_back("WOOL");

		return ExpectMismatch("exempt type, legacy", &bowA, &bowB, legacy, SimilarityMismatch::kNone) &&
		       ExpectMismatch("non-exempt type, legacy", &woolA, &woolB, legacy, SimilarityMismatch::kSubType) &&
		       ExpectMismatch("non-exempt type, modern", &woolA, &woolB, modern, SimilarityMismatch::kNone) &&
		       ExpectMismatch("absent sub-type, legacy", &woolA, &woolNoSubType, legacy, SimilarityMismatch::kSubType) &&
		       ExpectMismatch("configured exempt type", &woolA, &woolB, customExempt, SimilarityMismatch::kNone);
	}

	bool CheckDisplayNameNormalization()
	{
		const auto settings = MakeSettings(false);

		auto plain = MakeSword();
		plain.displayName = "frostbite";

		auto colored = MakeSword();
		colored.displayName = "\xC2\xA7" "b\xC2\xA7lFROSTBITE";

		auto unnamed = MakeSword();
		unnamed.displayName.reset();

		auto emptyName = MakeSword();
		emptyName.displayName = "";

		auto other = MakeSword();
		other.displayName = "Frostbyte";

		return ExpectMismatch("case and colour ignored", &plain, &colored, settings, SimilarityMismatch::kNone) &&
		       ExpectMismatch("absent equals empty", &unnamed, &emptyName, settings, SimilarityMismatch::kNone) &&
		       ExpectMismatch("different name", &plain, &other, settings, SimilarityMismatch::kDisplayName) &&
		       ExpectMismatch("absent vs named", &unnamed, &plain, settings, SimilarityMismatch::kDisplayName);
	}

	bool CheckLoreComparison()
	{
		using ItemParity::LoreEquals;
		using Lore = std::optional<std::vector<std::string>>;

		const Lore none{};
		const Lore empty{ std::vector<std::string>{} };
		const Lore lines{ std::vector<std::string>{ "&7Forged in ice", "&7Level 3" } };
		const Lore recolored{ std::vector<std::string>{ "&9forged in ICE", "Level 3" } };
		const Lore reordered{ std::vector<std::string>{ "&7Level 3", "&7Forged in ice" } };
		const Lore shorter{ std::vector<std::string>{ "&7Forged in ice" } };

		if (!LoreEquals(none, none) || !LoreEquals(empty, empty) || !LoreEquals(lines, lines)) {
			std::cerr << "lore: expected identical lore to match\n";
			return false;
		}
		if (LoreEquals(none, empty) || LoreEquals(empty, none)) {
			std::cerr << "lore: expected absent lore to differ from empty lore\n";
			return false;
		}
		if (!LoreEquals(lines, recolored)) {
			std::cerr << "lore: expected colour and case differences to be ignored per line\n";
			return false;
		}
		if (LoreEquals(lines, reordered) || LoreEquals(lines, shorter) || LoreEquals(shorter, lines)) {
			std::cerr << "lore: expected order and length to matter\n";
			return false;
		}

		const auto settings = MakeSettings(false);
		const auto sword = MakeSword();
		auto noLore = MakeSword();
		noLore.lore.reset();
		return ExpectMismatch("lore removed", &sword, &noLore, settings, SimilarityMismatch::kLore);
	}

	bool CheckUnicodeCaseFolding()
	{
		// "Železný meč" / "ŽELEZNÝ MEČ", "épée" / "ÉPÉE"
		constexpr std::string_view kLowerName = "\xC5\xBE" "elezn\xC3\xBD me\xC4\x8D";
		constexpr std::string_view kUpperName = "\xC5\xBD" "ELEZN\xC3\x9D ME\xC4\x8C";
		constexpr std::string_view kLowerLine = "\xC3\xA9p\xC3\xA9" "e";
		constexpr std::string_view kUpperLine = "\xC3\x89P\xC3\x89" "E";

		if (ItemParity::ToLowerUtf8(kUpperName) != kLowerName ||
			ItemParity::NormalizeDisplayName(std::string(kUpperName)) != ItemParity::NormalizeDisplayName(std::string(kLowerName))) {
			std::cerr << "unicode: expected accented capitals to lower-case\n";
			return false;
		}
		if (!ItemParity::EqualsIgnoreCaseUtf8(kLowerLine, kUpperLine) ||
			ItemParity::EqualsIgnoreCaseUtf8(kLowerLine, "epee")) {
			std::cerr << "unicode: expected case-only differences to match and accents to matter\n";
			return false;
		}
		// Malformed UTF-8 still compares byte-wise instead of collapsing to replacement characters.
		if (ItemParity::EqualsIgnoreCaseUtf8("\xFF" "a", "\xFE" "A") || !ItemParity::EqualsIgnoreCaseUtf8("\xFF" "a", "\xFF" "A")) {
			std::cerr << "unicode: expected malformed input to fall back to ASCII folding\n";
			return false;
		}

		const auto settings = MakeSettings(false);

		auto lowerName = MakeSword();
		lowerName.displayName = std::string(kLowerName);
		auto upperName = MakeSword();
		upperName.displayName = "&b" + std::string(kUpperName);

		auto lowerLore = MakeSword();
		lowerLore.lore = std::vector<std::string>{ std::string(kLowerLine) };
		auto upperLore = MakeSword();
		upperLore.lore = std::vector<std::string>{ "&7" + std::string(kUpperLine) };

		return ExpectMismatch("accented display name case", &lowerName, &upperName, settings, SimilarityMismatch::kNone) &&
		       ExpectMismatch("accented lore case", &lowerLore, &upperLore, settings, SimilarityMismatch::kNone);
	}

	bool CheckInstallationTags()
	{
		const auto settings = MakeSettings(true);

		auto tagged = MakeSword();
		tagged.tags.emplace("installX", "abc");
		const auto untagged = MakeSword();

		auto sameTag = MakeSword();
		sameTag.tags.emplace("installX", "abc");

		auto otherTag = MakeSword();
		otherTag.tags.emplace("installX", "abd");

		auto itemTagged = MakeSword();
		itemTagged.tags.emplace("installX_Item", "menu_key");

		auto itemTaggedSame = MakeSword();
		itemTaggedSame.tags.emplace("installX_Item", "menu_key");

		auto itemTaggedOther = MakeSword();
		itemTaggedOther.tags.emplace("installX_Item", "other_key");

		return ExpectMismatch("one side tagged", &tagged, &untagged, settings, SimilarityMismatch::kInstallationTag) &&
		       ExpectMismatch("other side tagged", &untagged, &tagged, settings, SimilarityMismatch::kInstallationTag) &&
		       ExpectMismatch("same tag value", &tagged, &sameTag, settings, SimilarityMismatch::kNone) &&
		       ExpectMismatch("different tag value", &tagged, &otherTag, settings, SimilarityMismatch::kInstallationTag) &&
		       ExpectMismatch("item tag one side", &itemTagged, &untagged, settings, SimilarityMismatch::kInstallationItemTag) &&
		       ExpectMismatch("item tag same", &itemTagged, &itemTaggedSame, settings, SimilarityMismatch::kNone) &&
		       ExpectMismatch("item tag different", &itemTagged, &itemTaggedOther, settings, SimilarityMismatch::kInstallationItemTag) &&
		       CheckUnkeyedSettingsIgnoreTags();
	}

	bool CheckMismatchOrder()
	{
		const auto settings = MakeSettings(true);
		const auto base = MakeSword();

		// Every field differs; each step removes the earliest difference.
		auto candidate = MakeSword();
		candidate.typeId = "IRON_SWORD";
		candidate.hasMetadata = false;
		candidate.legacySubType = 2;
		candidate.displayName = "Other";
		candidate.lore.reset();
		candidate.tags.emplace("installX", "abc");
		candidate.tags.emplace("installX_Item", "menu_key");

		const std::array<std::pair<SimilarityMismatch, void (*)(ItemRecord&)>, 7> steps{ {
			{ SimilarityMismatch::kType, [](ItemRecord& a_item) { a_item.typeId = "DIAMOND_SWORD"; } },
			{ SimilarityMismatch::kMetadataPresence, [](ItemRecord& a_item) { a_item.hasMetadata = true; } },
			{ SimilarityMismatch::kSubType, [](ItemRecord& a_item) { a_item.legacySubType = 0; } },
			{ SimilarityMismatch::kDisplayName, [](ItemRecord& a_item) { a_item.displayName = "&bFrostbite"; } },
			{ SimilarityMismatch::kLore, [](ItemRecord& a_item) { a_item.lore = MakeSword().lore; } },
			{ SimilarityMismatch::kInstallationTag, [](ItemRecord& a_item) { a_item.tags.erase("installX"); } },
			{ SimilarityMismatch::kInstallationItemTag, [](ItemRecord& a_item) { a_item.tags.erase("installX_Item"); } },
		} };

		for (const auto& [expected, fix] : steps) {
			if (!ExpectMismatch(ItemParity::ToString(expected), &base, &candidate, settings, expected)) {
				return false;
			}
			fix(candidate);
		}

		return ExpectMismatch("all fixed", &base, &candidate, settings, SimilarityMismatch::kNone);
	}
}
