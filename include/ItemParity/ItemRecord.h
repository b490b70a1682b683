#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ItemParity
{
	// Opaque per-item string tags attached by other systems. Read, never interpreted.
	using TagStore = std::map<std::string, std::string, std::less<>>;

	struct ItemRecord
	{
		std::string typeId{};
		std::optional<std::int32_t> legacySubType{};
		std::uint32_t amount{ 1 };
		std::int32_t damage{ 0 };
		bool hasMetadata{ false };
		std::optional<std::string> displayName{};
		std::optional<std::vector<std::string>> lore{};
		std::vector<std::string> flags{};
		TagStore tags{};
	};

	[[nodiscard]] inline bool HasTag(const ItemRecord& a_item, std::string_view a_key)
	{
		return a_item.tags.find(a_key) != a_item.tags.end();
	}

	[[nodiscard]] inline std::optional<std::string_view> GetTag(const ItemRecord& a_item, std::string_view a_key)
	{
		const auto it = a_item.tags.find(a_key);
		if (it == a_item.tags.end()) {
			return std::nullopt;
		}
		return std::string_view{ it->second };
	}
}
