#pragma once

#include "ItemParity/ItemEquivalence.h"

#include <filesystem>
#include <string_view>

#include <nlohmann/json_fwd.hpp>

namespace ItemParity
{
	// On failure a_outSettings is reset to defaults and the reason is logged.
	[[nodiscard]] bool ParseEquivalenceSettings(
		const nlohmann::json& a_root,
		std::string_view a_sourceName,
		EquivalenceSettings& a_outSettings);

	[[nodiscard]] bool LoadEquivalenceSettings(
		const std::filesystem::path& a_path,
		EquivalenceSettings& a_outSettings);

	[[nodiscard]] bool LoadEquivalenceSettingsFromRuntime(
		std::string_view a_relativePath,
		EquivalenceSettings& a_outSettings);
}
