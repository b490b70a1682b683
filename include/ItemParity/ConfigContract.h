#pragma once

#include <string_view>

namespace ItemParity::ConfigContract
{
	inline constexpr std::string_view kEquivalenceConfigRelativePath = "ItemParity/equivalence.json";
	inline constexpr std::string_view kFieldInstallationKey = "installationKey";
	inline constexpr std::string_view kFieldHostVersion = "hostVersion";
	inline constexpr std::string_view kFieldLegacySubTypes = "legacySubTypes";
	inline constexpr std::string_view kFieldSubTypeExemptTypes = "subTypeExemptTypes";
	inline constexpr std::string_view kFieldDebugLog = "debugLog";
}
