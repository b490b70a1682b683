#include "ItemParity/EquivalenceConfig.h"

#include "ItemParity/ConfigContract.h"
#include "ItemParity/HostVersion.h"
#include "ItemParity/RuntimePaths.h"

#include <fstream>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace ItemParity
{
	namespace
	{
		[[nodiscard]] bool TryReadRequiredString(
			const nlohmann::json& a_object,
			std::string_view a_key,
			std::string& a_outValue)
		{
			const auto it = a_object.find(std::string(a_key));
			if (it == a_object.end() || !it->is_string()) {
				return false;
			}

			a_outValue = it->get<std::string>();
			return !a_outValue.empty();
		}

		// Missing or null is fine; any other non-bool value is an error.
		[[nodiscard]] bool TryReadOptionalBool(
			const nlohmann::json& a_object,
			std::string_view a_key,
			std::optional<bool>& a_outValue)
		{
			a_outValue.reset();
			const auto it = a_object.find(std::string(a_key));
			if (it == a_object.end() || it->is_null()) {
				return true;
			}
			if (!it->is_boolean()) {
				return false;
			}

			a_outValue = it->get<bool>();
			return true;
		}

		[[nodiscard]] bool TryReadExemptTypes(
			const nlohmann::json& a_object,
			std::vector<std::string>& a_outTypes)
		{
			const auto it = a_object.find(std::string(ConfigContract::kFieldSubTypeExemptTypes));
			if (it == a_object.end() || it->is_null()) {
				return true;
			}
			if (!it->is_array()) {
				return false;
			}

			std::vector<std::string> types;
			types.reserve(it->size());
			for (const auto& entry : *it) {
				if (!entry.is_string()) {
					return false;
				}

				auto typeId = entry.get<std::string>();
				if (typeId.empty()) {
					return false;
				}
				types.push_back(std::move(typeId));
			}

			a_outTypes = std::move(types);
			return true;
		}
	}

	bool ParseEquivalenceSettings(
		const nlohmann::json& a_root,
		std::string_view a_sourceName,
		EquivalenceSettings& a_outSettings)
	{
		a_outSettings = {};

		if (!a_root.is_object()) {
			spdlog::warn("ItemParity: equivalence config in {} is not a JSON object.", a_sourceName);
			return false;
		}

		EquivalenceSettings settings{};

		if (!TryReadRequiredString(a_root, ConfigContract::kFieldInstallationKey, settings.installationKey)) {
			spdlog::warn(
				"ItemParity: equivalence config missing non-empty '{}' in {}.",
				ConfigContract::kFieldInstallationKey,
				a_sourceName);
			return false;
		}

		std::optional<bool> legacySubTypes;
		if (!TryReadOptionalBool(a_root, ConfigContract::kFieldLegacySubTypes, legacySubTypes)) {
			spdlog::warn(
				"ItemParity: equivalence config has non-bool '{}' in {}.",
				ConfigContract::kFieldLegacySubTypes,
				a_sourceName);
			return false;
		}

		std::optional<HostVersion> hostVersion;
		const auto versionIt = a_root.find(std::string(ConfigContract::kFieldHostVersion));
		if (versionIt != a_root.end() && !versionIt->is_null()) {
			if (versionIt->is_string()) {
				hostVersion = ParseHostVersion(versionIt->get<std::string>());
			}
			if (!hostVersion) {
				spdlog::warn(
					"ItemParity: equivalence config has unparsable '{}' in {}.",
					ConfigContract::kFieldHostVersion,
					a_sourceName);
				return false;
			}
		}

		if (legacySubTypes) {
			settings.legacySubTypes = *legacySubTypes;
			if (hostVersion && UsesLegacySubTypes(*hostVersion) != *legacySubTypes) {
				spdlog::info(
					"ItemParity: '{}' overrides the value implied by host version {}.{}.{} in {}.",
					ConfigContract::kFieldLegacySubTypes,
					hostVersion->major,
					hostVersion->minor,
					hostVersion->patch,
					a_sourceName);
			}
		} else if (hostVersion) {
			settings.legacySubTypes = UsesLegacySubTypes(*hostVersion);
		}

		if (!TryReadExemptTypes(a_root, settings.subTypeExemptTypes)) {
			spdlog::warn(
				"ItemParity: equivalence config has invalid '{}' (expected array of non-empty strings) in {}.",
				ConfigContract::kFieldSubTypeExemptTypes,
				a_sourceName);
			return false;
		}

		std::optional<bool> debugLog;
		if (!TryReadOptionalBool(a_root, ConfigContract::kFieldDebugLog, debugLog)) {
			spdlog::warn(
				"ItemParity: equivalence config has non-bool '{}' in {}.",
				ConfigContract::kFieldDebugLog,
				a_sourceName);
			return false;
		}
		settings.debugLog = debugLog.value_or(false);

		a_outSettings = std::move(settings);
		return true;
	}

	bool LoadEquivalenceSettings(
		const std::filesystem::path& a_path,
		EquivalenceSettings& a_outSettings)
	{
		a_outSettings = {};

		std::ifstream in(a_path, std::ios::binary);
		if (!in.is_open()) {
			spdlog::warn("ItemParity: equivalence config missing at {}.", a_path.string());
			return false;
		}

		nlohmann::json root = nlohmann::json::object();
		try {
			in >> root;
		} catch (const std::exception& e) {
			spdlog::warn("ItemParity: equivalence config parse failed at {} ({}).", a_path.string(), e.what());
			return false;
		}

		if (!ParseEquivalenceSettings(root, a_path.string(), a_outSettings)) {
			return false;
		}

		spdlog::info(
			"ItemParity: loaded equivalence config from {} (legacySubTypes={}, exemptTypes={}).",
			a_path.string(),
			a_outSettings.legacySubTypes,
			a_outSettings.subTypeExemptTypes.size());
		return true;
	}

	bool LoadEquivalenceSettingsFromRuntime(
		std::string_view a_relativePath,
		EquivalenceSettings& a_outSettings)
	{
		return LoadEquivalenceSettings(RuntimePaths::ResolveExecutableRelativePath(a_relativePath), a_outSettings);
	}
}
