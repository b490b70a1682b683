#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace ItemParity
{
	struct HostVersion
	{
		std::uint32_t major{ 0 };
		std::uint32_t minor{ 0 };
		std::uint32_t patch{ 0 };

		[[nodiscard]] constexpr bool operator==(const HostVersion&) const noexcept = default;
	};

	// Hosts before this release identify item variants by a numeric sub-type.
	inline constexpr HostVersion kLegacySubTypeCutover{ .major = 1, .minor = 13, .patch = 0 };

	[[nodiscard]] constexpr bool IsOlderThan(const HostVersion& a_version, const HostVersion& a_other) noexcept
	{
		if (a_version.major != a_other.major) {
			return a_version.major < a_other.major;
		}
		if (a_version.minor != a_other.minor) {
			return a_version.minor < a_other.minor;
		}
		return a_version.patch < a_other.patch;
	}

	[[nodiscard]] constexpr bool UsesLegacySubTypes(const HostVersion& a_version) noexcept
	{
		return IsOlderThan(a_version, kLegacySubTypeCutover);
	}

	// Accepts "major.minor" or "major.minor.patch", optionally followed by a build suffix
	// starting with '-' or ' ' (e.g. "1.12.2-R0.1-SNAPSHOT").
	[[nodiscard]] constexpr std::optional<HostVersion> ParseHostVersion(std::string_view a_text) noexcept
	{
		std::uint32_t parts[3]{ 0, 0, 0 };
		std::size_t partCount = 0;
		std::size_t pos = 0;

		while (partCount < 3) {
			if (pos >= a_text.size() || a_text[pos] < '0' || a_text[pos] > '9') {
				return std::nullopt;
			}

			std::uint32_t value = 0;
			while (pos < a_text.size() && a_text[pos] >= '0' && a_text[pos] <= '9') {
				if (value > 100000u) {
					return std::nullopt;
				}
				value = value * 10u + static_cast<std::uint32_t>(a_text[pos] - '0');
				++pos;
			}
			parts[partCount++] = value;

			if (partCount == 3 || pos >= a_text.size() || a_text[pos] != '.') {
				break;
			}
			++pos;
		}

		if (partCount < 2) {
			return std::nullopt;
		}
		if (pos < a_text.size() && a_text[pos] != '-' && a_text[pos] != ' ') {
			return std::nullopt;
		}

		return HostVersion{ .major = parts[0], .minor = parts[1], .patch = parts[2] };
	}
}
