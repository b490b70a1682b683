#pragma once

#include <filesystem>
#include <optional>
#include <string_view>

namespace ItemParity::RuntimePaths
{
	[[nodiscard]] std::optional<std::filesystem::path> GetExecutableDirectory();
	// Relative to the directory of the running executable, or the working directory if that is unknown.
	[[nodiscard]] std::filesystem::path ResolveExecutableRelativePath(std::string_view a_relativePath);
}
