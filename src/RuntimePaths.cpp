#include "ItemParity/RuntimePaths.h"

#include <system_error>

namespace ItemParity::RuntimePaths
{
	std::optional<std::filesystem::path> GetExecutableDirectory()
	{
		std::error_code ec;
		std::filesystem::path path = std::filesystem::read_symlink("/proc/self/exe", ec);
		if (ec || path.empty()) {
			return std::nullopt;
		}

		path = path.remove_filename();
		return path;
	}

	std::filesystem::path ResolveExecutableRelativePath(std::string_view a_relativePath)
	{
		if (const auto executableDir = GetExecutableDirectory(); executableDir) {
			return *executableDir / std::filesystem::path(a_relativePath);
		}
		return std::filesystem::current_path() / std::filesystem::path(a_relativePath);
	}
}
