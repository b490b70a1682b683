#pragma once

#include <filesystem>

#include <spdlog/common.h>

namespace ItemParity::Logging
{
	// Routes the default spdlog logger into a_logPath (truncated on open).
	[[nodiscard]] bool SetupLogging(
		const std::filesystem::path& a_logPath,
		spdlog::level::level_enum a_level = spdlog::level::info);
}
