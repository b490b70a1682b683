#include "ItemParity/Logging.h"

#include <memory>
#include <system_error>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>

namespace ItemParity::Logging
{
	bool SetupLogging(const std::filesystem::path& a_logPath, spdlog::level::level_enum a_level)
	{
		if (a_logPath.has_parent_path()) {
			std::error_code ec;
			std::filesystem::create_directories(a_logPath.parent_path(), ec);
			if (ec) {
				spdlog::warn(
					"ItemParity: failed to create log directory {} ({})",
					a_logPath.parent_path().string(),
					ec.message());
				return false;
			}
		}

		std::shared_ptr<spdlog::sinks::basic_file_sink_mt> sink;
		try {
			sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(a_logPath.string(), true);
		} catch (const spdlog::spdlog_ex& e) {
			spdlog::warn("ItemParity: failed to open log file {} ({})", a_logPath.string(), e.what());
			return false;
		}

		auto logger = std::make_shared<spdlog::logger>("", std::move(sink));
		spdlog::set_default_logger(std::move(logger));
		spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
		spdlog::set_level(a_level);
		spdlog::flush_on(a_level);
		return true;
	}
}
