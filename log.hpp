#pragma once
#include <memory>
#include <spdlog/spdlog.h>
#include <spdlog/cfg/env.h>
#include <spdlog/sinks/stdout_color_sinks.h>

// The library logs through a single named spdlog logger, "short_id".
// If the host application registered a logger under that name first, we use theirs.
// Otherwise one is created on first use with a colour stdout sink at level warn,
// so an embedded short_id stays quiet unless SPDLOG_LEVEL says otherwise
// (e.g. SPDLOG_LEVEL=short_id=debug).

namespace shortid::log{

	inline constexpr const char* logger_name = "short_id";

	[[nodiscard]] inline std::shared_ptr<spdlog::logger> make_logger(){
		if(auto existing = spdlog::get(logger_name)){
			return existing;
		}
		auto lg = spdlog::stdout_color_mt(logger_name);
		lg->set_level(spdlog::level::warn);
		spdlog::cfg::load_env_levels(); // may raise or lower our level
		return lg;
	}

	// thread-safe (magic static), the logger itself is _mt.
	[[nodiscard]] inline spdlog::logger& logger(){
		static const std::shared_ptr<spdlog::logger> lg = make_logger();
		return *lg;
	}

} //namespace shortid::log
