#pragma once

#include <chrono>
#include <string>

#include <fmt/color.h>
#include <fmt/format.h>

namespace swz::io {

// All diagnostics are written to stderr, stdout is reserved for generated text
void assertion(bool cond, const std::string &, const std::string &);
void assertion(bool cond, const std::string &, const std::string &, const char *const, int);

[[noreturn]] void abort(const std::string &, const std::string &, const char *const, int);

void error(const std::string &, const std::string &);
void warning(const std::string &, const std::string &);
void info(const std::string &, const std::string &);

void note(const std::string &);

struct stage_bracket {
	std::string module;

	using clock_t = std::chrono::high_resolution_clock;
	using time_t = clock_t::time_point;

	clock_t clk;
	time_t start;
	time_t end;

	stage_bracket(const std::string &);

	~stage_bracket();
};

// Helper macros for easier logging
#define MODULE(name) static constexpr const char __module__[] = #name

} // namespace swz::io

#ifdef SWZ_DEBUG

#define SWZ_ASSERT(cond, ...)	swz::io::assertion(cond, __module__, fmt::format(__VA_ARGS__), __FILE__, __LINE__)
#define SWZ_ASSERT_PLAIN(cond)	swz::io::assertion(cond, __module__, fmt::format("{}:{}\n\t{}", __FILE__, __LINE__, #cond))

#define SWZ_ABORT(...)		swz::io::abort(__module__, fmt::format(__VA_ARGS__), __FILE__, __LINE__)
#define SWZ_ERROR(...)		swz::io::error(__module__, fmt::format(__VA_ARGS__))
#define SWZ_WARNING(...)	swz::io::warning(__module__, fmt::format(__VA_ARGS__))
#define SWZ_INFO(...)		swz::io::info(__module__, fmt::format(__VA_ARGS__))
#define SWZ_DEBUG_INFO(...)	swz::io::info(__module__, fmt::format(__VA_ARGS__))
#define SWZ_NOTE(...)		swz::io::note(fmt::format(__VA_ARGS__))

#define SWZ_STAGE()		swz::io::stage_bracket __stage(__module__)
#define SWZ_STAGE_SECTION(s)	swz::io::stage_bracket __stage(#s)

#else

#define SWZ_ASSERT(cond, ...)	if (cond && __module__) {}
#define SWZ_ASSERT_PLAIN(cond)	if (cond && __module__) {}

#define SWZ_ABORT(...)		swz::io::abort(__module__, fmt::format(__VA_ARGS__), __FILE__, __LINE__)
#define SWZ_ERROR(...)		swz::io::error(__module__, fmt::format(__VA_ARGS__))
#define SWZ_WARNING(...)	swz::io::warning(__module__, fmt::format(__VA_ARGS__))
#define SWZ_INFO(...)		swz::io::info(__module__, fmt::format(__VA_ARGS__))
#define SWZ_DEBUG_INFO(...)
#define SWZ_NOTE(...)		swz::io::note(fmt::format(__VA_ARGS__))

#define SWZ_STAGE()
#define SWZ_STAGE_SECTION(s)

#endif
