#include <cstdio>

#include "common/logging.hpp"

namespace swz::io {

static void prefix()
{
	fmt::print(stderr, fmt::emphasis::bold | fmt::fg(fmt::color::gray), "swizgen: ");
}

static void prefix(const std::string &module)
{
	fmt::print(stderr, fmt::emphasis::bold | fmt::fg(fmt::color::gray), "swizgen ");
	fmt::print(stderr, fmt::emphasis::bold | fmt::fg(fmt::color::gray), "({}): ", module);
}

static void declared_from(const char *const file, int line)
{
	prefix();
	fmt::print(stderr, fmt::emphasis::bold | fmt::fg(fmt::color::cadet_blue), "note: ");
	fmt::print(stderr, "declared from {}:{}\n", file, line);
}

void assertion(bool cond, const std::string &module, const std::string &msg)
{
	if (cond) return;
	prefix(module);
	fmt::print(stderr, fmt::emphasis::bold | fmt::fg(fmt::color::purple), "assertion failed: ");
	fmt::print(stderr, "{}\n", msg);
	std::fflush(stderr);
	__builtin_trap();
}

void assertion(bool cond, const std::string &module, const std::string &msg, const char *const file, int line)
{
	if (cond) return;
	prefix(module);
	fmt::print(stderr, fmt::emphasis::bold | fmt::fg(fmt::color::purple), "assertion failed: ");
	fmt::print(stderr, "{}\n", msg);
	declared_from(file, line);
	std::fflush(stderr);
	__builtin_trap();
}

[[noreturn]]
void abort(const std::string &module, const std::string &msg, const char *const file, int line)
{
	prefix(module);
	fmt::print(stderr, fmt::emphasis::bold | fmt::fg(fmt::color::orange_red), "fatal error: ");
	fmt::print(stderr, "{}\n", msg);
	declared_from(file, line);
	std::fflush(stdout);
	std::fflush(stderr);
	__builtin_trap();
}

void error(const std::string &module, const std::string &msg)
{
	prefix(module);
	fmt::print(stderr, fmt::emphasis::bold | fmt::fg(fmt::color::orange_red), "error: ");
	fmt::print(stderr, "{}\n", msg);
	std::fflush(stderr);
}

void warning(const std::string &module, const std::string &msg)
{
	prefix(module);
	fmt::print(stderr, fmt::emphasis::bold | fmt::fg(fmt::color::magenta), "warning: ");
	fmt::print(stderr, "{}\n", msg);
	std::fflush(stderr);
}

void info(const std::string &module, const std::string &msg)
{
	prefix(module);
	fmt::print(stderr, fmt::emphasis::bold | fmt::fg(fmt::color::cadet_blue), "info: ");
	fmt::print(stderr, "{}\n", msg);
	std::fflush(stderr);
}

void note(const std::string &msg)
{
	prefix();
	fmt::print(stderr, fmt::emphasis::bold | fmt::fg(fmt::color::cadet_blue), "note: ");
	fmt::print(stderr, "{}\n", msg);
	std::fflush(stderr);
}

stage_bracket::stage_bracket(const std::string &module_) : module(module_)
{
	prefix();
	fmt::print(stderr, fmt::emphasis::bold | fmt::fg(fmt::color::gold), "begin: ");
	fmt::print(stderr, fmt::emphasis::underline | fmt::emphasis::bold | fmt::fg(fmt::color::gray), "{}\n", module);
	std::fflush(stderr);

	start = clk.now();
}

stage_bracket::~stage_bracket()
{
	end = clk.now();

	auto us = std::chrono::duration_cast <std::chrono::microseconds> (end - start).count();
	auto ms = us/1000.0;

	prefix();
	fmt::print(stderr, fmt::emphasis::bold | fmt::fg(fmt::color::gold), "close: ");
	fmt::print(stderr, fmt::emphasis::underline | fmt::emphasis::bold | fmt::fg(fmt::color::gray), "{}", module);
	fmt::print(stderr, fmt::emphasis::bold | fmt::fg(fmt::color::gray), " ({} ms)\n", ms);
	std::fflush(stderr);
}

} // namespace swz::io
