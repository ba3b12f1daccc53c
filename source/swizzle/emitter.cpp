#include <cstdio>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include "common/logging.hpp"
#include "swizzle/emitter.hpp"
#include "swizzle/product.hpp"

namespace swz {

MODULE(emitter);

static const EmitterConfig &validated(const EmitterConfig &config)
{
	if (!config.validate())
		SWZ_ABORT("invalid emitter configuration (domain \"{}\", covered \"{}\", arity {})",
			config.domain.symbols, config.covered.symbols, config.arity);

	return config;
}

PermutationEmitter::PermutationEmitter(const EmitterConfig &config_)
		: config(validated(config_)),
		covered_set(config.covered, config.arity) {}

bool PermutationEmitter::covered(const std::string &code) const
{
	return covered_set.contains(code);
}

std::string PermutationEmitter::format(const std::string &code) const
{
	return fmt::format("{}({} -> {}: {} => {});",
		config.macro, config.placeholder,
		config.arity, code,
		fmt::join(code, ", "));
}

void PermutationEmitter::emit(const sink_t &sink) const
{
	size_t skipped = 0;
	size_t emitted = 0;

	for (const auto &code : CartesianPower(config.domain, config.arity)) {
		if (covered(code)) {
			skipped++;
			continue;
		}

		sink(format(code));
		emitted++;
	}

	SWZ_DEBUG_INFO("emitted {} swizzles, skipped {} covered by \"{}\"",
		emitted, skipped, config.covered.symbols);
}

std::vector <std::string> PermutationEmitter::lines() const
{
	std::vector <std::string> result;
	emit([&](const std::string &line) {
		result.push_back(line);
	});

	return result;
}

void PermutationEmitter::run() const
{
	SWZ_STAGE();

	emit([](const std::string &line) {
		fmt::print("{}\n", line);
	});

	std::fflush(stdout);
}

} // namespace swz
