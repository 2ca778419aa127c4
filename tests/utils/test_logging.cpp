#include <catch2/catch_test_macros.hpp>

#include "estate-forecast/utils/logging.hpp"

#include <spdlog/spdlog.h>

using estateforecast::utils::Logging;

TEST_CASE("Logging initializes singleton logger", "[utils][logging]") {
	auto &logger_ref = Logging::getLogger();
	REQUIRE(logger_ref);
	REQUIRE(logger_ref->name() == "estate-forecast");

	const auto first_level = logger_ref->level();

	Logging::init(spdlog::level::warn);
	auto &logger_after_init = Logging::getLogger();

	REQUIRE(logger_ref.get() == logger_after_init.get());
	REQUIRE(logger_after_init->level() == spdlog::level::warn);
	REQUIRE(logger_after_init->flush_level() == spdlog::level::warn);
	REQUIRE(spdlog::get("estate-forecast").get() == logger_after_init.get());

	// Restore to original level for downstream tests
	logger_after_init->set_level(first_level);
	logger_after_init->flush_on(first_level);
}

TEST_CASE("Logging macros route through the shared logger", "[utils][logging]") {
	REQUIRE_NOTHROW(ESTATE_DEBUG("debug message {}", 1));
	REQUIRE_NOTHROW(ESTATE_WARN("warning for district '{}'", "north"));
}
