#pragma once

#include <spdlog/spdlog.h>
#include <memory>

namespace estateforecast::utils {

/**
 * @class Logging
 * @brief Provides a singleton interface to the spdlog logging library.
 *
 * A single logger instance is shared by every component of the library. It is
 * created lazily on first use and can be re-levelled at startup.
 */
class Logging {
public:
	/**
	 * @brief Gets the singleton logger instance.
	 * @return A shared pointer to the spdlog logger.
	 */
	static std::shared_ptr<spdlog::logger> &getLogger();

	/**
	 * @brief Initializes the logger with a specific logging level.
	 * @param level The minimum level of messages to log.
	 */
	static void init(spdlog::level::level_enum level = spdlog::level::info);

private:
	Logging() = default;

	static std::shared_ptr<spdlog::logger> logger_;
};

} // namespace estateforecast::utils

#define ESTATE_TRACE(...)    estateforecast::utils::Logging::getLogger()->trace(__VA_ARGS__)
#define ESTATE_DEBUG(...)    estateforecast::utils::Logging::getLogger()->debug(__VA_ARGS__)
#define ESTATE_INFO(...)     estateforecast::utils::Logging::getLogger()->info(__VA_ARGS__)
#define ESTATE_WARN(...)     estateforecast::utils::Logging::getLogger()->warn(__VA_ARGS__)
#define ESTATE_ERROR(...)    estateforecast::utils::Logging::getLogger()->error(__VA_ARGS__)
#define ESTATE_CRITICAL(...) estateforecast::utils::Logging::getLogger()->critical(__VA_ARGS__)
