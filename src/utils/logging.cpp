#include "estate-forecast/utils/logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <mutex>

namespace estateforecast::utils {

std::shared_ptr<spdlog::logger> Logging::logger_;

namespace {

std::mutex &loggerMutex() {
	static std::mutex mutex;
	return mutex;
}

} // namespace

void Logging::init(spdlog::level::level_enum level) {
	std::lock_guard<std::mutex> guard(loggerMutex());
	if (!logger_) {
		logger_ = spdlog::get("estate-forecast");
		if (!logger_) {
			logger_ = spdlog::stdout_color_mt("estate-forecast");
		}
	}
	logger_->set_level(level);
	logger_->flush_on(level);
}

std::shared_ptr<spdlog::logger> &Logging::getLogger() {
	if (!logger_) {
		// Initialize with default level if not already done.
		init();
	}
	return logger_;
}

} // namespace estateforecast::utils
