#include <zschema/logging.hpp>

namespace zschema {

LoggerPtr get_logger(const std::string& name)
{
    if (auto logger = spdlog::get(name)) {
        return logger;
    }

    try {
        auto default_logger = spdlog::default_logger();
        // No default logger after spdlog::drop_all(): stay silent.
        auto logger = default_logger ? default_logger->clone(name)
                                     : std::make_shared<Logger>(name);

        // Applies the registry's configured level and registers the logger.
        spdlog::initialize_logger(logger);
        return logger;
    } catch (const spdlog::spdlog_ex&) {
        // Registered concurrently by another thread.
        if (auto logger = spdlog::get(name)) {
            return logger;
        }
        throw;
    }
}

} // namespace zschema
