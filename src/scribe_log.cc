#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>

#include "scribe_log.hpp"

namespace logging = boost::log;

namespace scribe {

void init_logging(const std::string& level) {
    logging::trivial::severity_level sev = logging::trivial::info;
    if      (level == "trace")   sev = logging::trivial::trace;
    else if (level == "debug")   sev = logging::trivial::debug;
    else if (level == "info")    sev = logging::trivial::info;
    else if (level == "warning" || level == "warn") sev = logging::trivial::warning;
    else if (level == "error")   sev = logging::trivial::error;
    else if (level == "fatal")   sev = logging::trivial::fatal;
    else {
        SLOG(warning) << "unknown log_level \"" << level << "\", using info";
    }

    logging::core::get()->set_filter(logging::trivial::severity >= sev);
}

} // namespace scribe
