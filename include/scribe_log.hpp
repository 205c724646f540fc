#pragma once
#include <string>

#include <boost/log/trivial.hpp>

#define SLOG(sev) BOOST_LOG_TRIVIAL(sev) << "\t[Scribe]\t"

namespace scribe {

// Sets the Boost.Log core filter. Unknown names fall back to info.
void init_logging(const std::string& level);

} // namespace scribe
