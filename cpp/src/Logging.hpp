#ifndef __HAVE_LOGGING__
#define __HAVE_LOGGING__

/**
 * Log output goes through the Boost.Log trivial logger:
 *
 *   BOOST_LOG_TRIVIAL(warning) << "...";
 *
 * Records go to the default console sink unless the application installs
 * its own sinks on boost::log::core.
 */
#include <boost/log/trivial.hpp>

namespace xmlextract
{

typedef boost::log::trivial::severity_level LogLevel;

// Drop records below 'minimum' for the whole process
void setLogLevel(LogLevel minimum);

} // namespace xmlextract

#endif // __HAVE_LOGGING__
