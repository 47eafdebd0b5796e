#include "Logging.hpp"

#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>

namespace xmlextract
{

void
setLogLevel(LogLevel minimum)
{
    boost::log::core::get()->set_filter(
        boost::log::trivial::severity >= minimum
    );
}

} // namespace xmlextract
