#include "mwareader/logging.hpp"

#include <boost/date_time/posix_time/posix_time_io.hpp>
#include <boost/date_time/posix_time/posix_time_types.hpp>
#include <boost/log/attributes/named_scope.hpp>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/trivial.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>

#include <iostream>

namespace mwareader
{
namespace
{

boost::log::trivial::severity_level
parse_severity(std::string const& severity)
{
    namespace trivial = boost::log::trivial;
    trivial::severity_level level = trivial::error;
    if(severity == "debug" || severity == "info" || severity == "warning") {
        trivial::from_string(severity.c_str(), severity.size(), level);
    }
    return level;
}

} // namespace

void init_logging(std::string const& severity)
{
    using namespace boost::log;
    namespace expr = boost::log::expressions;

    add_common_attributes();
    core::get()->add_global_attribute("Scope", attributes::named_scope());

    // [TimeStamp] [Severity] [Scope] message
    add_console_log(
        std::clog,
        keywords::format =
            (expr::stream
             << "[" << expr::attr<boost::posix_time::ptime>("TimeStamp")
             << "] [" << expr::attr<trivial::severity_level>("Severity")
             << "] ["
             << expr::format_named_scope("Scope",
                                         keywords::format = "%n",
                                         keywords::depth  = 1)
             << "] " << expr::smessage));

    core::get()->set_filter(trivial::severity >= parse_severity(severity));
}

} // namespace mwareader
