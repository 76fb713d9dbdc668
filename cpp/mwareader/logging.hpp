#ifndef MWAREADER_LOGGING_HPP
#define MWAREADER_LOGGING_HPP

#include <string>

namespace mwareader
{

/**
 * @brief      Install a console log sink and set the severity filter
 *
 * @param      severity  One of debug, info, warning or error
 */
void init_logging(std::string const& severity);

} // namespace mwareader

#endif // MWAREADER_LOGGING_HPP
