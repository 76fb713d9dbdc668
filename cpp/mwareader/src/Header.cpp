#include "mwareader/Header.hpp"

#include "ascii_header.h"

#include <boost/log/trivial.hpp>

#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <vector>

namespace mwareader
{

Header::Header(psrdada_cpp::RawBytes& header): _header(header)
{
}

Header::~Header()
{
}

std::optional<std::string> Header::lookup(char const* key) const
{
    // A value can be no longer than the header holding it
    std::vector<char> value(_header.total_bytes() + 1, '\0');
    if(ascii_header_get(_header.ptr(), key, "%s", value.data()) < 1) {
        return std::nullopt;
    }
    return std::string(value.data());
}

bool Header::has_key(char const* key) const
{
    return lookup(key).has_value();
}

template <>
std::size_t Header::convert<std::size_t>(char const* key,
                                         std::string const& value)
{
    if(value.empty() ||
       value.find_first_not_of("0123456789") != std::string::npos) {
        throw std::runtime_error(std::string("The header key ") + key +
                                 " is not an unsigned integer: " + value);
    }
    errno                         = 0;
    unsigned long long const full = std::strtoull(value.c_str(), nullptr, 10);
    if(errno == ERANGE ||
       full > static_cast<unsigned long long>(SIZE_MAX)) {
        throw std::runtime_error(std::string("The header key ") + key +
                                 " is out of range: " + value);
    }
    BOOST_LOG_TRIVIAL(debug) << "Header " << key << " = " << full;
    return static_cast<std::size_t>(full);
}

template <>
std::string Header::convert<std::string>(char const* key,
                                         std::string const& value)
{
    BOOST_LOG_TRIVIAL(debug) << "Header " << key << " = " << value;
    return value;
}

} // namespace mwareader
