#ifndef MWAREADER_HEADER_HPP
#define MWAREADER_HEADER_HPP

#include "psrdada_cpp/raw_bytes.hpp"

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>

namespace mwareader
{

/**
 * @brief      Read-only key lookup in a DADA header
 *
 * @detail     DADA headers are composed of whitespace separated ASCII
 *             key-value pairs, one per line, stored in a single null
 *             terminated char array. MWAX voltage subfiles start with
 *             one. Integer values must be plain unsigned decimals.
 */
class Header
{
  public:
    /**
     * @brief      Wrap a header
     *
     * @param      header  A RawBytes object wrapping a null terminated
     *                     DADA header. It must outlive this object.
     */
    explicit Header(psrdada_cpp::RawBytes& header);
    ~Header();
    Header(Header const&) = delete;

    /**
     * @brief      Get a value from the header
     *
     * @details    Throws std::runtime_error if the key is absent or its
     *             value cannot be converted to T.
     */
    template <typename T>
    T get(char const* key) const;

    /**
     * @brief      Get a value from the header, or a default if the key
     *             is absent
     *
     * @details    A key that is present but malformed still throws.
     */
    template <typename T>
    T get_or_default(char const* key, T default_value) const;

    bool has_key(char const* key) const;

  private:
    std::optional<std::string> lookup(char const* key) const;
    template <typename T>
    static T convert(char const* key, std::string const& value);

  private:
    psrdada_cpp::RawBytes& _header;
};

template <>
std::size_t Header::convert<std::size_t>(char const* key,
                                         std::string const& value);
template <>
std::string Header::convert<std::string>(char const* key,
                                         std::string const& value);

template <typename T>
T Header::get(char const* key) const
{
    std::optional<std::string> const value = lookup(key);
    if(!value) {
        throw std::runtime_error(std::string("Could not find ") + key +
                                 " key in DADA header");
    }
    return convert<T>(key, *value);
}

template <typename T>
T Header::get_or_default(char const* key, T default_value) const
{
    std::optional<std::string> const value = lookup(key);
    if(!value) {
        return default_value;
    }
    return convert<T>(key, *value);
}

} // namespace mwareader

#endif // MWAREADER_HEADER_HPP
