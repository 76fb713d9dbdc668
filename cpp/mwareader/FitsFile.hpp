#ifndef MWAREADER_FITSFILE_HPP
#define MWAREADER_FITSFILE_HPP

#include <fitsio.h>

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace mwareader
{

/**
 * @brief      A cfitsio call returned a non-zero status
 */
class FitsError: public std::runtime_error
{
  public:
    FitsError(std::string const& what, int status);
    int status() const;

  private:
    int _status;
};

/**
 * @brief      Whether the linked cfitsio was built thread safe
 *             (--enable-reentrant)
 */
bool cfitsio_is_reentrant();

/**
 * @brief      A read-only handle on a FITS file
 *
 * @details    The file is opened on construction and closed on
 *             destruction. Each instance wraps its own cfitsio handle
 *             so independent instances may be used from different
 *             threads. A single instance must not be shared.
 *
 *             If cfitsio is not reentrant every cfitsio call made
 *             through this class holds one process wide lock.
 *
 *             HDU indices are zero based (the primary HDU is 0) and
 *             table rows are zero based.
 */
class FitsFile
{
  public:
    /**
     * @brief      Open a FITS file for reading
     *
     * @param      path  Path to the file
     */
    explicit FitsFile(std::string const& path);
    ~FitsFile();
    FitsFile(FitsFile const&) = delete;
    FitsFile& operator=(FitsFile const&) = delete;

    std::string const& path() const;

    /**
     * @brief      The total number of HDUs in the file
     */
    int num_hdus();

    /**
     * @brief      Make the given HDU current
     */
    void move_to_hdu(int index);

    /**
     * @brief      Make the HDU with the given EXTNAME current
     *
     * @return     false if no HDU carries that name
     */
    bool move_to_named_hdu(std::string const& name);

    /**
     * @brief      Read a key from the current HDU
     *
     * @details    Throws FitsError if the key is absent or cannot be
     *             converted to T.
     */
    template <typename T>
    T read_key(char const* key);

    /**
     * @brief      Read a key from the current HDU if it is present
     */
    template <typename T>
    std::optional<T> read_optional_key(char const* key);

    /**
     * @brief      Read a string key that may be continued over several
     *             cards with the CONTINUE convention
     */
    std::string read_long_string_key(char const* key);

    /**
     * @brief      The NAXISn values of the current image HDU
     */
    std::vector<long> image_dimensions();

    /**
     * @brief      Read the whole current image HDU as 32 bit floats
     */
    std::vector<float> read_image_floats();

    /**
     * @brief      The number of rows in the current table HDU
     */
    long num_rows();

    bool has_column(char const* name);

    /**
     * @brief      Read a scalar cell from the current table HDU
     */
    template <typename T>
    T read_cell(char const* column, long row);

    /**
     * @brief      Read a vector cell from the current table HDU
     */
    template <typename T>
    std::vector<T> read_cell_array(char const* column, long row, long count);

  private:
    void check(int status, std::string const& action) const;
    bool read_key_value(char const* key, int datatype, void* value);
    int column_number(char const* name);

  private:
    std::string _path;
    fitsfile* _fptr;
};

template <>
int FitsFile::read_key<int>(char const* key);
template <>
long FitsFile::read_key<long>(char const* key);
template <>
double FitsFile::read_key<double>(char const* key);
template <>
std::string FitsFile::read_key<std::string>(char const* key);
template <>
std::optional<int> FitsFile::read_optional_key<int>(char const* key);
template <>
std::optional<long> FitsFile::read_optional_key<long>(char const* key);
template <>
std::optional<double> FitsFile::read_optional_key<double>(char const* key);
template <>
std::optional<std::string>
FitsFile::read_optional_key<std::string>(char const* key);
template <>
std::optional<bool> FitsFile::read_optional_key<bool>(char const* key);
template <>
int FitsFile::read_cell<int>(char const* column, long row);
template <>
double FitsFile::read_cell<double>(char const* column, long row);
template <>
std::string FitsFile::read_cell<std::string>(char const* column, long row);
template <>
std::vector<int>
FitsFile::read_cell_array<int>(char const* column, long row, long count);
template <>
std::vector<double>
FitsFile::read_cell_array<double>(char const* column, long row, long count);

} // namespace mwareader

#endif // MWAREADER_FITSFILE_HPP
