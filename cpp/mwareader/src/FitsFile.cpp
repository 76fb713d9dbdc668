#include "mwareader/FitsFile.hpp"

#include <boost/log/trivial.hpp>

#include <mutex>

namespace mwareader
{
namespace
{

std::string status_text(int status)
{
    char text[FLEN_STATUS];
    fits_get_errstatus(status, text);
    return std::string(text);
}

std::recursive_mutex& cfitsio_mutex()
{
    static std::recursive_mutex mutex;
    return mutex;
}

std::unique_lock<std::recursive_mutex> lock_cfitsio()
{
    if(cfitsio_is_reentrant()) {
        return std::unique_lock<std::recursive_mutex>();
    }
    return std::unique_lock<std::recursive_mutex>(cfitsio_mutex());
}

} // namespace

bool cfitsio_is_reentrant()
{
    static bool const reentrant = fits_is_reentrant() != 0;
    return reentrant;
}

FitsError::FitsError(std::string const& what, int status)
    : std::runtime_error(what + " (cfitsio status " + std::to_string(status) +
                         ": " + status_text(status) + ")"),
      _status(status)
{
}

int FitsError::status() const
{
    return _status;
}

FitsFile::FitsFile(std::string const& path): _path(path), _fptr(nullptr)
{
    auto const lock = lock_cfitsio();
    int status = 0;
    fits_open_file(&_fptr, path.c_str(), READONLY, &status);
    check(status, "Unable to open FITS file");
    BOOST_LOG_TRIVIAL(debug) << "Opened FITS file " << _path;
}

FitsFile::~FitsFile()
{
    auto const lock = lock_cfitsio();
    if(_fptr != nullptr) {
        int status = 0;
        fits_close_file(_fptr, &status);
        if(status) {
            BOOST_LOG_TRIVIAL(warning)
                << "Error closing FITS file " << _path << ": "
                << status_text(status);
        }
    }
}

std::string const& FitsFile::path() const
{
    return _path;
}

void FitsFile::check(int status, std::string const& action) const
{
    if(status) {
        fits_clear_errmsg();
        throw FitsError(action + " [" + _path + "]", status);
    }
}

int FitsFile::num_hdus()
{
    auto const lock = lock_cfitsio();
    int status = 0;
    int count  = 0;
    fits_get_num_hdus(_fptr, &count, &status);
    check(status, "Unable to count HDUs");
    return count;
}

void FitsFile::move_to_hdu(int index)
{
    auto const lock = lock_cfitsio();
    int status   = 0;
    int hdu_type = 0;
    fits_movabs_hdu(_fptr, index + 1, &hdu_type, &status);
    check(status, "Unable to move to HDU " + std::to_string(index));
}

bool FitsFile::move_to_named_hdu(std::string const& name)
{
    auto const lock = lock_cfitsio();
    int status = 0;
    fits_movnam_hdu(_fptr,
                    ANY_HDU,
                    const_cast<char*>(name.c_str()),
                    0,
                    &status);
    if(status == BAD_HDU_NUM) {
        fits_clear_errmsg();
        return false;
    }
    check(status, "Unable to move to HDU " + name);
    return true;
}

bool FitsFile::read_key_value(char const* key, int datatype, void* value)
{
    auto const lock = lock_cfitsio();
    int status = 0;
    fits_read_key(_fptr, datatype, key, value, nullptr, &status);
    if(status == KEY_NO_EXIST) {
        fits_clear_errmsg();
        return false;
    }
    check(status, std::string("Unable to read key ") + key);
    return true;
}

template <>
int FitsFile::read_key<int>(char const* key)
{
    int value = 0;
    if(!read_key_value(key, TINT, &value)) {
        throw FitsError(std::string("Missing key ") + key + " [" + _path + "]",
                        KEY_NO_EXIST);
    }
    return value;
}

template <>
long FitsFile::read_key<long>(char const* key)
{
    long value = 0;
    if(!read_key_value(key, TLONG, &value)) {
        throw FitsError(std::string("Missing key ") + key + " [" + _path + "]",
                        KEY_NO_EXIST);
    }
    return value;
}

template <>
double FitsFile::read_key<double>(char const* key)
{
    double value = 0.0;
    if(!read_key_value(key, TDOUBLE, &value)) {
        throw FitsError(std::string("Missing key ") + key + " [" + _path + "]",
                        KEY_NO_EXIST);
    }
    return value;
}

template <>
std::string FitsFile::read_key<std::string>(char const* key)
{
    char value[FLEN_VALUE];
    if(!read_key_value(key, TSTRING, value)) {
        throw FitsError(std::string("Missing key ") + key + " [" + _path + "]",
                        KEY_NO_EXIST);
    }
    return std::string(value);
}

template <>
std::optional<int> FitsFile::read_optional_key<int>(char const* key)
{
    int value = 0;
    if(!read_key_value(key, TINT, &value)) {
        return std::nullopt;
    }
    return value;
}

template <>
std::optional<long> FitsFile::read_optional_key<long>(char const* key)
{
    long value = 0;
    if(!read_key_value(key, TLONG, &value)) {
        return std::nullopt;
    }
    return value;
}

template <>
std::optional<double> FitsFile::read_optional_key<double>(char const* key)
{
    double value = 0.0;
    if(!read_key_value(key, TDOUBLE, &value)) {
        return std::nullopt;
    }
    return value;
}

template <>
std::optional<std::string>
FitsFile::read_optional_key<std::string>(char const* key)
{
    char value[FLEN_VALUE];
    if(!read_key_value(key, TSTRING, value)) {
        return std::nullopt;
    }
    return std::string(value);
}

template <>
std::optional<bool> FitsFile::read_optional_key<bool>(char const* key)
{
    int value = 0;
    if(!read_key_value(key, TLOGICAL, &value)) {
        return std::nullopt;
    }
    return value != 0;
}

std::string FitsFile::read_long_string_key(char const* key)
{
    auto const lock = lock_cfitsio();
    int status    = 0;
    char* longstr = nullptr;
    fits_read_key_longstr(_fptr, key, &longstr, nullptr, &status);
    check(status, std::string("Unable to read long string key ") + key);
    std::string value(longstr);
    fits_free_memory(longstr, &status);
    return value;
}

std::vector<long> FitsFile::image_dimensions()
{
    auto const lock = lock_cfitsio();
    int status = 0;
    int naxis  = 0;
    fits_get_img_dim(_fptr, &naxis, &status);
    check(status, "Unable to read image dimensionality");
    std::vector<long> naxes(naxis, 0);
    if(naxis > 0) {
        fits_get_img_size(_fptr, naxis, naxes.data(), &status);
        check(status, "Unable to read image size");
    }
    return naxes;
}

std::vector<float> FitsFile::read_image_floats()
{
    auto const lock = lock_cfitsio();
    std::vector<long> naxes = image_dimensions();
    std::size_t nelements   = naxes.empty() ? 0 : 1;
    for(long naxis: naxes) {
        nelements *= static_cast<std::size_t>(naxis);
    }
    std::vector<float> values(nelements);
    if(nelements == 0) {
        return values;
    }
    int status   = 0;
    int anynul   = 0;
    float nulval = 0.0f;
    fits_read_img(_fptr,
                  TFLOAT,
                  1,
                  static_cast<LONGLONG>(nelements),
                  &nulval,
                  values.data(),
                  &anynul,
                  &status);
    check(status, "Unable to read image data");
    return values;
}

long FitsFile::num_rows()
{
    auto const lock = lock_cfitsio();
    int status = 0;
    long nrows = 0;
    fits_get_num_rows(_fptr, &nrows, &status);
    check(status, "Unable to read number of table rows");
    return nrows;
}

int FitsFile::column_number(char const* name)
{
    auto const lock = lock_cfitsio();
    int status = 0;
    int colnum = 0;
    fits_get_colnum(_fptr, CASEINSEN, const_cast<char*>(name), &colnum, &status);
    check(status, std::string("Unable to find column ") + name);
    return colnum;
}

bool FitsFile::has_column(char const* name)
{
    auto const lock = lock_cfitsio();
    int status = 0;
    int colnum = 0;
    fits_get_colnum(_fptr, CASEINSEN, const_cast<char*>(name), &colnum, &status);
    if(status == COL_NOT_FOUND || status == COL_NOT_UNIQUE) {
        fits_clear_errmsg();
        return false;
    }
    check(status, std::string("Unable to search for column ") + name);
    return true;
}

template <>
int FitsFile::read_cell<int>(char const* column, long row)
{
    auto const lock = lock_cfitsio();
    int status = 0;
    int anynul = 0;
    int nulval = 0;
    int value  = 0;
    fits_read_col(_fptr, TINT, column_number(column), row + 1, 1, 1, &nulval,
                  &value, &anynul, &status);
    check(status, std::string("Unable to read column ") + column);
    return value;
}

template <>
double FitsFile::read_cell<double>(char const* column, long row)
{
    auto const lock = lock_cfitsio();
    int status    = 0;
    int anynul    = 0;
    double nulval = 0.0;
    double value  = 0.0;
    fits_read_col(_fptr, TDOUBLE, column_number(column), row + 1, 1, 1,
                  &nulval, &value, &anynul, &status);
    check(status, std::string("Unable to read column ") + column);
    return value;
}

template <>
std::string FitsFile::read_cell<std::string>(char const* column, long row)
{
    auto const lock = lock_cfitsio();
    int const colnum = column_number(column);
    int status       = 0;
    int typecode     = 0;
    long repeat      = 0;
    long width       = 0;
    fits_get_coltype(_fptr, colnum, &typecode, &repeat, &width, &status);
    check(status, std::string("Unable to read type of column ") + column);

    std::vector<char> buffer(static_cast<std::size_t>(repeat) + 1, '\0');
    char* values[1] = {buffer.data()};
    char nulval[]   = "";
    int anynul      = 0;
    fits_read_col(_fptr, TSTRING, colnum, row + 1, 1, 1, nulval, values,
                  &anynul, &status);
    check(status, std::string("Unable to read column ") + column);
    return std::string(buffer.data());
}

template <>
std::vector<int>
FitsFile::read_cell_array<int>(char const* column, long row, long count)
{
    auto const lock = lock_cfitsio();
    int status = 0;
    int anynul = 0;
    int nulval = 0;
    std::vector<int> values(static_cast<std::size_t>(count), 0);
    fits_read_col(_fptr, TINT, column_number(column), row + 1, 1, count,
                  &nulval, values.data(), &anynul, &status);
    check(status, std::string("Unable to read column ") + column);
    return values;
}

template <>
std::vector<double>
FitsFile::read_cell_array<double>(char const* column, long row, long count)
{
    auto const lock = lock_cfitsio();
    int status    = 0;
    int anynul    = 0;
    double nulval = 0.0;
    std::vector<double> values(static_cast<std::size_t>(count), 0.0);
    fits_read_col(_fptr, TDOUBLE, column_number(column), row + 1, 1, count,
                  &nulval, values.data(), &anynul, &status);
    check(status, std::string("Unable to read column ") + column);
    return values;
}

} // namespace mwareader
