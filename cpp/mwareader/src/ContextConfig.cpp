#include "mwareader/ContextConfig.hpp"

#include <boost/algorithm/string.hpp>
#include <boost/log/trivial.hpp>

#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace mwareader
{

ContextConfig::ContextConfig()
    : _metafits_file(""), _data_files({}), _version(std::nullopt),
      _check_file_sizes(true), _validate_subfile_headers(true)
{
}

ContextConfig::~ContextConfig()
{
}

std::string const& ContextConfig::metafits_file() const
{
    return _metafits_file;
}

void ContextConfig::metafits_file(std::string const& fpath)
{
    _metafits_file = fpath;
}

std::vector<std::string> const& ContextConfig::data_files() const
{
    return _data_files;
}

void ContextConfig::data_files(std::vector<std::string> const& files)
{
    _data_files = files;
}

void ContextConfig::read_data_file_list(std::string const& filename)
{
    BOOST_LOG_TRIVIAL(debug) << "Reading data file list from " << filename;
    std::ifstream ifs(filename.c_str());
    if(!ifs.is_open()) {
        BOOST_LOG_TRIVIAL(error) << "Unable to open data file list: "
                                 << filename << " (" << std::strerror(errno)
                                 << ")";
        throw std::runtime_error("Unable to open data file list " + filename +
                                 ": " + std::strerror(errno));
    }
    _data_files.resize(0);
    std::string line;
    while(std::getline(ifs, line)) {
        boost::algorithm::trim(line);
        if(line.empty() || line[0] == '#') {
            continue;
        }
        BOOST_LOG_TRIVIAL(debug) << line;
        _data_files.push_back(line);
    }
}

std::optional<MWAVersion> const& ContextConfig::version() const
{
    return _version;
}

void ContextConfig::version(MWAVersion version)
{
    _version = version;
}

bool ContextConfig::check_file_sizes() const
{
    return _check_file_sizes;
}

void ContextConfig::check_file_sizes(bool check)
{
    _check_file_sizes = check;
}

bool ContextConfig::validate_subfile_headers() const
{
    return _validate_subfile_headers;
}

void ContextConfig::validate_subfile_headers(bool validate)
{
    _validate_subfile_headers = validate;
}

std::string ContextConfig::to_string() const
{
    std::ostringstream oss;
    oss << "ContextConfig:\n"
        << "  Metafits file: " << _metafits_file << "\n"
        << "  Data files: " << _data_files.size() << "\n"
        << "  Version: "
        << (_version ? mwareader::to_string(*_version) : "auto") << "\n"
        << "  Check file sizes: " << std::boolalpha << _check_file_sizes
        << "\n"
        << "  Validate subfile headers: " << _validate_subfile_headers
        << "\n";
    return oss.str();
}

} // namespace mwareader
