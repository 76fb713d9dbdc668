#include "mwareader/MultiFileReader.hpp"

#include "mwareader/Errors.hpp"

#include <boost/log/trivial.hpp>

#include <algorithm>
#include <cerrno>
#include <cstring>

namespace mwareader
{

MultiFileReader::MultiFileReader(std::vector<std::string> const& files,
                                 std::size_t data_offset,
                                 std::size_t data_size)
    : _files(files), _data_offset(data_offset), _data_size(data_size),
      _current_file_idx(files.size()), _current_position(0)
{
    if(_data_size == 0) {
        throw DataError(DataError::Kind::SizeMismatch,
                        "Files must contribute a non-zero number of bytes");
    }
}

MultiFileReader::~MultiFileReader()
{
    if(_current_stream.is_open()) {
        _current_stream.close();
    }
}

void MultiFileReader::open(std::size_t file_idx)
{
    if(_current_stream.is_open()) {
        _current_stream.close();
    }
    _current_stream.clear();
    _current_stream.open(_files[file_idx], std::ifstream::binary);
    if(!_current_stream.is_open()) {
        throw DataError(DataError::Kind::FileAccess,
                        "Unable to open " + _files[file_idx] + " (" +
                            std::strerror(errno) + ")");
    }
    _current_file_idx = file_idx;
}

void MultiFileReader::seekg(std::size_t pos)
{
    if(pos > total_size()) {
        throw DataError(DataError::Kind::ShortRead,
                        "Seek to byte " + std::to_string(pos) +
                            " is past the end of " +
                            std::to_string(total_size()) + " bytes of data");
    }
    _current_position = pos;
}

std::size_t MultiFileReader::tellg() const
{
    return _current_position;
}

std::size_t MultiFileReader::total_size() const
{
    return _files.size() * _data_size;
}

bool MultiFileReader::can_read(std::size_t bytes) const
{
    return total_size() - _current_position >= bytes;
}

void MultiFileReader::read(char* buffer, std::size_t bytes)
{
    if(!can_read(bytes)) {
        throw DataError(DataError::Kind::ShortRead,
                        "Requested " + std::to_string(bytes) +
                            " bytes at position " +
                            std::to_string(_current_position) + " but only " +
                            std::to_string(total_size() - _current_position) +
                            " remain");
    }
    std::size_t total_read = 0;
    while(bytes > 0) {
        std::size_t const file_idx = _current_position / _data_size;
        std::size_t const file_pos = _current_position % _data_size;
        if(file_idx != _current_file_idx) {
            open(file_idx);
        }
        std::size_t const count = std::min(bytes, _data_size - file_pos);
        _current_stream.seekg(
            static_cast<std::streamoff>(_data_offset + file_pos),
            std::ios::beg);
        _current_stream.read(buffer + total_read,
                             static_cast<std::streamsize>(count));
        std::size_t const bytes_read =
            static_cast<std::size_t>(_current_stream.gcount());
        if(bytes_read != count) {
            BOOST_LOG_TRIVIAL(warning)
                << "Short read from " << _files[file_idx] << ": got "
                << bytes_read << " of " << count << " bytes";
            throw DataError(DataError::Kind::ShortRead,
                            "Read " + std::to_string(bytes_read) + " of " +
                                std::to_string(count) + " bytes from " +
                                _files[file_idx] + " at offset " +
                                std::to_string(_data_offset + file_pos));
        }
        total_read += bytes_read;
        bytes -= bytes_read;
        _current_position += bytes_read;
    }
}

} // namespace mwareader
