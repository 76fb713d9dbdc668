#ifndef MWAREADER_MULTIFILEREADER_HPP
#define MWAREADER_MULTIFILEREADER_HPP

#include <cstddef>
#include <fstream>
#include <string>
#include <vector>

namespace mwareader
{

/**
 * @brief      Presents the data sections of a sequence of files as one
 *             contiguous byte stream
 *
 * @details    Every file contributes data_size bytes starting data_offset
 *             bytes into the file. Readers are meant to live for the
 *             duration of a single read call.
 */
class MultiFileReader
{
  public:
    MultiFileReader(std::vector<std::string> const& files,
                    std::size_t data_offset,
                    std::size_t data_size);
    ~MultiFileReader();
    MultiFileReader(MultiFileReader const&)            = delete;
    MultiFileReader& operator=(MultiFileReader const&) = delete;

    /**
     * @brief      Move to a position in the logical stream
     */
    void seekg(std::size_t pos);

    /**
     * @brief      Current position in the logical stream
     */
    std::size_t tellg() const;

    /**
     * @brief      Total bytes available across all files
     */
    std::size_t total_size() const;

    /**
     * @brief      Whether the requested number of bytes remain
     */
    bool can_read(std::size_t bytes) const;

    /**
     * @brief      Read exactly bytes bytes into buffer, crossing file
     *             boundaries as needed
     *
     * @details    Throws DataError (ShortRead or FileAccess).
     */
    void read(char* buffer, std::size_t bytes);

  private:
    void open(std::size_t file_idx);

    std::vector<std::string> _files;
    std::size_t _data_offset;
    std::size_t _data_size;
    std::ifstream _current_stream;
    std::size_t _current_file_idx;
    std::size_t _current_position;
};

} // namespace mwareader

#endif // MWAREADER_MULTIFILEREADER_HPP
