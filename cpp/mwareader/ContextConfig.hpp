#ifndef MWAREADER_CONTEXTCONFIG_HPP
#define MWAREADER_CONTEXTCONFIG_HPP

#include "mwareader/MWAVersion.hpp"

#include <optional>
#include <string>
#include <vector>

namespace mwareader
{

/**
 * @brief      Class for wrapping the inputs used to build a context.
 */
class ContextConfig
{
  public:
    ContextConfig();
    ~ContextConfig();

    /**
     * @brief      Get the path to the metafits file
     */
    std::string const& metafits_file() const;

    /**
     * @brief      Set the path to the metafits file
     */
    void metafits_file(std::string const&);

    /**
     * @brief      Get the list of data files
     */
    std::vector<std::string> const& data_files() const;

    /**
     * @brief      Set the list of data files
     */
    void data_files(std::vector<std::string> const&);

    /**
     * @brief      Set the list of data files from a text file
     *
     * @details    File format is a newline separated list of
     *             absolute or relative filepaths. Lines beginning
     *             with # and blank lines are ignored.
     */
    void read_data_file_list(std::string const& filename);

    /**
     * @brief      Get the explicitly requested instrument version
     */
    std::optional<MWAVersion> const& version() const;

    /**
     * @brief      Set the instrument version
     *
     * @details    Without an explicit version the version is taken from
     *             the data files, or the metafits MODE when there are none.
     */
    void version(MWAVersion);

    /**
     * @brief      Check that each data file has the expected size
     */
    bool check_file_sizes() const;
    void check_file_sizes(bool);

    /**
     * @brief      Check MWAX voltage subfile headers against the metafits
     */
    bool validate_subfile_headers() const;
    void validate_subfile_headers(bool);

    /**
     * @brief      Return a string representation of the config
     */
    std::string to_string() const;

  private:
    std::string _metafits_file;
    std::vector<std::string> _data_files;
    std::optional<MWAVersion> _version;
    bool _check_file_sizes;
    bool _validate_subfile_headers;
};

} // namespace mwareader

#endif // MWAREADER_CONTEXTCONFIG_HPP
