#ifndef MWAREADER_ERRORS_HPP
#define MWAREADER_ERRORS_HPP

#include <cstddef>
#include <stdexcept>
#include <string>

namespace mwareader
{

/**
 * @brief      Base class of all errors raised by mwareader
 */
class Error: public std::runtime_error
{
  public:
    explicit Error(std::string const& message);
};

/**
 * @brief      The metafits file is missing information or describes
 *             an observation that is not self-consistent.
 */
class MetadataError: public Error
{
  public:
    enum class Kind {
        Malformed,
        InconsistentCounts,
        UnknownVersion
    };

    MetadataError(Kind kind, std::string const& message);
    Kind kind() const;

  private:
    Kind _kind;
};

/**
 * @brief      The supplied data files cannot be indexed against the
 *             observation metadata.
 */
class CatalogError: public Error
{
  public:
    enum class Kind {
        MixedFileKinds,
        VersionMismatch,
        UnexpectedFileSize,
        DuplicateFile,
        UnrecognisedFilename,
        ObsidMismatch,
        MissingFiles,
        BadFileContent,
        FileAccess
    };

    CatalogError(Kind kind, std::string const& message);

    /**
     * @brief      Construct an UnexpectedFileSize error
     *
     * @param      message   Description including the offending file
     * @param      expected  The size predicted from the geometry
     * @param      actual    The size found on disk (or in the HDU)
     */
    CatalogError(std::string const& message,
                 std::size_t expected,
                 std::size_t actual);

    Kind kind() const;
    std::size_t expected_size() const;
    std::size_t actual_size() const;

  private:
    Kind _kind;
    std::size_t _expected_size;
    std::size_t _actual_size;
};

/**
 * @brief      A context could not be assembled from otherwise valid parts
 */
class ContextError: public Error
{
  public:
    enum class Kind {
        NoCompatibleFiles,
        VersionConflict,
        UnsupportedLayout
    };

    ContextError(Kind kind, std::string const& message);
    Kind kind() const;

  private:
    Kind _kind;
};

/**
 * @brief      A read request could not be satisfied
 *
 * @details    Failures are local to the read call. The context that
 *             raised the error remains valid.
 */
class DataError: public Error
{
  public:
    enum class Kind {
        NoDataForTimestepCoarseChannel,
        InvalidTimestepIndex,
        InvalidCoarseChannelIndex,
        InvalidGpsSecond,
        ShortRead,
        SizeMismatch,
        FileAccess
    };

    DataError(Kind kind, std::string const& message);
    Kind kind() const;

  private:
    Kind _kind;
};

std::string to_string(MetadataError::Kind kind);
std::string to_string(CatalogError::Kind kind);
std::string to_string(ContextError::Kind kind);
std::string to_string(DataError::Kind kind);

} // namespace mwareader

#endif // MWAREADER_ERRORS_HPP
