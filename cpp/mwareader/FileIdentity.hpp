#ifndef MWAREADER_FILEIDENTITY_HPP
#define MWAREADER_FILEIDENTITY_HPP

#include "mwareader/MWAVersion.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace mwareader
{

enum class FileKind { Correlator, Voltage };

std::string to_string(FileKind kind);

/**
 * @brief      What a data file's name says about its contents
 *
 * @details    For correlator files channel_identifier is the number
 *             after "ch" (MWAX, a receiver channel) or "gpubox"
 *             (legacy, a correlator channel plus one) and gps_time is
 *             unused. For voltage files channel_identifier is the
 *             receiver channel, gps_time is the GPS second the file
 *             starts at and batch_number is unused.
 */
struct FileIdentity {
    std::string path;
    FileKind kind       = FileKind::Correlator;
    MWAVersion version  = MWAVersion::CorrMWAXv2;
    std::uint32_t obs_id = 0;
    std::size_t channel_identifier = 0;
    std::size_t batch_number       = 0;
    std::uint64_t gps_time         = 0;
};

/**
 * @brief      Parse the identity encoded in a data file name
 *
 * @param      path  Path to a data file. Only the file name is examined
 *                   and the file is not accessed.
 *
 * @return     The identity, or nothing when the name follows none of
 *             the known conventions.
 */
std::optional<FileIdentity> parse_filename(std::string const& path);

/**
 * @brief      Parse every path, failing on the first unrecognised name
 *
 * @details    Throws CatalogError::UnrecognisedFilename.
 */
std::vector<FileIdentity> identify_files(std::vector<std::string> const& paths);

/**
 * @brief      The single file kind shared by all files
 *
 * @details    Throws CatalogError::MixedFileKinds when correlator and
 *             voltage files are mixed. Must not be called with an
 *             empty list.
 */
FileKind common_file_kind(std::vector<FileIdentity> const& files);

/**
 * @brief      The single instrument version shared by all files
 *
 * @details    Throws ContextError::VersionConflict when the files come
 *             from different instrument generations.
 */
MWAVersion common_version(std::vector<FileIdentity> const& files);

/**
 * @brief      Work out which instrument version a set of files holds
 *
 * @param      files      Identities of the supplied files
 * @param      kind       The file kind the caller can read
 * @param      requested  An explicitly requested version, if any
 *
 * @details    Throws ContextError::NoCompatibleFiles when there are no
 *             files of the wanted kind, and CatalogError::VersionMismatch
 *             when the files disagree with the requested version.
 */
MWAVersion resolve_file_version(std::vector<FileIdentity> const& files,
                                FileKind kind,
                                std::optional<MWAVersion> const& requested);

} // namespace mwareader

#endif // MWAREADER_FILEIDENTITY_HPP
