#include "mwareader/Errors.hpp"

namespace mwareader
{

Error::Error(std::string const& message): std::runtime_error(message)
{
}

MetadataError::MetadataError(Kind kind, std::string const& message)
    : Error(to_string(kind) + ": " + message), _kind(kind)
{
}

MetadataError::Kind MetadataError::kind() const
{
    return _kind;
}

CatalogError::CatalogError(Kind kind, std::string const& message)
    : Error(to_string(kind) + ": " + message), _kind(kind), _expected_size(0),
      _actual_size(0)
{
}

CatalogError::CatalogError(std::string const& message,
                           std::size_t expected,
                           std::size_t actual)
    : Error(to_string(Kind::UnexpectedFileSize) + ": " + message +
            " (expected " + std::to_string(expected) + ", found " +
            std::to_string(actual) + ")"),
      _kind(Kind::UnexpectedFileSize), _expected_size(expected),
      _actual_size(actual)
{
}

CatalogError::Kind CatalogError::kind() const
{
    return _kind;
}

std::size_t CatalogError::expected_size() const
{
    return _expected_size;
}

std::size_t CatalogError::actual_size() const
{
    return _actual_size;
}

ContextError::ContextError(Kind kind, std::string const& message)
    : Error(to_string(kind) + ": " + message), _kind(kind)
{
}

ContextError::Kind ContextError::kind() const
{
    return _kind;
}

DataError::DataError(Kind kind, std::string const& message)
    : Error(to_string(kind) + ": " + message), _kind(kind)
{
}

DataError::Kind DataError::kind() const
{
    return _kind;
}

std::string to_string(MetadataError::Kind kind)
{
    switch(kind) {
    case MetadataError::Kind::Malformed:
        return "Malformed metadata";
    case MetadataError::Kind::InconsistentCounts:
        return "Inconsistent metadata counts";
    case MetadataError::Kind::UnknownVersion:
        return "Unknown instrument version";
    }
    return "Unknown metadata error";
}

std::string to_string(CatalogError::Kind kind)
{
    switch(kind) {
    case CatalogError::Kind::MixedFileKinds:
        return "Mixed file kinds";
    case CatalogError::Kind::VersionMismatch:
        return "Instrument version mismatch";
    case CatalogError::Kind::UnexpectedFileSize:
        return "Unexpected file size";
    case CatalogError::Kind::DuplicateFile:
        return "Duplicate file";
    case CatalogError::Kind::UnrecognisedFilename:
        return "Unrecognised filename";
    case CatalogError::Kind::ObsidMismatch:
        return "Observation id mismatch";
    case CatalogError::Kind::MissingFiles:
        return "Missing files";
    case CatalogError::Kind::BadFileContent:
        return "Bad file content";
    case CatalogError::Kind::FileAccess:
        return "File access";
    }
    return "Unknown catalog error";
}

std::string to_string(ContextError::Kind kind)
{
    switch(kind) {
    case ContextError::Kind::NoCompatibleFiles:
        return "No compatible files";
    case ContextError::Kind::VersionConflict:
        return "Version conflict";
    case ContextError::Kind::UnsupportedLayout:
        return "Unsupported layout";
    }
    return "Unknown context error";
}

std::string to_string(DataError::Kind kind)
{
    switch(kind) {
    case DataError::Kind::NoDataForTimestepCoarseChannel:
        return "No data for timestep and coarse channel";
    case DataError::Kind::InvalidTimestepIndex:
        return "Invalid timestep index";
    case DataError::Kind::InvalidCoarseChannelIndex:
        return "Invalid coarse channel index";
    case DataError::Kind::InvalidGpsSecond:
        return "Invalid GPS second";
    case DataError::Kind::ShortRead:
        return "Short read";
    case DataError::Kind::SizeMismatch:
        return "Size mismatch";
    case DataError::Kind::FileAccess:
        return "File access";
    }
    return "Unknown data error";
}

} // namespace mwareader
