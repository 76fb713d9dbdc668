#include "mwareader/MetadataContext.hpp"

#include "mwareader/FileIdentity.hpp"

#include <boost/log/trivial.hpp>

namespace mwareader
{
namespace
{

std::optional<MWAVersion> version_for(ContextConfig const& config)
{
    if(config.version() || config.data_files().empty()) {
        return config.version();
    }
    auto const files = identify_files(config.data_files());
    common_file_kind(files);
    return common_version(files);
}

} // namespace

MetadataContext::MetadataContext(ContextConfig const& config)
    : MetadataContext(config.metafits_file(), version_for(config))
{
}

MetadataContext::MetadataContext(std::string const& metafits_file,
                                 std::optional<MWAVersion> version)
    : _metadata(std::make_shared<Metadata>(
          load_metadata(metafits_file, version)))
{
    BOOST_LOG_TRIVIAL(info)
        << "Loaded metadata for observation " << _metadata->obs_id << " ("
        << mwareader::to_string(this->version()) << "): "
        << _metadata->num_ants << " antennas, "
        << _metadata->num_coarse_chans << " coarse channels, "
        << _metadata->num_timesteps << " timesteps";
}

MetadataContext::~MetadataContext()
{
}

Metadata const& MetadataContext::metadata() const
{
    return *_metadata;
}

std::shared_ptr<Metadata const> MetadataContext::shared_metadata() const
{
    return _metadata;
}

MWAVersion MetadataContext::version() const
{
    return *_metadata->mwa_version;
}

std::string MetadataContext::to_string() const
{
    return "MetadataContext:\n" + _metadata->to_string();
}

} // namespace mwareader
