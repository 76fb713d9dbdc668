#include "mwareader/GpuboxCatalog.hpp"

#include "mwareader/Errors.hpp"
#include "mwareader/FitsFile.hpp"
#include "mwareader/Metadata.hpp"
#include "mwareader/mwareader_constants.hpp"

#include <boost/log/trivial.hpp>

#include <algorithm>
#include <memory>
#include <set>

namespace mwareader
{
namespace
{

std::size_t element_count(std::vector<long> const& naxes)
{
    if(naxes.empty()) {
        return 0;
    }
    std::size_t count = 1;
    for(long naxis: naxes) {
        count *= static_cast<std::size_t>(naxis);
    }
    return count;
}

void check_primary_hdu(FitsFile& fits,
                       FileIdentity const& file,
                       Metadata const& metadata)
{
    fits.move_to_hdu(0);
    auto const obs_id = fits.read_optional_key<long>("OBSID");
    if(obs_id && static_cast<std::uint32_t>(*obs_id) != metadata.obs_id) {
        throw CatalogError(CatalogError::Kind::ObsidMismatch,
                           file.path + " has OBSID " +
                               std::to_string(*obs_id) +
                               " but the metafits is for " +
                               std::to_string(metadata.obs_id));
    }
    auto const corr_ver = fits.read_optional_key<long>("CORR_VER");
    if(file.version == MWAVersion::CorrMWAXv2) {
        if(!corr_ver || *corr_ver != MWAX_CORR_VER) {
            throw CatalogError(CatalogError::Kind::VersionMismatch,
                               file.path +
                                   " is named as an MWAX file but does not "
                                   "have CORR_VER = 2");
        }
    } else if(corr_ver) {
        throw CatalogError(CatalogError::Kind::VersionMismatch,
                           file.path +
                               " is named as a legacy file but has CORR_VER "
                               "= " + std::to_string(*corr_ver));
    }
}

void index_gpubox_file(FileIdentity const& file,
                       Metadata const& metadata,
                       CorrelatorGeometry const& geometry,
                       GpuboxTimeMap& time_map)
{
    std::unique_ptr<FitsFile> fits;
    try {
        fits = std::make_unique<FitsFile>(file.path);
    } catch(FitsError const& error) {
        throw CatalogError(CatalogError::Kind::FileAccess, error.what());
    }

    std::size_t num_data_hdus = 0;
    try {
        check_primary_hdu(*fits, file, metadata);
        int const num_hdus = fits->num_hdus();
        for(int hdu = geometry.first_data_hdu; hdu < num_hdus;
            hdu += geometry.hdu_step) {
            fits->move_to_hdu(hdu);
            long const time     = fits->read_key<long>("TIME");
            long const millitim =
                fits->read_optional_key<long>("MILLITIM").value_or(0);
            std::uint64_t const unix_time_ms =
                static_cast<std::uint64_t>(time) * 1000 +
                static_cast<std::uint64_t>(millitim);

            std::vector<long> const naxes = fits->image_dimensions();
            if(naxes.size() != 2 || naxes[0] != geometry.expected_naxis1 ||
               naxes[1] != geometry.expected_naxis2) {
                throw CatalogError(file.path + " HDU " + std::to_string(hdu) +
                                       " does not have the expected axes",
                                   geometry.num_timestep_coarse_chan_floats,
                                   element_count(naxes));
            }
            if(geometry.has_weights_hdus) {
                if(hdu + 1 >= num_hdus) {
                    throw CatalogError(CatalogError::Kind::BadFileContent,
                                       file.path + " HDU " +
                                           std::to_string(hdu) +
                                           " has no weights HDU");
                }
                fits->move_to_hdu(hdu + 1);
                std::size_t const weights =
                    element_count(fits->image_dimensions());
                if(weights !=
                   geometry.num_timestep_coarse_chan_weight_floats) {
                    throw CatalogError(file.path + " weights HDU " +
                                           std::to_string(hdu + 1) +
                                           " has an unexpected size",
                                       geometry
                                           .num_timestep_coarse_chan_weight_floats,
                                       weights);
                }
            }

            auto& channel_map = time_map[unix_time_ms];
            auto const inserted = channel_map.emplace(
                file.channel_identifier, HduLocation{file.path, hdu});
            if(!inserted.second) {
                throw CatalogError(
                    CatalogError::Kind::DuplicateFile,
                    "Timestep " + std::to_string(unix_time_ms) +
                        " of channel " +
                        std::to_string(file.channel_identifier) +
                        " is in both " + inserted.first->second.path +
                        " and " + file.path);
            }
            ++num_data_hdus;
        }
    } catch(FitsError const& error) {
        throw CatalogError(CatalogError::Kind::BadFileContent, error.what());
    }
    if(num_data_hdus == 0) {
        throw CatalogError(CatalogError::Kind::BadFileContent,
                           file.path + " contains no data HDUs");
    }
    BOOST_LOG_TRIVIAL(debug) << "Indexed " << num_data_hdus
                             << " data HDUs in " << file.path;
}

} // namespace

std::vector<GpuboxBatch>
group_gpubox_batches(std::vector<FileIdentity> const& files)
{
    std::map<std::size_t, GpuboxBatch> grouped;
    for(auto const& file: files) {
        auto& batch        = grouped[file.batch_number];
        batch.batch_number = file.batch_number;
        for(auto const& other: batch.files) {
            if(other.channel_identifier == file.channel_identifier) {
                throw CatalogError(CatalogError::Kind::DuplicateFile,
                                   other.path + " and " + file.path +
                                       " are the same batch and channel");
            }
        }
        batch.files.push_back(file);
    }

    std::vector<GpuboxBatch> batches;
    std::size_t expected_batch = 0;
    for(auto& entry: grouped) {
        GpuboxBatch& batch = entry.second;
        if(batch.batch_number != expected_batch) {
            throw CatalogError(CatalogError::Kind::MissingFiles,
                               "Batch " + std::to_string(expected_batch) +
                                   " of the correlator files is missing");
        }
        if(!batches.empty() &&
           batch.files.size() != batches.front().files.size()) {
            throw CatalogError(
                CatalogError::Kind::MissingFiles,
                "Batch " + std::to_string(batch.batch_number) + " has " +
                    std::to_string(batch.files.size()) +
                    " files but batch 0 has " +
                    std::to_string(batches.front().files.size()));
        }
        std::sort(batch.files.begin(),
                  batch.files.end(),
                  [](FileIdentity const& a, FileIdentity const& b) {
                      return a.channel_identifier < b.channel_identifier;
                  });
        batches.push_back(std::move(batch));
        ++expected_batch;
    }
    return batches;
}

GpuboxCatalog build_gpubox_catalog(std::vector<FileIdentity> const& files,
                                   Metadata const& metadata,
                                   CorrelatorGeometry const& geometry)
{
    GpuboxCatalog catalog;
    catalog.version = files.front().version;
    catalog.batches = group_gpubox_batches(files);

    std::set<std::size_t> known_channels;
    for(auto const& chan: metadata.coarse_chans) {
        known_channels.insert(chan.gpubox_number);
    }
    for(auto const& batch: catalog.batches) {
        for(auto const& file: batch.files) {
            if(file.obs_id != metadata.obs_id) {
                throw CatalogError(CatalogError::Kind::ObsidMismatch,
                                   file.path + " is not part of observation " +
                                       std::to_string(metadata.obs_id));
            }
            if(known_channels.count(file.channel_identifier) == 0) {
                throw CatalogError(CatalogError::Kind::BadFileContent,
                                   file.path + " is for channel " +
                                       std::to_string(file.channel_identifier) +
                                       " which the metafits does not list");
            }
            index_gpubox_file(file, metadata, geometry, catalog.time_map);
        }
    }
    BOOST_LOG_TRIVIAL(debug) << "Correlator catalog: " << catalog.batches.size()
                             << " batches, " << catalog.time_map.size()
                             << " timesteps";
    return catalog;
}

} // namespace mwareader
