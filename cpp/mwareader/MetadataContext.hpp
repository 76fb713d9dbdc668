#ifndef MWAREADER_METADATACONTEXT_HPP
#define MWAREADER_METADATACONTEXT_HPP

#include "mwareader/ContextConfig.hpp"
#include "mwareader/MWAVersion.hpp"
#include "mwareader/Metadata.hpp"

#include <memory>
#include <optional>
#include <string>

namespace mwareader
{

/**
 * @brief      Observation metadata without any data files
 */
class MetadataContext
{
  public:
    /**
     * @brief      Build a context from a config
     *
     * @details    The version is taken from the config, then from the
     *             names of any data files listed, then from the metafits
     *             MODE key.
     */
    explicit MetadataContext(ContextConfig const& config);

    /**
     * @brief      Build a context from a metafits file
     */
    explicit MetadataContext(std::string const& metafits_file,
                             std::optional<MWAVersion> version = std::nullopt);

    ~MetadataContext();

    Metadata const& metadata() const;
    std::shared_ptr<Metadata const> shared_metadata() const;
    MWAVersion version() const;
    std::string to_string() const;

  private:
    std::shared_ptr<Metadata const> _metadata;
};

} // namespace mwareader

#endif // MWAREADER_METADATACONTEXT_HPP
