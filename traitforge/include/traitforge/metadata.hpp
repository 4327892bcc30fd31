#ifndef TRAITFORGE_METADATA_HPP
#define TRAITFORGE_METADATA_HPP

#include <traitforge/types.hpp>
#include <cstddef>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace traitforge {

struct ArtifactDescriptor {
    std::size_t index = 0;            // 1-based
    std::string name;                 // "<collection> #<index>"
    std::string description;
    std::string image_name;
    ImageFormat format = ImageFormat::Png;
    const std::vector<std::pair<std::string, std::string>>* attributes = nullptr;
};

/**
 * Marketplace-specific JSON layout for one artifact. Documents are
 * pretty-printed with two-space indentation and keep their field order.
 */
class MetadataFormatter {
public:
    virtual ~MetadataFormatter() = default;
    virtual std::string format(const ArtifactDescriptor& artifact) const = 0;
    virtual MetadataFormat kind() const = 0;
};

// {name, description, image, attributes}
class Erc721Formatter : public MetadataFormatter {
public:
    std::string format(const ArtifactDescriptor& artifact) const override;
    MetadataFormat kind() const override { return MetadataFormat::Erc721; }
};

/**
 * Metaplex layout: adds symbol, seller fee, properties.files and an empty
 * creators list.
 */
class SolanaFormatter : public MetadataFormatter {
public:
    SolanaFormatter(std::string symbol, std::uint32_t seller_fee_basis_points)
        : symbol_(std::move(symbol)), seller_fee_basis_points_(seller_fee_basis_points) {}

    std::string format(const ArtifactDescriptor& artifact) const override;
    MetadataFormat kind() const override { return MetadataFormat::Solana; }

private:
    std::string symbol_;
    std::uint32_t seller_fee_basis_points_;
};

std::unique_ptr<MetadataFormatter> make_formatter(MetadataFormat format, const NamingOptions& naming);

// "<collection> #<index>"
std::string artifact_name(const std::string& collection, std::size_t index);
std::string image_file_name(std::size_t index, ImageFormat format);
std::string metadata_file_name(std::size_t index);

} // namespace traitforge

#endif // TRAITFORGE_METADATA_HPP
