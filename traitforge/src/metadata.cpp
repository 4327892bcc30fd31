#include <traitforge/metadata.hpp>
#include <traitforge/image_codec.hpp>
#include <nlohmann/json.hpp>

namespace traitforge {

using nlohmann::ordered_json;

std::string artifact_name(const std::string& collection, std::size_t index) {
    return collection + " #" + std::to_string(index);
}

std::string image_file_name(std::size_t index, ImageFormat format) {
    return std::to_string(index) + "." + format_extension(format);
}

std::string metadata_file_name(std::size_t index) {
    return std::to_string(index) + ".json";
}

namespace {

constexpr int JSON_INDENT = 2;

const char* mime_type(ImageFormat format) {
    return format == ImageFormat::Jpeg ? "image/jpeg" : "image/png";
}

ordered_json attributes_of(const ArtifactDescriptor& artifact) {
    ordered_json attributes = ordered_json::array();
    if (!artifact.attributes) return attributes;
    for (const auto& [layer, trait] : *artifact.attributes) {
        attributes.push_back({{"trait_type", layer}, {"value", trait}});
    }
    return attributes;
}

} // namespace

std::string Erc721Formatter::format(const ArtifactDescriptor& artifact) const {
    ordered_json doc;
    doc["name"] = artifact.name;
    doc["description"] = artifact.description;
    doc["image"] = artifact.image_name;
    doc["attributes"] = attributes_of(artifact);
    return doc.dump(JSON_INDENT);
}

std::string SolanaFormatter::format(const ArtifactDescriptor& artifact) const {
    ordered_json doc;
    doc["name"] = artifact.name;
    doc["symbol"] = symbol_;
    doc["description"] = artifact.description;
    doc["image"] = artifact.image_name;
    doc["seller_fee_basis_points"] = seller_fee_basis_points_;
    doc["attributes"] = attributes_of(artifact);

    ordered_json file;
    file["uri"] = artifact.image_name;
    file["type"] = mime_type(artifact.format);

    ordered_json properties;
    properties["files"] = ordered_json::array({file});
    properties["category"] = "image";
    properties["creators"] = ordered_json::array();
    doc["properties"] = std::move(properties);
    return doc.dump(JSON_INDENT);
}

std::unique_ptr<MetadataFormatter> make_formatter(MetadataFormat format, const NamingOptions& naming) {
    switch (format) {
        case MetadataFormat::Solana:
            return std::make_unique<SolanaFormatter>(naming.symbol, naming.seller_fee_basis_points);
        case MetadataFormat::Erc721:
            break;
    }
    return std::make_unique<Erc721Formatter>();
}

} // namespace traitforge
