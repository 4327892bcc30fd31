#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <traitforge/metadata.hpp>

using namespace traitforge;
using nlohmann::json;
using nlohmann::ordered_json;

class MetadataTest : public ::testing::Test {
protected:
    void SetUp() override {
        attributes = {{"Background", "Red"}, {"Shape", "Circle"}};
        artifact.index = 3;
        artifact.name = artifact_name("Shapes", 3);
        artifact.description = "Geometric collection";
        artifact.image_name = image_file_name(3, ImageFormat::Jpeg);
        artifact.format = ImageFormat::Jpeg;
        artifact.attributes = &attributes;
    }

    static std::vector<std::string> keys(const ordered_json& doc) {
        std::vector<std::string> out;
        for (auto it = doc.begin(); it != doc.end(); ++it) out.push_back(it.key());
        return out;
    }

    std::vector<std::pair<std::string, std::string>> attributes;
    ArtifactDescriptor artifact;
};

TEST_F(MetadataTest, FileNames) {
    EXPECT_EQ(artifact.name, "Shapes #3");
    EXPECT_EQ(artifact.image_name, "3.jpg");
    EXPECT_EQ(image_file_name(12, ImageFormat::Png), "12.png");
    EXPECT_EQ(metadata_file_name(12), "12.json");
}

TEST_F(MetadataTest, Erc721Layout) {
    Erc721Formatter formatter;
    auto doc = ordered_json::parse(formatter.format(artifact));

    EXPECT_EQ(keys(doc), (std::vector<std::string>{"name", "description", "image", "attributes"}));
    EXPECT_EQ(doc["name"], "Shapes #3");
    EXPECT_EQ(doc["description"], "Geometric collection");
    EXPECT_EQ(doc["image"], "3.jpg");

    ASSERT_EQ(doc["attributes"].size(), 2u);
    EXPECT_EQ(doc["attributes"][0]["trait_type"], "Background");
    EXPECT_EQ(doc["attributes"][0]["value"], "Red");
    EXPECT_EQ(doc["attributes"][1]["trait_type"], "Shape");
    EXPECT_EQ(doc["attributes"][1]["value"], "Circle");
    EXPECT_FALSE(doc.contains("symbol"));
}

TEST_F(MetadataTest, SolanaLayout) {
    NamingOptions naming;
    naming.symbol = "SHP";
    naming.seller_fee_basis_points = 500;
    auto formatter = make_formatter(MetadataFormat::Solana, naming);
    ASSERT_EQ(formatter->kind(), MetadataFormat::Solana);
    std::string text = formatter->format(artifact);
    auto doc = ordered_json::parse(text);

    EXPECT_EQ(keys(doc), (std::vector<std::string>{"name", "symbol", "description", "image",
                                                   "seller_fee_basis_points", "attributes", "properties"}));
    EXPECT_EQ(doc["symbol"], "SHP");
    EXPECT_EQ(doc["seller_fee_basis_points"], 500);
    ASSERT_EQ(doc["properties"]["files"].size(), 1u);
    EXPECT_EQ(doc["properties"]["files"][0]["uri"], "3.jpg");
    EXPECT_EQ(doc["properties"]["files"][0]["type"], "image/jpeg");
    EXPECT_EQ(doc["properties"]["category"], "image");
    EXPECT_TRUE(doc["properties"]["creators"].is_array());
    EXPECT_TRUE(doc["properties"]["creators"].empty());

    // Two-space pretty printing
    EXPECT_NE(text.find("\n  \"symbol\": \"SHP\""), std::string::npos);
}

TEST_F(MetadataTest, EmptyAttributes) {
    attributes.clear();
    auto doc = json::parse(Erc721Formatter().format(artifact));
    EXPECT_TRUE(doc["attributes"].is_array());
    EXPECT_TRUE(doc["attributes"].empty());

    artifact.attributes = nullptr;
    EXPECT_TRUE(json::parse(Erc721Formatter().format(artifact))["attributes"].empty());

    EXPECT_EQ(make_formatter(MetadataFormat::Erc721, {})->kind(), MetadataFormat::Erc721);
}

// Names with quotes, backslashes and control characters survive a parse
TEST_F(MetadataTest, SpecialCharactersSurvive) {
    attributes = {{"Layer \"A\"", "back\\slash\n"}, {"Tab\there", std::string(1, '\x01')}};
    artifact.name = "Say \"hi\"";

    auto doc = json::parse(Erc721Formatter().format(artifact));
    EXPECT_EQ(doc["name"], "Say \"hi\"");
    EXPECT_EQ(doc["attributes"][0]["trait_type"], "Layer \"A\"");
    EXPECT_EQ(doc["attributes"][0]["value"], "back\\slash\n");
    EXPECT_EQ(doc["attributes"][1]["trait_type"], "Tab\there");
    EXPECT_EQ(doc["attributes"][1]["value"], std::string(1, '\x01'));
}
