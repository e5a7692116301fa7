#include <gtest/gtest.h>
#include <serialization/json_serialization.hpp>
#include <serialization/config_json.hpp>
#include <serialization/cloth_json.hpp>
#include <cloth/cloth.hpp>
#include <stdexcept>

using namespace drape;

TEST(ConfigJsonTest, EmptyObjectYieldsDefaults) {
    nlohmann::json j = nlohmann::json::object();

    ClothConfig config = j.get<ClothConfig>();
    ClothConfig defaults;
    EXPECT_DOUBLE_EQ(config.fixed_step, defaults.fixed_step);
    EXPECT_FLOAT_EQ(config.damping, defaults.damping);
    EXPECT_EQ(config.constraint_iterations, 30);
    EXPECT_EQ(config.gravity, defaults.gravity);
    EXPECT_EQ(config.wind, defaults.wind);
    EXPECT_EQ(config.pins.top_left, 3);
    EXPECT_EQ(config.pins.top_right, 3);

    ClothGeometry geometry = j.get<ClothGeometry>();
    EXPECT_FLOAT_EQ(geometry.width, 10.0f);
    EXPECT_FLOAT_EQ(geometry.height, 14.0f);
    EXPECT_EQ(geometry.cols, 22);
    EXPECT_EQ(geometry.rows, 26);
}

TEST(ConfigJsonTest, PartialOverride) {
    nlohmann::json j = {
        {"damping", 0.05},
        {"wind", {0.0, 0.0, 3.0}},
        {"enable_gravity", false},
        {"pins", {{"top_left", 1}}}
    };

    ClothConfig config = j.get<ClothConfig>();
    EXPECT_FLOAT_EQ(config.damping, 0.05f);
    EXPECT_EQ(config.wind, Vec3(0.0f, 0.0f, 3.0f));
    EXPECT_FALSE(config.enable_gravity);
    EXPECT_TRUE(config.enable_wind);
    EXPECT_EQ(config.pins.top_left, 1);
    EXPECT_EQ(config.pins.top_right, 3);
}

TEST(ConfigJsonTest, WritesAllFields) {
    ClothConfig config;
    config.constraint_iterations = 12;
    nlohmann::json j = config;

    EXPECT_EQ(j["constraint_iterations"], 12);
    ASSERT_TRUE(j["gravity"].is_array());
    EXPECT_FLOAT_EQ(j["gravity"][1].get<float>(), -2.8f);
    EXPECT_TRUE(j.contains("max_ticks_per_update"));
    EXPECT_EQ(j["pins"]["top_right"], 3);
}

TEST(ConfigJsonTest, MalformedVectorThrows) {
    nlohmann::json j = {{"gravity", {0.0, -1.0}}};
    EXPECT_THROW(j.get<ClothConfig>(), nlohmann::json::exception);
}

TEST(ClothJsonTest, StateSnapshot) {
    ClothConfig config;
    config.pins = PinPattern{1, 0};
    Cloth cloth = Cloth::create(1.0f, 1.0f, 3, 2, config);

    nlohmann::json state = cloth_to_json(cloth);
    EXPECT_EQ(state["cols"], 3);
    EXPECT_EQ(state["rows"], 2);
    ASSERT_EQ(state["particles"].size(), 6u);
    EXPECT_FALSE(state["particles"][0]["movable"].get<bool>());
    EXPECT_TRUE(state["particles"][1]["movable"].get<bool>());
    EXPECT_FALSE(state.contains("constraints"));

    nlohmann::json full = cloth_to_json(cloth, true);
    ASSERT_EQ(full["constraints"].size(), cloth.constraints().size());
    EXPECT_EQ(full["constraints"][0]["family"], "structural");
}

TEST(ClothJsonTest, MeshRoundTrip) {
    Cloth cloth = Cloth::create(1.0f, 1.0f, 3, 3);
    MeshBuffers mesh = mesh_from_json(mesh_to_json(cloth.mesh()));
    EXPECT_EQ(mesh.triangles, cloth.triangles());
    EXPECT_EQ(mesh.tex_coords, cloth.tex_coords());
}

TEST(ClothJsonTest, InconsistentMeshIsRejected) {
    nlohmann::json j = {
        {"triangles", {{0, 0, 0}, {1, 0, 0}, {0, 1, 0}}},
        {"normals", {{0, 0, 1}, {0, 0, 1}}},
        {"tex_coords", {{0, 0}, {1, 0}, {0, 1}}}
    };
    EXPECT_THROW(mesh_from_json(j), std::runtime_error);

    j["normals"].push_back({0, 0, 1});
    EXPECT_NO_THROW(mesh_from_json(j));
}

TEST(DocumentTest, RoundTripThroughJson) {
    json::Document doc;
    doc.kind = json::FileKind::ClothConfig;
    doc.data = {{"geometry", ClothGeometry{}}};

    nlohmann::json j = doc;
    EXPECT_EQ(j["kind"], "cloth_config");
    EXPECT_EQ(j["format"], json::FORMAT_VERSION);
    EXPECT_FALSE(j.contains("stats"));

    json::Document parsed = j.get<json::Document>();
    EXPECT_EQ(parsed.kind, json::FileKind::ClothConfig);
    EXPECT_EQ(parsed.data["geometry"]["cols"], 22);
}

TEST(DocumentTest, RejectsForeignFiles) {
    nlohmann::json no_data = {{"format", 1}, {"kind", "cloth_state"}};
    EXPECT_THROW(no_data.get<json::Document>(), std::runtime_error);

    nlohmann::json bad_kind = {{"format", 1}, {"kind", "stitch_graph"}, {"data", nullptr}};
    EXPECT_THROW(bad_kind.get<json::Document>(), std::runtime_error);

    nlohmann::json future = {{"format", 99}, {"kind", "cloth_state"}, {"data", nullptr}};
    EXPECT_THROW(future.get<json::Document>(), std::runtime_error);
}

TEST(DocumentTest, FileKindNames) {
    EXPECT_STREQ(json::to_string(json::FileKind::ClothState), "cloth_state");
    EXPECT_EQ(json::file_kind_from_string("cloth_config"), json::FileKind::ClothConfig);
    EXPECT_THROW(json::file_kind_from_string("mesh"), std::runtime_error);
}
