#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

#include "ledge/core/MovementConfigLoader.hh"

namespace ledge {

class MovementConfigLoaderTest : public ::testing::Test {
  protected:
    std::filesystem::path writeTempFile(const std::string& content, const std::string& name = "movement.toml") {
        auto dir = std::filesystem::temp_directory_path() / "ledge_test";
        std::filesystem::create_directories(dir);
        auto path = dir / name;
        std::ofstream ofs(path);
        ofs << content;
        ofs.close();
        return path;
    }

    void TearDown() override {
        auto dir = std::filesystem::temp_directory_path() / "ledge_test";
        std::filesystem::remove_all(dir);
    }
};

// -- parseMovementConfig --

TEST_F(MovementConfigLoaderTest, ParseFullTable) {
    auto result = parseMovementConfig(R"(
        [movement]
        move_speed = 6.5
        jump_force = 12.0
        wall_jump_force = 9.0
        directed_wall_jump_force = 11.0
        wall_slide_speed = 1.5
        wall_check_distance = 0.7
        wall_jump_time = 0.3
        wall_layer = [1, 3]
    )");
    ASSERT_TRUE(result.isOk()) << result.message();
    const auto& cfg = result.value();

    EXPECT_FLOAT_EQ(cfg.moveSpeed, 6.5f);
    EXPECT_FLOAT_EQ(cfg.jumpForce, 12.0f);
    EXPECT_FLOAT_EQ(cfg.wallJumpForce, 9.0f);
    EXPECT_FLOAT_EQ(cfg.directedWallJumpForce, 11.0f);
    EXPECT_FLOAT_EQ(cfg.wallSlideSpeed, 1.5f);
    EXPECT_FLOAT_EQ(cfg.wallCheckDistance, 0.7f);
    EXPECT_FLOAT_EQ(cfg.wallJumpTime, 0.3f);
    EXPECT_EQ(cfg.wallLayer, layerBit(1) | layerBit(3));
}

TEST_F(MovementConfigLoaderTest, MissingKeysKeepDefaults) {
    auto result = parseMovementConfig("[movement]\nmove_speed = 4.0\n");
    ASSERT_TRUE(result.isOk());
    MovementConfig defaults;

    EXPECT_FLOAT_EQ(result.value().moveSpeed, 4.0f);
    EXPECT_FLOAT_EQ(result.value().jumpForce, defaults.jumpForce);
    EXPECT_FLOAT_EQ(result.value().wallJumpTime, defaults.wallJumpTime);
    EXPECT_EQ(result.value().wallLayer, defaults.wallLayer);
}

TEST_F(MovementConfigLoaderTest, MissingSectionUsesDefaults) {
    auto result = parseMovementConfig("[other]\nkey = 1\n");
    ASSERT_TRUE(result.isOk());
    EXPECT_FLOAT_EQ(result.value().moveSpeed, MovementConfig{}.moveSpeed);
}

TEST_F(MovementConfigLoaderTest, IntegerValuesAccepted) {
    auto result = parseMovementConfig("[movement]\njump_force = 15\n");
    ASSERT_TRUE(result.isOk());
    EXPECT_FLOAT_EQ(result.value().jumpForce, 15.0f);
}

TEST_F(MovementConfigLoaderTest, IntegerLayerMask) {
    auto result = parseMovementConfig("[movement]\nwall_layer = 6\n");
    ASSERT_TRUE(result.isOk());
    EXPECT_EQ(result.value().wallLayer, 6u);
}

TEST_F(MovementConfigLoaderTest, NonPositiveValueStillLoads) {
    auto result = parseMovementConfig("[movement]\nwall_slide_speed = -1.0\n");
    ASSERT_TRUE(result.isOk());
    EXPECT_FLOAT_EQ(result.value().wallSlideSpeed, -1.0f);
}

TEST_F(MovementConfigLoaderTest, WrongTypeIsInvalidState) {
    auto result = parseMovementConfig("[movement]\nmove_speed = \"fast\"\n");
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.code(), ErrorCode::InvalidState);
    EXPECT_NE(result.message().find("move_speed"), std::string::npos);
}

TEST_F(MovementConfigLoaderTest, MovementNotATable) {
    auto result = parseMovementConfig("movement = 3\n");
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.code(), ErrorCode::InvalidState);
}

TEST_F(MovementConfigLoaderTest, NegativeLayerMaskRejected) {
    auto result = parseMovementConfig("[movement]\nwall_layer = -1\n");
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.code(), ErrorCode::InvalidArgument);
}

TEST_F(MovementConfigLoaderTest, LayerIndexOutOfRangeRejected) {
    auto result = parseMovementConfig("[movement]\nwall_layer = [1, 32]\n");
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.code(), ErrorCode::InvalidArgument);
}

TEST_F(MovementConfigLoaderTest, LayerOfWrongTypeRejected) {
    auto result = parseMovementConfig("[movement]\nwall_layer = \"walls\"\n");
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.code(), ErrorCode::InvalidState);
}

TEST_F(MovementConfigLoaderTest, MalformedTomlReportsLocation) {
    auto result = parseMovementConfig("[movement\nmove_speed = 1", "inline.toml");
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.code(), ErrorCode::ParseError);
    EXPECT_EQ(result.message().rfind("inline.toml:", 0), 0u);
}

// -- loadMovementConfig --

TEST_F(MovementConfigLoaderTest, LoadFromFile) {
    auto path = writeTempFile("[movement]\nwall_jump_time = 0.5\n");
    auto result = loadMovementConfig(path);

    ASSERT_TRUE(result.isOk()) << result.message();
    EXPECT_FLOAT_EQ(result.value().wallJumpTime, 0.5f);
}

TEST_F(MovementConfigLoaderTest, LoadMissingFile) {
    auto result = loadMovementConfig("/nonexistent/path/movement.toml");
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.code(), ErrorCode::NotFound);
}

TEST_F(MovementConfigLoaderTest, LoadMalformedFile) {
    auto path = writeTempFile("[movement\n");
    auto result = loadMovementConfig(path);

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.code(), ErrorCode::ParseError);
    EXPECT_NE(result.message().find(path.string()), std::string::npos);
}

TEST_F(MovementConfigLoaderTest, BundledConfigLoads) {
    // Tests run from the source directory
    auto result = loadMovementConfig("config/movement.toml");
    ASSERT_TRUE(result.isOk()) << result.message();
    EXPECT_EQ(result.value().wallLayer, layerBit(1));
}

// -- movementConfigFromTable --

TEST_F(MovementConfigLoaderTest, FromParsedTable) {
    auto tbl = toml::parse("[movement]\nmove_speed = 3.0\n");
    auto result = movementConfigFromTable(tbl, "table");

    ASSERT_TRUE(result.isOk());
    EXPECT_FLOAT_EQ(result.value().moveSpeed, 3.0f);
}

} // namespace ledge
