#include <gtest/gtest.h>
#include <serialization/bicycle_json.hpp>
#include <serialization/frame_layout_json.hpp>
#include <frame/layout_builder.hpp>
#include "test_helpers.hpp"

using namespace bikefit;
using namespace bikefit::test;

// ============================================
// BicycleSpec / RiderSpec parsing
// ============================================

TEST(BicycleJsonTest, ParsesExampleSchema) {
    BicycleSpec spec = example_bike_json()["bicycle"].get<BicycleSpec>();
    EXPECT_EQ(spec, BicycleSpec::example());
}

TEST(BicycleJsonTest, OptionalFields) {
    nlohmann::json j = example_bike_json()["bicycle"];
    j["wheel_diameter"] = 622;
    j["stem_angle"] = -6;
    j["stem_length"] = 110;

    BicycleSpec spec = j.get<BicycleSpec>();
    EXPECT_DOUBLE_EQ(spec.wheel_diameter, 622.0);
    ASSERT_TRUE(spec.has_stem());
    EXPECT_DOUBLE_EQ(*spec.stem_angle, -6.0);
    EXPECT_DOUBLE_EQ(*spec.stem_length, 110.0);
}

TEST(BicycleJsonTest, MissingFieldIsNamed) {
    nlohmann::json j = example_bike_json()["bicycle"];
    j.erase("head_tube_angle");
    try {
        j.get<BicycleSpec>();
        FAIL() << "expected DomainError";
    } catch (const DomainError& e) {
        EXPECT_STREQ(e.what(), "missing field: bicycle.head_tube_angle");
    }
}

TEST(BicycleJsonTest, NonNumericFieldIsDomainError) {
    nlohmann::json j = example_bike_json()["bicycle"];
    j["wheelbase"] = "long";
    EXPECT_THROW(j.get<BicycleSpec>(), DomainError);

    j = example_bike_json()["bicycle"];
    j["stem_length"] = nullptr;
    EXPECT_THROW(j.get<BicycleSpec>(), DomainError);
}

TEST(BicycleJsonTest, RoundTripsThroughSchema) {
    BicycleSpec spec = spec_with_stem();
    spec.name = "Gravel";
    nlohmann::json j = spec;
    EXPECT_EQ(j["size"], "Large");
    EXPECT_EQ(j.get<BicycleSpec>(), spec);
}

TEST(RiderJsonTest, ParsesAllFields) {
    nlohmann::json j = {{"saddle_height", 720}, {"saddle_length", 250}, {"saddle_set_back", 55}};
    RiderSpec rider = j.get<RiderSpec>();
    EXPECT_DOUBLE_EQ(rider.saddle_height, 720.0);
    EXPECT_DOUBLE_EQ(rider.saddle_length, 250.0);
    EXPECT_DOUBLE_EQ(rider.saddle_set_back, 55.0);
}

TEST(RiderJsonTest, MissingFieldIsDomainError) {
    nlohmann::json j = {{"saddle_height", 720}, {"saddle_length", 250}};
    EXPECT_THROW(j.get<RiderSpec>(), DomainError);
}

// ============================================
// Layout export
// ============================================

TEST(FrameLayoutJsonTest, SegmentsAsParallelArrays) {
    FrameLayout layout = compute_layout(BicycleSpec::example());
    nlohmann::json j = frame_layout_to_json(layout);

    const auto& head_tube = j["segments"]["head_tube"];
    ASSERT_EQ(head_tube["x"].size(), 2u);
    EXPECT_DOUBLE_EQ(head_tube["x"][0].get<double>(), layout.head_tube.start.x);
    EXPECT_DOUBLE_EQ(head_tube["x"][1].get<double>(), layout.head_tube.end.x);
    EXPECT_DOUBLE_EQ(head_tube["y"][1].get<double>(), layout.head_tube.end.y);

    EXPECT_DOUBLE_EQ(j["rear_wheel"]["hub"][0].get<double>(), layout.rear_hub().x);
    EXPECT_DOUBLE_EQ(j["front_wheel"]["diameter"].get<double>(), 700.0);
    EXPECT_DOUBLE_EQ(j["top_tube_length"].get<double>(), layout.top_tube_length);
    EXPECT_EQ(j["name"], "Example");
}

TEST(FrameLayoutJsonTest, OptionalSegmentsOnlyWhenPresent) {
    nlohmann::json bare = frame_layout_to_json(compute_layout(BicycleSpec::example()));
    EXPECT_FALSE(bare["segments"].contains("stem"));
    EXPECT_FALSE(bare["segments"].contains("saddle"));

    nlohmann::json full = frame_layout_to_json(
        compute_layout(spec_with_stem(), RiderSpec::example()));
    EXPECT_TRUE(full["segments"].contains("stem"));
    EXPECT_TRUE(full["segments"].contains("saddle"));
}
