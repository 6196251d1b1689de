#include <gtest/gtest.h>
#include <bicycle/bicycle_spec.hpp>
#include <common/errors.hpp>
#include <cmath>
#include <limits>

using namespace bikefit;

TEST(BicycleSpecTest, ExampleIsLargeRoadFrame) {
    BicycleSpec spec = BicycleSpec::example();
    EXPECT_EQ(spec.name, "Example");
    EXPECT_EQ(spec.frame_size, "Large");
    EXPECT_DOUBLE_EQ(spec.bb_drop, 75.0);
    EXPECT_DOUBLE_EQ(spec.chainstay_length, 450.0);
    EXPECT_DOUBLE_EQ(spec.wheelbase, 1072.6);
    EXPECT_DOUBLE_EQ(spec.wheel_diameter, 700.0);
    EXPECT_DOUBLE_EQ(spec.wheel_radius(), 350.0);
    EXPECT_FALSE(spec.has_stem());
}

TEST(BicycleSpecTest, StemNeedsBothFields) {
    BicycleSpec spec = BicycleSpec::example();
    spec.stem_length = 100.0;
    EXPECT_FALSE(spec.has_stem());
    spec.stem_angle = -6.0;
    EXPECT_TRUE(spec.has_stem());
}

TEST(BicycleSpecTest, ExampleValidates) {
    EXPECT_NO_THROW(validate(BicycleSpec::example()));
    EXPECT_NO_THROW(validate(RiderSpec::example()));
}

TEST(BicycleSpecTest, RejectsNonFiniteFields) {
    BicycleSpec spec = BicycleSpec::example();
    spec.head_tube_angle = std::numeric_limits<double>::quiet_NaN();
    EXPECT_THROW(validate(spec), DomainError);

    spec = BicycleSpec::example();
    spec.wheelbase = std::numeric_limits<double>::infinity();
    EXPECT_THROW(validate(spec), DomainError);

    spec = BicycleSpec::example();
    spec.stem_angle = std::numeric_limits<double>::quiet_NaN();
    EXPECT_THROW(validate(spec), DomainError);
}

TEST(BicycleSpecTest, RejectsNegativeLengths) {
    BicycleSpec spec = BicycleSpec::example();
    spec.seat_tube_length = -1.0;
    EXPECT_THROW(validate(spec), DomainError);
}

TEST(BicycleSpecTest, AllowsSignedOffsets) {
    // A bottom bracket above the hub line and a negative rake are both real geometry
    BicycleSpec spec = BicycleSpec::example();
    spec.bb_drop = -10.0;
    spec.fork_offset = -5.0;
    EXPECT_NO_THROW(validate(spec));
}

TEST(BicycleSpecTest, ErrorNamesTheField) {
    BicycleSpec spec = BicycleSpec::example();
    spec.fork_length = -405.0;
    try {
        validate(spec);
        FAIL() << "expected DomainError";
    } catch (const DomainError& e) {
        EXPECT_NE(std::string(e.what()).find("bicycle.fork_length"), std::string::npos);
    }
}

TEST(RiderSpecTest, RejectsInvalidFields) {
    RiderSpec rider = RiderSpec::example();
    rider.saddle_height = -1.0;
    EXPECT_THROW(validate(rider), DomainError);

    rider = RiderSpec::example();
    rider.saddle_set_back = std::numeric_limits<double>::infinity();
    EXPECT_THROW(validate(rider), DomainError);

    rider = RiderSpec::example();
    rider.saddle_set_back = -20.0;
    EXPECT_NO_THROW(validate(rider));
}
