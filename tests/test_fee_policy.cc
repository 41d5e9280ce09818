#include <gtest/gtest.h>

#include "parkpool/errors.hpp"
#include "parkpool/fee_policy.hpp"

using namespace parkpool;

TEST(FeePolicyTest, DefaultRates) {
    FeeSchedule fs;
    EXPECT_EQ(quote(fs, Category::Bike, 4), 20u);
    EXPECT_EQ(quote(fs, Category::Car, 4), 40u);
    EXPECT_EQ(quote(fs, Category::Truck, 4), 80u);
}

TEST(FeePolicyTest, ZeroDurationIsFree) {
    FeeSchedule fs;
    EXPECT_EQ(quote(fs, Category::Bike, 0), 0u);
    EXPECT_EQ(quote(fs, Category::Car, 0), 0u);
    EXPECT_EQ(quote(fs, Category::Truck, 0), 0u);
}

// Bike < Car < Truck for every positive duration
TEST(FeePolicyTest, OrderedAndLinear) {
    FeeSchedule fs;
    for (unsigned long long d = 1; d <= 48; ++d) {
        EXPECT_LT(quote(fs, Category::Bike, d), quote(fs, Category::Car, d));
        EXPECT_LT(quote(fs, Category::Car, d), quote(fs, Category::Truck, d));
        EXPECT_EQ(quote(fs, Category::Car, d), d * quote(fs, Category::Car, 1));
    }
}

TEST(FeePolicyTest, UnknownCategoryIsNeverPricedAtZero) {
    FeeSchedule fs;
    EXPECT_THROW(quote(fs, static_cast<Category>(9), 3), InvalidCategory);
    EXPECT_THROW(quote(fs, static_cast<Category>(9), 0), InvalidCategory);
}

TEST(FeePolicyTest, CustomSchedule) {
    FeeSchedule fs{2, 7, 30};
    EXPECT_NO_THROW(validate(fs));
    EXPECT_EQ(quote(fs, Category::Car, 3), 21u);
}

TEST(FeePolicyTest, ScheduleMustBeStrictlyIncreasing) {
    EXPECT_THROW(validate(FeeSchedule{10, 10, 20}), ConfigError);
    EXPECT_THROW(validate(FeeSchedule{5, 30, 20}), ConfigError);
    EXPECT_THROW(validate(FeeSchedule{50, 10, 20}), ConfigError);
}

// A fee that does not fit must fail, not wrap to a small number
TEST(FeePolicyTest, OverflowIsAnError) {
    FeeSchedule fs;
    EXPECT_THROW(quote(fs, Category::Truck, 1ULL << 62), FeeOverflow);
    EXPECT_THROW(quote(fs, Category::Bike, ~0ULL), FeeOverflow);

    const unsigned long long maxTruck = ~0ULL / fs.truck;
    EXPECT_EQ(quote(fs, Category::Truck, maxTruck), maxTruck * fs.truck);
    EXPECT_THROW(quote(fs, Category::Truck, maxTruck + 1), FeeOverflow);
}

TEST(FeePolicyTest, ZeroRateNeverOverflows) {
    FeeSchedule fs{0, 1, 2};
    EXPECT_EQ(quote(fs, Category::Bike, ~0ULL), 0u);
}
