#include "bipolar_array.hpp"

#include <doctest.h>

TEST_CASE("BipolarArray") {
    SUBCASE("negative_and_positive_indices") {
        auto a = effdiff::BipolarArray<unsigned int>(-1, 1);
        a[0] = 1;
        a[-1] = 2;
        a[1] = 3;

        REQUIRE(a[-1] == 2);
        REQUIRE(a[0] == 1);
        REQUIRE(a[1] == 3);
    }

    SUBCASE("copy_is_deep") {
        auto a = effdiff::BipolarArray<int64_t>(-5, 5);
        for (int i = -5; i <= 5; i++) {
            a[i] = i;
        }
        auto b = a;
        a[0] = 100;
        for (int i = -5; i <= 5; i++) {
            CHECK(b[i] == i);
        }
        CHECK(b.min() == -5);
        CHECK(b.max() == 5);
    }
}
