// =============================================================================
// NeuroField - Grid Tests
// =============================================================================

#include <cmath>
#include <limits>
#include <catch2/catch.hpp>
#include "field/Grid.h"
#include "field/Errors.h"
#include "core/Types.h"

using namespace NeuroField;

TEST_CASE("Grid construction and spacing", "[field][grid]") {
    SECTION("Cubic grid") {
        Grid grid({ 16, 16, 16 }, { 10.0, 10.0, 10.0 });
        REQUIRE(grid.getPointCount() == 4096);
        REQUIRE(grid.getSpacing()[0] == Catch::Detail::Approx(10.0 / 15.0));
        REQUIRE(grid.getCoordinate(0, 0) == 0.0);
        REQUIRE(grid.getCoordinate(0, 15) == 10.0);
        REQUIRE(grid.getMidpoint(1) == Catch::Detail::Approx(5.0));
        REQUIRE(grid.getCellVolume() == Catch::Detail::Approx(std::pow(10.0 / 15.0, 3)));
    }

    SECTION("Anisotropic grid") {
        Grid grid({ 6, 5, 4 }, { 5.0, 2.0, 9.0 });
        REQUIRE(grid.getResolutionX() == 6);
        REQUIRE(grid.getResolutionY() == 5);
        REQUIRE(grid.getResolutionZ() == 4);
        REQUIRE(grid.getSpacing()[0] == Catch::Detail::Approx(1.0));
        REQUIRE(grid.getSpacing()[1] == Catch::Detail::Approx(0.5));
        REQUIRE(grid.getSpacing()[2] == Catch::Detail::Approx(3.0));
        REQUIRE(grid.getCoordinates(2).size() == 4);
    }

    SECTION("Single-node axis") {
        Grid grid({ 8, 8, 1 }, { 7.0, 7.0, 3.0 });
        REQUIRE(grid.getPointCount() == 64);
        REQUIRE(grid.getSpacing()[2] == 3.0);
        REQUIRE(grid.getCoordinate(2, 0) == 0.0);
        REQUIRE(grid.getMidpoint(2) == 0.0);
    }
}

TEST_CASE("Grid rejects invalid shapes", "[field][grid]") {
    REQUIRE_THROWS_AS(Grid({ 0, 4, 4 }, { 1.0, 1.0, 1.0 }), InvalidDimensionError);
    REQUIRE_THROWS_AS(Grid({ 4, 4, 0 }, { 1.0, 1.0, 1.0 }), InvalidDimensionError);
    REQUIRE_THROWS_AS(Grid({ 4, 4, 4 }, { 0.0, 1.0, 1.0 }), InvalidExtentError);
    REQUIRE_THROWS_AS(Grid({ 4, 4, 4 }, { 1.0, -2.0, 1.0 }), InvalidExtentError);
    REQUIRE_THROWS_AS(Grid({ 4, 4, 4 }, { 1.0, 1.0, std::numeric_limits<f64>::quiet_NaN() }),
                      InvalidExtentError);
    REQUIRE_THROWS_AS(Grid({ 4, 4, 4 }, { std::numeric_limits<f64>::infinity(), 1.0, 1.0 }),
                      InvalidExtentError);
}

TEST_CASE("Grid rejects oversized point counts", "[field][grid]") {
    REQUIRE_THROWS_AS(Grid({ 2000, 2000, 2000 }, { 1.0, 1.0, 1.0 }), InvalidDimensionError);
    REQUIRE_THROWS_AS(Grid({ 129, 128, 128 }, { 1.0, 1.0, 1.0 }), InvalidDimensionError);
    REQUIRE_THROWS_AS(Grid({ 4294967295u, 4294967295u, 4294967295u }, { 1.0, 1.0, 1.0 }),
                      InvalidDimensionError);

    Grid largest({ 128, 128, 128 }, { 1.0, 1.0, 1.0 });
    REQUIRE(largest.getPointCount() == Grid::MAX_POINTS);
}

TEST_CASE("Grid indexing", "[field][grid]") {
    Grid grid({ 6, 5, 4 }, { 5.0, 4.0, 3.0 });

    SECTION("x varies fastest") {
        REQUIRE(grid.getIndex(0, 0, 0) == 0);
        REQUIRE(grid.getIndex(1, 0, 0) == 1);
        REQUIRE(grid.getIndex(0, 1, 0) == 6);
        REQUIRE(grid.getIndex(0, 0, 1) == 30);
        REQUIRE(grid.getIndex(5, 4, 3) == grid.getPointCount() - 1);
    }

    SECTION("getIJK inverts getIndex") {
        u32 i, j, k;
        grid.getIJK(grid.getIndex(3, 2, 1), i, j, k);
        REQUIRE(i == 3);
        REQUIRE(j == 2);
        REQUIRE(k == 1);
    }

    SECTION("Bounds") {
        REQUIRE(grid.isInBounds(5, 4, 3));
        REQUIRE_FALSE(grid.isInBounds(6, 0, 0));
        REQUIRE_FALSE(grid.isInBounds(0, -1, 0));
    }
}

TEST_CASE("Grid positions", "[field][grid]") {
    Grid grid({ 11, 11, 11 }, { 10.0, 10.0, 10.0 });

    SECTION("Nearest node rounds and clamps") {
        Index3 node = grid.nearestNode({ 2.4, 7.6, 20.0 });
        REQUIRE(node[0] == 2);
        REQUIRE(node[1] == 8);
        REQUIRE(node[2] == 10);

        Index3 center = grid.nearestNode(grid.getCenter());
        REQUIRE(center[0] == 5);
        REQUIRE(center[1] == 5);
        REQUIRE(center[2] == 5);
    }

    SECTION("Point containment") {
        REQUIRE(grid.containsPoint({ 0.0, 5.0, 10.0 }));
        REQUIRE_FALSE(grid.containsPoint({ -0.1, 5.0, 5.0 }));
        REQUIRE_FALSE(grid.containsPoint({ 5.0, 10.5, 5.0 }));
    }
}

TEST_CASE("Grid shape comparison", "[field][grid]") {
    Grid a({ 8, 8, 8 }, { 1.0, 2.0, 3.0 });
    Grid b({ 8, 8, 8 }, { 1.0, 2.0, 3.0 });
    Grid c({ 8, 8, 9 }, { 1.0, 2.0, 3.0 });
    Grid d({ 8, 8, 8 }, { 1.0, 2.0, 3.5 });

    REQUIRE(a.sameShape(b));
    REQUIRE(a == b);
    REQUIRE(a != c);
    REQUIRE(a != d);
    REQUIRE_FALSE(a.describe().empty());
}
