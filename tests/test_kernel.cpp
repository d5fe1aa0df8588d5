// =============================================================================
// NeuroField - Kernel Tests
// =============================================================================

#include <cmath>
#include <limits>
#include <catch2/catch.hpp>
#include "field/Kernel.h"
#include "field/Grid.h"
#include "field/Errors.h"
#include "core/Types.h"

using namespace NeuroField;

TEST_CASE("Kernel stencil covers the domain", "[field][kernel]") {
    Grid grid({ 8, 6, 4 }, { 7.0, 5.0, 3.0 });
    KernelParameters params;

    Kernel kernel = KernelBuilder::build(grid, params);

    REQUIRE(kernel.getRadius()[0] == 7);
    REQUIRE(kernel.getRadius()[1] == 5);
    REQUIRE(kernel.getRadius()[2] == 3);
    REQUIRE(kernel.getShape()[0] == 15);
    REQUIRE(kernel.getShape()[1] == 11);
    REQUIRE(kernel.getShape()[2] == 7);
    REQUIRE(kernel.getSize() == 15u * 11u * 7u);
    REQUIRE(kernel.getGrid() == grid);
}

TEST_CASE("Kernel is symmetric under negation", "[field][kernel]") {
    Grid grid({ 7, 5, 6 }, { 3.0, 2.5, 4.0 });
    KernelParameters params;
    params.excitatoryWidth = 0.8;
    params.inhibitoryWidth = 1.7;

    Kernel kernel = KernelBuilder::build(grid, params);
    REQUIRE(kernel.isSymmetric(0.0));
    REQUIRE(kernel.at(2, -1, 3) == kernel.at(-2, 1, -3));
}

TEST_CASE("Kernel has a Mexican-hat profile", "[field][kernel]") {
    Grid grid({ 8, 8, 8 }, { 7.0, 7.0, 7.0 });
    KernelParameters params;
    params.normalize = false;

    Kernel kernel = KernelBuilder::build(grid, params);

    SECTION("Raw samples match the difference of Gaussians") {
        REQUIRE(kernel.center() == Catch::Detail::Approx(0.5));
        REQUIRE(kernel.at(1, 0, 0) == Catch::Detail::Approx(std::exp(-0.5) - 0.5 * std::exp(-1.0 / 18.0)));
        REQUIRE(kernel.getNormalization() == 1.0);
    }

    SECTION("Excitatory center, inhibitory surround") {
        REQUIRE(kernel.center() > 0.0);
        REQUIRE(kernel.at(4, 0, 0) < 0.0);
        REQUIRE(kernel.at(7, 7, 7) < 0.0);
    }

    SECTION("Offsets outside the stencil read as zero") {
        REQUIRE_FALSE(kernel.containsOffset(8, 0, 0));
        REQUIRE(kernel.at(8, 0, 0) == 0.0);
    }
}

TEST_CASE("Kernel normalization", "[field][kernel]") {
    Grid grid({ 8, 8, 8 }, { 7.0, 7.0, 7.0 });

    KernelParameters raw;
    raw.normalize = false;
    KernelParameters normalized;

    Kernel a = KernelBuilder::build(grid, raw);
    Kernel b = KernelBuilder::build(grid, normalized);

    REQUIRE(b.absSum() == Catch::Detail::Approx(1.0));
    REQUIRE(b.getNormalization() == Catch::Detail::Approx(a.absSum()));
    REQUIRE(b.center() == Catch::Detail::Approx(a.center() / a.absSum()));
    REQUIRE(std::signbit(b.sum()) == std::signbit(a.sum()));
}

TEST_CASE("Kernel cutoff radius", "[field][kernel]") {
    Grid grid({ 11, 11, 11 }, { 10.0, 10.0, 10.0 });
    KernelParameters params;
    params.cutoffRadius = 2.5;

    Index3 radius = KernelBuilder::stencilRadius(grid, params);
    REQUIRE(radius[0] == 3);
    REQUIRE(radius[1] == 3);
    REQUIRE(radius[2] == 3);

    Kernel kernel = KernelBuilder::build(grid, params);
    REQUIRE(kernel.getShape()[0] == 7);
    REQUIRE(kernel.isSymmetric(0.0));

    SECTION("A cutoff beyond the domain keeps the full stencil") {
        params.cutoffRadius = 100.0;
        REQUIRE(KernelBuilder::stencilRadius(grid, params)[0] == 10);
    }

    SECTION("Single-node axes have zero radius") {
        Grid flat({ 11, 11, 1 }, { 10.0, 10.0, 1.0 });
        REQUIRE(KernelBuilder::stencilRadius(flat, params)[2] == 0);
    }
}

TEST_CASE("Kernel parameter validation", "[field][kernel]") {
    Grid grid({ 4, 4, 4 }, { 3.0, 3.0, 3.0 });
    KernelParameters params;

    SECTION("Non-positive widths") {
        params.excitatoryWidth = 0.0;
        REQUIRE_THROWS_AS(KernelBuilder::build(grid, params), InvalidKernelParameterError);
        params.excitatoryWidth = 1.0;
        params.inhibitoryWidth = -3.0;
        REQUIRE_THROWS_AS(KernelBuilder::build(grid, params), InvalidKernelParameterError);
    }

    SECTION("Non-positive or non-finite amplitudes") {
        params.excitatoryAmplitude = -1.0;
        REQUIRE_THROWS_AS(KernelBuilder::build(grid, params), InvalidKernelParameterError);
        params.excitatoryAmplitude = std::numeric_limits<f64>::quiet_NaN();
        REQUIRE_THROWS_AS(params.validate(), InvalidKernelParameterError);
    }

    SECTION("Negative cutoff") {
        params.cutoffRadius = -1.0;
        REQUIRE_THROWS_AS(params.validate(), InvalidKernelParameterError);
    }

    SECTION("Cancelling lobes cannot be normalized") {
        params.inhibitoryAmplitude = params.excitatoryAmplitude;
        params.inhibitoryWidth = params.excitatoryWidth;
        REQUIRE_THROWS_AS(KernelBuilder::build(grid, params), InvalidKernelParameterError);
    }
}
