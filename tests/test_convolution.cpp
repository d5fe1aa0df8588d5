// =============================================================================
// NeuroField - Convolution Tests
// =============================================================================

#include <random>
#include <vector>
#include <catch2/catch.hpp>
#include "field/Convolution.h"
#include "field/Kernel.h"
#include "field/Grid.h"
#include "core/Types.h"

using namespace NeuroField;

namespace {

std::vector<f64> randomValues(usize count, u64 seed) {
    std::mt19937_64 rng(seed);
    std::uniform_real_distribution<f64> dist(0.0, 1.0);
    std::vector<f64> values(count);
    for (f64& v : values) v = dist(rng);
    return values;
}

} // namespace

TEST_CASE("Direct convolution of an impulse reproduces the kernel", "[field][convolution]") {
    Grid grid({ 5, 5, 5 }, { 4.0, 4.0, 4.0 });
    Kernel kernel = KernelBuilder::build(grid, KernelParameters{});

    std::vector<f64> input(grid.getPointCount(), 0.0);
    input[grid.getIndex(2, 2, 2)] = 1.0;

    DirectConvolver convolver(kernel);
    std::vector<f64> output;
    convolver.apply(input, output);

    REQUIRE(output.size() == grid.getPointCount());
    REQUIRE(output[grid.getIndex(2, 2, 2)] == Catch::Detail::Approx(kernel.center()));
    REQUIRE(output[grid.getIndex(3, 2, 2)] == Catch::Detail::Approx(kernel.at(1, 0, 0)));
    REQUIRE(output[grid.getIndex(0, 4, 1)] == Catch::Detail::Approx(kernel.at(-2, 2, -1)));
}

TEST_CASE("Direct convolution truncates at the boundary", "[field][convolution]") {
    Grid grid({ 3, 3, 3 }, { 2.0, 2.0, 2.0 });
    Kernel kernel = KernelBuilder::build(grid, KernelParameters{});
    std::vector<f64> ones(grid.getPointCount(), 1.0);

    DirectConvolver convolver(kernel);
    std::vector<f64> output;
    convolver.apply(ones, output);

    SECTION("Center sees the inner 3x3x3 block of weights") {
        f64 expected = 0.0;
        for (i32 oz = -1; oz <= 1; ++oz)
            for (i32 oy = -1; oy <= 1; ++oy)
                for (i32 ox = -1; ox <= 1; ++ox)
                    expected += kernel.at(ox, oy, oz);
        REQUIRE(output[grid.getIndex(1, 1, 1)] == Catch::Detail::Approx(expected));
    }

    SECTION("Corner sees only the non-negative octant") {
        f64 expected = 0.0;
        for (i32 oz = 0; oz <= 2; ++oz)
            for (i32 oy = 0; oy <= 2; ++oy)
                for (i32 ox = 0; ox <= 2; ++ox)
                    expected += kernel.at(ox, oy, oz);
        REQUIRE(output[grid.getIndex(0, 0, 0)] == Catch::Detail::Approx(expected));
    }
}

TEST_CASE("Spectral and direct convolution agree", "[field][convolution]") {
    SECTION("Non-cubic grid, full stencil") {
        Grid grid({ 6, 5, 4 }, { 5.0, 3.0, 4.5 });
        KernelParameters params;
        params.excitatoryWidth = 0.9;
        params.inhibitoryWidth = 2.2;
        Kernel kernel = KernelBuilder::build(grid, params);

        DirectConvolver direct(kernel);
        SpectralConvolver spectral(kernel);
        REQUIRE(spectral.getPaddedShape()[0] == 11);
        REQUIRE(spectral.getPaddedShape()[1] == 9);
        REQUIRE(spectral.getPaddedShape()[2] == 7);

        std::vector<f64> input = randomValues(grid.getPointCount(), 99);
        std::vector<f64> a, b;
        direct.apply(input, a);
        spectral.apply(input, b);

        REQUIRE(a.size() == b.size());
        for (usize i = 0; i < a.size(); ++i) {
            REQUIRE_THAT(b[i], Catch::Matchers::WithinAbs(a[i], 1e-10));
        }
    }

    SECTION("Truncated stencil") {
        Grid grid({ 9, 7, 8 }, { 8.0, 6.0, 7.0 });
        KernelParameters params;
        params.cutoffRadius = 2.0;
        Kernel kernel = KernelBuilder::build(grid, params);

        DirectConvolver direct(kernel);
        SpectralConvolver spectral(kernel);

        std::vector<f64> input = randomValues(grid.getPointCount(), 7);
        std::vector<f64> a, b;
        direct.apply(input, a);
        spectral.apply(input, b);

        for (usize i = 0; i < a.size(); ++i) {
            REQUIRE_THAT(b[i], Catch::Matchers::WithinAbs(a[i], 1e-10));
        }
    }

    SECTION("Repeated calls reuse scratch without drift") {
        Grid grid({ 4, 4, 4 }, { 3.0, 3.0, 3.0 });
        Kernel kernel = KernelBuilder::build(grid, KernelParameters{});
        SpectralConvolver spectral(kernel);

        std::vector<f64> input = randomValues(grid.getPointCount(), 3);
        std::vector<f64> first, second;
        spectral.apply(input, first);
        spectral.apply(input, second);
        for (usize i = 0; i < first.size(); ++i) {
            REQUIRE_THAT(second[i], Catch::Matchers::WithinAbs(first[i], 1e-14));
        }
    }
}

TEST_CASE("Convolution method selection", "[field][convolution]") {
    Grid small({ 8, 8, 8 }, { 1.0, 1.0, 1.0 });
    Grid large({ 9, 8, 8 }, { 1.0, 1.0, 1.0 });

    REQUIRE(resolveConvolutionMethod(ConvolutionMethod::Auto, small) == ConvolutionMethod::Direct);
    REQUIRE(resolveConvolutionMethod(ConvolutionMethod::Auto, large) == ConvolutionMethod::Spectral);
    REQUIRE(resolveConvolutionMethod(ConvolutionMethod::Direct, large) == ConvolutionMethod::Direct);
    REQUIRE(resolveConvolutionMethod(ConvolutionMethod::Spectral, small) == ConvolutionMethod::Spectral);

    Kernel kernel = KernelBuilder::build(small, KernelParameters{});
    auto convolver = createConvolver(kernel, ConvolutionMethod::Spectral);
    REQUIRE(convolver->getMethod() == ConvolutionMethod::Spectral);
    REQUIRE(convolver->getGrid() == small);

    convolver = createConvolver(kernel, ConvolutionMethod::Auto);
    REQUIRE(convolver->getMethod() == ConvolutionMethod::Direct);
}
