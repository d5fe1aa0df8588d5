// =============================================================================
// NeuroField - Kernel Convolution
// =============================================================================
// Evaluates (K * g)(x_i) = sum_o K(o) g(x_i + o) over the grid with zero
// values outside the domain (truncated boundaries). Two backends:
//   - Direct: nested stencil summation, exact and easy to verify
//   - Spectral: zero-padded FFT product (Eigen FFT), for large grids
// Both produce the same result up to round-off.
// =============================================================================

#pragma once

#include "core/Types.h"
#include "Kernel.h"
#include <complex>
#include <memory>
#include <vector>

#include <unsupported/Eigen/FFT>

namespace NeuroField {

enum class ConvolutionMethod : u8 {
    Auto = 0,   // Spectral above kAutoSpectralThreshold grid points
    Direct,
    Spectral
};

constexpr const char* convolutionMethodToString(ConvolutionMethod method) {
    switch (method) {
        case ConvolutionMethod::Auto:     return "auto";
        case ConvolutionMethod::Direct:   return "direct";
        case ConvolutionMethod::Spectral: return "spectral";
        default:                          return "unknown";
    }
}

constexpr usize kAutoSpectralThreshold = 512;

// =============================================================================
// Convolver Interface
// =============================================================================

class IConvolver {
public:
    virtual ~IConvolver() = default;

    // input and output hold one value per grid point; output is overwritten
    virtual void apply(const std::vector<f64>& input, std::vector<f64>& output) const = 0;

    virtual ConvolutionMethod getMethod() const = 0;
    virtual const Grid& getGrid() const = 0;
};

// =============================================================================
// Direct Summation
// =============================================================================

class DirectConvolver : public IConvolver {
public:
    explicit DirectConvolver(const Kernel& kernel);

    void apply(const std::vector<f64>& input, std::vector<f64>& output) const override;

    ConvolutionMethod getMethod() const override { return ConvolutionMethod::Direct; }
    const Grid& getGrid() const override { return m_kernel.getGrid(); }

private:
    Kernel m_kernel;
};

// =============================================================================
// Spectral (FFT) Convolution
// =============================================================================

class SpectralConvolver : public IConvolver {
public:
    using Complex = std::complex<f64>;

    explicit SpectralConvolver(const Kernel& kernel);

    void apply(const std::vector<f64>& input, std::vector<f64>& output) const override;

    ConvolutionMethod getMethod() const override { return ConvolutionMethod::Spectral; }
    const Grid& getGrid() const override { return m_grid; }

    // Padded transform size per axis (n + r, enough to avoid wrap-around)
    const Index3& getPaddedShape() const { return m_padded; }

private:
    usize paddedIndex(u32 i, u32 j, u32 k) const {
        return static_cast<usize>(i)
             + static_cast<usize>(j) * m_padded[0]
             + static_cast<usize>(k) * m_padded[0] * m_padded[1];
    }

    void transform(std::vector<Complex>& data, bool inverse) const;

    Grid m_grid;
    Index3 m_padded;
    std::vector<Complex> m_kernelSpectrum;

    // Scratch reused across calls
    mutable Eigen::FFT<f64> m_fft;
    mutable std::vector<Complex> m_work;
    mutable std::vector<Complex> m_lineIn;
    mutable std::vector<Complex> m_lineOut;
};

// =============================================================================
// Factory
// =============================================================================

ConvolutionMethod resolveConvolutionMethod(ConvolutionMethod requested, const Grid& grid);

std::unique_ptr<IConvolver> createConvolver(const Kernel& kernel, ConvolutionMethod method);

} // namespace NeuroField
