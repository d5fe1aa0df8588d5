// =============================================================================
// NeuroField - Kernel Convolution Implementation
// =============================================================================

#include "Convolution.h"
#include "core/Log.h"
#include "core/Assert.h"
#include "core/Profiler.h"
#include "core/math/MathUtils.h"
#include <algorithm>

namespace NeuroField {

// =============================================================================
// Direct Summation
// =============================================================================

DirectConvolver::DirectConvolver(const Kernel& kernel)
    : m_kernel(kernel)
{
}

void DirectConvolver::apply(const std::vector<f64>& input, std::vector<f64>& output) const {
    NEUROFIELD_PROFILE_SCOPE_NAMED("DirectConvolver::apply");

    const Grid& grid = m_kernel.getGrid();
    const Index3& n = grid.getDimensions();
    const i32 nx = static_cast<i32>(n[0]);
    const i32 ny = static_cast<i32>(n[1]);
    const i32 nz = static_cast<i32>(n[2]);
    const i32 rx = static_cast<i32>(m_kernel.getRadius()[0]);
    const i32 ry = static_cast<i32>(m_kernel.getRadius()[1]);
    const i32 rz = static_cast<i32>(m_kernel.getRadius()[2]);

    NEUROFIELD_ASSERT(input.size() == grid.getPointCount());
    output.resize(grid.getPointCount());

    const f64* NEUROFIELD_RESTRICT in = input.data();
    const f64* NEUROFIELD_RESTRICT w = m_kernel.data();

    for (i32 k = 0; k < nz; ++k) {
        const i32 ozMin = Math::max(-rz, -k);
        const i32 ozMax = Math::min(rz, nz - 1 - k);
        for (i32 j = 0; j < ny; ++j) {
            const i32 oyMin = Math::max(-ry, -j);
            const i32 oyMax = Math::min(ry, ny - 1 - j);
            for (i32 i = 0; i < nx; ++i) {
                const i32 oxMin = Math::max(-rx, -i);
                const i32 oxMax = Math::min(rx, nx - 1 - i);
                const i32 count = oxMax - oxMin + 1;

                f64 acc = 0.0;
                for (i32 oz = ozMin; oz <= ozMax; ++oz) {
                    for (i32 oy = oyMin; oy <= oyMax; ++oy) {
                        const f64* row = in + grid.getIndex(static_cast<u32>(i + oxMin),
                                                            static_cast<u32>(j + oy),
                                                            static_cast<u32>(k + oz));
                        const f64* wrow = w + m_kernel.getIndex(oxMin, oy, oz);
                        for (i32 t = 0; t < count; ++t) {
                            acc += wrow[t] * row[t];
                        }
                    }
                }
                output[grid.getIndex(static_cast<u32>(i), static_cast<u32>(j), static_cast<u32>(k))] = acc;
            }
        }
    }
}

// =============================================================================
// Spectral (FFT) Convolution
// =============================================================================

SpectralConvolver::SpectralConvolver(const Kernel& kernel)
    : m_grid(kernel.getGrid())
{
    NEUROFIELD_TIMED_SCOPE("SpectralConvolver::plan");

    const Index3& n = m_grid.getDimensions();
    const Index3& r = kernel.getRadius();
    for (u32 axis = 0; axis < 3; ++axis) {
        m_padded[axis] = n[axis] + r[axis];
    }

    const usize total = static_cast<usize>(m_padded[0]) * m_padded[1] * m_padded[2];
    m_kernelSpectrum.assign(total, Complex(0.0, 0.0));
    m_work.resize(total);

    // Wrap negative offsets to the end of each padded axis
    const i32 rx = static_cast<i32>(r[0]);
    const i32 ry = static_cast<i32>(r[1]);
    const i32 rz = static_cast<i32>(r[2]);
    const i32 mx = static_cast<i32>(m_padded[0]);
    const i32 my = static_cast<i32>(m_padded[1]);
    const i32 mz = static_cast<i32>(m_padded[2]);
    for (i32 oz = -rz; oz <= rz; ++oz) {
        for (i32 oy = -ry; oy <= ry; ++oy) {
            for (i32 ox = -rx; ox <= rx; ++ox) {
                const usize dst = paddedIndex(static_cast<u32>((ox + mx) % mx),
                                              static_cast<u32>((oy + my) % my),
                                              static_cast<u32>((oz + mz) % mz));
                m_kernelSpectrum[dst] = Complex(kernel.at(ox, oy, oz), 0.0);
            }
        }
    }

    transform(m_kernelSpectrum, false);

    NEUROFIELD_LOG_DEBUG("Convolution", "Spectral convolver ready (padded %ux%ux%u)",
        m_padded[0], m_padded[1], m_padded[2]);
}

void SpectralConvolver::transform(std::vector<Complex>& data, bool inverse) const {
    for (u32 axis = 0; axis < 3; ++axis) {
        const u32 length = m_padded[axis];
        if (length < 2) continue;

        const u32 a1 = (axis + 1) % 3;
        const u32 a2 = (axis + 2) % 3;
        m_lineIn.resize(length);

        for (u32 q = 0; q < m_padded[a2]; ++q) {
            for (u32 p = 0; p < m_padded[a1]; ++p) {
                Index3 pos{ 0, 0, 0 };
                pos[a1] = p;
                pos[a2] = q;

                for (u32 t = 0; t < length; ++t) {
                    pos[axis] = t;
                    m_lineIn[t] = data[paddedIndex(pos[0], pos[1], pos[2])];
                }

                if (inverse) {
                    m_fft.inv(m_lineOut, m_lineIn);
                } else {
                    m_fft.fwd(m_lineOut, m_lineIn);
                }

                for (u32 t = 0; t < length; ++t) {
                    pos[axis] = t;
                    data[paddedIndex(pos[0], pos[1], pos[2])] = m_lineOut[t];
                }
            }
        }
    }
}

void SpectralConvolver::apply(const std::vector<f64>& input, std::vector<f64>& output) const {
    NEUROFIELD_PROFILE_SCOPE_NAMED("SpectralConvolver::apply");

    const Index3& n = m_grid.getDimensions();
    NEUROFIELD_ASSERT(input.size() == m_grid.getPointCount());

    std::fill(m_work.begin(), m_work.end(), Complex(0.0, 0.0));
    for (u32 k = 0; k < n[2]; ++k) {
        for (u32 j = 0; j < n[1]; ++j) {
            for (u32 i = 0; i < n[0]; ++i) {
                m_work[paddedIndex(i, j, k)] = Complex(input[m_grid.getIndex(i, j, k)], 0.0);
            }
        }
    }

    transform(m_work, false);
    for (usize idx = 0; idx < m_work.size(); ++idx) {
        m_work[idx] *= m_kernelSpectrum[idx];
    }
    transform(m_work, true);

    output.resize(m_grid.getPointCount());
    for (u32 k = 0; k < n[2]; ++k) {
        for (u32 j = 0; j < n[1]; ++j) {
            for (u32 i = 0; i < n[0]; ++i) {
                output[m_grid.getIndex(i, j, k)] = m_work[paddedIndex(i, j, k)].real();
            }
        }
    }
}

// =============================================================================
// Factory
// =============================================================================

ConvolutionMethod resolveConvolutionMethod(ConvolutionMethod requested, const Grid& grid) {
    if (requested != ConvolutionMethod::Auto) return requested;
    return (grid.getPointCount() > kAutoSpectralThreshold) ? ConvolutionMethod::Spectral
                                                           : ConvolutionMethod::Direct;
}

std::unique_ptr<IConvolver> createConvolver(const Kernel& kernel, ConvolutionMethod method) {
    switch (resolveConvolutionMethod(method, kernel.getGrid())) {
        case ConvolutionMethod::Spectral:
            return std::make_unique<SpectralConvolver>(kernel);
        case ConvolutionMethod::Direct:
        default:
            return std::make_unique<DirectConvolver>(kernel);
    }
}

} // namespace NeuroField
