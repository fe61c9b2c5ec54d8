/**
 * @file FFTW.hpp
 * @brief Utilities for computing discrete Fourier transforms and power spectra using FFTW and Eigen.
 *
 * This header wraps the FFTW planner/executor for one-dimensional complex transforms of
 * Eigen arrays. Plans are owned by an RAII handle; plan creation and destruction go through
 * a process-wide mutex since the FFTW planner is not thread-safe, while execution is.
 *
 * Dependencies:
 * - FFTW3 library for FFT computations.
 * - Eigen library for array operations.
 * - FSEA_traits.hpp for type definitions.
 *
 * Namespace: Utils
 *
 * Functions:
 * - forwardFFT: Computes the forward DFT of a complex array (unnormalized).
 * - powerSpectrum: Squared magnitude of the forward DFT of real samples.
 */
#ifndef FFTW_HPP
#define FFTW_HPP

#include <fftw3.h>
#include <Eigen/Dense>
#include <complex>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <type_traits>
#include "../traits/FSEA_traits.hpp"

namespace Utils {

using Complex = std::complex<double>;

using ComplexSignal = traits::DataType::ComplexArray;

/**
 * @brief Mutex serializing every call into the FFTW planner.
 */
inline std::mutex& fftw_planner_mutex()
{
    static std::mutex mutex;
    return mutex;
}

struct FFTWPlanDeleter {
    void operator()(fftw_plan plan) const
    {
        std::lock_guard<std::mutex> lock(fftw_planner_mutex());
        fftw_destroy_plan(plan);
    }
};

using FFTWPlanPtr = std::unique_ptr<std::remove_pointer_t<fftw_plan>, FFTWPlanDeleter>;

namespace detail {

inline ComplexSignal executeDFT(const ComplexSignal& data, int sign)
{
    const int n = static_cast<int>(data.size());
    if (n == 0) {
        return ComplexSignal();
    }

    ComplexSignal input = data;
    ComplexSignal output(n);

    FFTWPlanPtr plan;
    {
        std::lock_guard<std::mutex> lock(fftw_planner_mutex());
        plan.reset(fftw_plan_dft_1d(n,
            reinterpret_cast<fftw_complex*>(input.data()),
            reinterpret_cast<fftw_complex*>(output.data()),
            sign, FFTW_ESTIMATE));
    }
    if (!plan) {
        throw std::runtime_error("FFTW failed to create a plan of length " + std::to_string(n));
    }

    fftw_execute(plan.get());
    return output;
}

} // namespace detail

/**
 * @brief Computes the forward DFT.
 * @param data Input time-domain data.
 * @return Frequency-domain data of the same length.
 */
inline ComplexSignal forwardFFT(const ComplexSignal& data)
{
    return detail::executeDFT(data, FFTW_FORWARD);
}

/**
 * @brief Power spectrum |Y_k|^2 of real samples.
 * @tparam R Floating-point type of the samples.
 * @param samples Real time-domain samples.
 * @return Array with one power value per DFT bin.
 */
template <typename R = traits::DataType::SeriesField>
inline Eigen::Array<R, Eigen::Dynamic, 1> powerSpectrum(const Eigen::Array<R, Eigen::Dynamic, 1>& samples)
{
    ComplexSignal signal = samples.template cast<double>().template cast<Complex>();
    ComplexSignal spectrum = forwardFFT(signal);
    return spectrum.abs2().template cast<R>();
}

} // namespace Utils

#endif // FFTW_HPP
