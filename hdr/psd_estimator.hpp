#pragma once

#include "config.hpp"
#include <fftw3.h>
#include <vector>
#include <complex>
#include <memory>    // For std::unique_ptr
#include <string>    // For std::string
#include <stdexcept> // For std::bad_alloc
#include <type_traits>

// RAII Wrapper for FFTW Memory
template <typename T> struct fftw_allocator {
    typedef T value_type;
    T* allocate(size_t n) {
        T* p = static_cast<T*>(fftwf_malloc(sizeof(T) * n));
        if (!p) throw std::bad_alloc();
        return p;
    }
    void deallocate(T* p, size_t) noexcept { fftwf_free(p); }

    template <class U> struct rebind { typedef fftw_allocator<U> other; };
    fftw_allocator() = default;
    template <class U> fftw_allocator(const fftw_allocator<U>&) {}

    bool operator==(const fftw_allocator&) const { return true; }
    bool operator!=(const fftw_allocator&) const { return false; }
};

template <typename T>
using fftw_vector = std::vector<T, fftw_allocator<T>>;

struct fftwf_plan_deleter {
    void operator()(fftwf_plan p) const { fftwf_destroy_plan(p); }
};
using fftwf_plan_ptr = std::unique_ptr<std::remove_pointer<fftwf_plan>::type, fftwf_plan_deleter>;

/**
 * Windowed, averaged power spectrum of fixed-size IQ blocks.
 *
 * Each block of `fft_len` samples is windowed, transformed and converted to dB with the DC
 * bin centred. After `avg_num` blocks the averaged spectrum is returned and averaging restarts.
 */
class PsdEstimator {
private:
    size_t fft_len;
    size_t avg_num;
    std::string window_type;
    fftw_vector<std::complex<float>> fft_in;
    fftw_vector<std::complex<float>> fft_out;
    fftw_vector<float> window;
    fftwf_plan_ptr fft_plan;
    std::vector<double> psd_sum;
    size_t current_avg_count = 0;

    void generate_window();

public:
    PsdEstimator(size_t fft_len, size_t avg_num, const std::string& window_type,
                 const std::string& wisdom_path = "");
    PsdEstimator(const Config& config);

    void reset();
    size_t block_size() const { return fft_len; }
    size_t pending_blocks() const { return current_avg_count; }

    // Returns true and fills psd_db once avg_num blocks have been accumulated.
    bool process_block(const std::vector<std::complex<float>>& data, std::vector<double>& psd_db);

    static void save_wisdom(const std::string& path);
};
