#include "kssampling/c_api.h"
#include "kssampling/performance.h"

#include <exception>
#include <string>
#include <string_view>

namespace {

    thread_local std::string last_error;

    void setError(std::string_view message) noexcept {
        last_error.assign(message.data(), message.size());
    }

    template<typename Call>
    kssampling_status_t guarded(Call&& call) noexcept {
        last_error.clear();
        try {
            call();
            return KSSAMPLING_OK;
        } catch (const KSSampling::PreconditionError& e) {
            setError(e.what());
            return KSSAMPLING_ERROR_PRECONDITION;
        } catch (const std::invalid_argument& e) {
            setError(e.what());
            return KSSAMPLING_ERROR_INVALID_ARGUMENT;
        } catch (const std::exception& e) {
            setError(e.what());
            return KSSAMPLING_ERROR_INTERNAL;
        } catch (...) {
            setError("unknown error in kssampling");
            return KSSAMPLING_ERROR_INTERNAL;
        }
    }

}

extern "C" {

KSSAMPLING_C_API kssampling_status_t kssampling_kennard_stone(
        const double* dist, const size_t* seed, size_t* result_out, double* vdist_out,
        size_t n_sample, size_t n_seed, size_t n_result) {
    return guarded([&] {
        KSSampling::performance::kennardStone(dist, seed, result_out, vdist_out, n_sample, n_seed, n_result);
    });
}

KSSAMPLING_C_API kssampling_status_t kssampling_kennard_stone_bounded(
        const double* X, const size_t* seed, size_t* result_out, double* vdist_out,
        size_t n_sample, size_t n_feature, size_t n_seed, size_t n_result) {
    return guarded([&] {
        KSSampling::performance::kennardStoneBounded(
                X, seed, result_out, vdist_out, n_sample, n_feature, n_seed, n_result
        );
    });
}

KSSAMPLING_C_API const char* kssampling_last_error(void) {
    return last_error.c_str();
}

}
