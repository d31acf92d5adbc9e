#include "analysis/worker_pool.hpp"

#include <cstdlib>
#include <stdexcept>
#include <string>

namespace bench_analysis {
namespace {

std::size_t default_worker_count() {
    static const std::size_t value = [] {
        const char* env = std::getenv("BENCH_ANALYSIS_MAX_THREADS");
        if (!env || *env == '\0') {
            return std::size_t{1};
        }
        try {
            const std::size_t parsed = std::stoull(env);
            return parsed > 0 ? parsed : std::size_t{1};
        } catch (const std::invalid_argument&) {
            return std::size_t{1};
        } catch (const std::out_of_range&) {
            return std::size_t{1};
        }
    }();
    return value;
}

}  // namespace

std::size_t resolve_worker_count(std::size_t requested) {
    return requested > 0 ? requested : default_worker_count();
}

}  // namespace bench_analysis
