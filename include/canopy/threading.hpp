#pragma once

/**
 * Canopy Threading Utilities
 *
 * parallel_for runs independent iterations on OpenMP threads when the
 * library is built with OpenMP, otherwise on a shared thread pool.
 * An exception thrown by any iteration is rethrown on the calling thread
 * after every iteration has finished.
 */

#include <cstddef>
#include <functional>

namespace canopy {
namespace threading {

// At most n_threads iterations run at once; n_threads <= 0 uses every available core
void parallel_for(size_t begin, size_t end, const std::function<void(size_t)>& body,
                  int n_threads = -1);

int get_max_threads();
void set_num_threads(int n);
void shutdown_global_pool();

} // namespace threading
} // namespace canopy
