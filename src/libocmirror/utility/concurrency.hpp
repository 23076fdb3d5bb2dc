/*
 * ocmirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef libocmirror_utility_concurrency_hpp
#define libocmirror_utility_concurrency_hpp

#include <algorithm>
#include <atomic>
#include <exception>
#include <future>
#include <vector>


namespace libocmirror {
namespace concurrency {

/**
 * Calls function(i) for every i in [0, count) on at most 'concurrency'
 * worker threads. After the first failure no further indices are started;
 * the call returns once all workers have exited and rethrows the first error.
 */
template<typename Function>
void forEachIndex(size_t count, size_t concurrency, Function function) {
    std::atomic<size_t> next{0};
    std::atomic<bool> failed{false};

    auto worker = [&]() {
        for(auto i = next++; i < count && !failed; i = next++) {
            try {
                function(i);
            }
            catch(...) {
                failed = true;
                throw;
            }
        }
    };

    auto numberOfWorkers = std::min(std::max(concurrency, size_t{1}), count);
    auto workers = std::vector<std::future<void>>{};
    for(size_t w = 0; w < numberOfWorkers; ++w) {
        workers.push_back(std::async(std::launch::async, worker));
    }

    std::exception_ptr firstError;
    for(auto& w : workers) {
        try {
            w.get();
        }
        catch(...) {
            if(!firstError) {
                firstError = std::current_exception();
            }
        }
    }
    if(firstError) {
        std::rethrow_exception(firstError);
    }
}

}}

#endif
