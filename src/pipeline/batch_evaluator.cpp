#include "batch_evaluator.h"
#include <algorithm>
#include <atomic>
#include <exception>
#include <iostream>
#include <mutex>
#include <system_error>
#include <thread>

BatchDriftEvaluator::BatchDriftEvaluator(const DriftConfig& config, size_t num_threads)
    : config_(config), num_threads_(num_threads) {
    config_.validate();
    if (num_threads_ == 0) {
        num_threads_ = std::max<size_t>(1, std::thread::hardware_concurrency());
    }
}

BatchDriftEvaluator::~BatchDriftEvaluator() {
}

std::vector<DriftResult> BatchDriftEvaluator::processBatch(
    const std::vector<std::vector<double>>& series) const {
    std::vector<DriftResult> results(series.size());
    if (series.empty()) {
        return results;
    }

    std::atomic<size_t> next(0);
    std::atomic<bool> failed(false);
    std::exception_ptr first_error;
    std::mutex error_mutex;

    auto worker = [&]() {
        while (!failed.load()) {
            size_t i = next.fetch_add(1);
            if (i >= series.size()) {
                return;
            }
            try {
                results[i] = EWCusumDetector::process(series[i], config_);
            } catch (...) {
                // Handed back to the caller after join
                std::lock_guard<std::mutex> lock(error_mutex);
                if (!first_error) {
                    first_error = std::current_exception();
                }
                failed.store(true);
                return;
            }
        }
    };

    // The calling thread is one of the workers
    size_t workers = std::min(num_threads_, series.size());
    std::vector<std::thread> threads;
    threads.reserve(workers - 1);
    for (size_t t = 1; t < workers; ++t) {
        try {
            threads.emplace_back(worker);
        } catch (const std::system_error& e) {
            std::cerr << "WARNING: started " << threads.size() + 1 << " of " << workers
                      << " batch workers: " << e.what() << std::endl;
            break;
        }
    }
    worker();
    for (auto& thread : threads) {
        thread.join();
    }

    if (first_error) {
        std::rethrow_exception(first_error);
    }
    return results;
}
