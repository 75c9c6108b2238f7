#ifndef BATCH_EVALUATOR_H
#define BATCH_EVALUATOR_H

#include <cstddef>
#include <vector>
#include "detectors/drift_detector.h"

// Runs the drift detector over many independent series on a pool of CPU
// threads. Each series owns its state, so workers share nothing but the
// output slots they write.
class BatchDriftEvaluator {
public:
    // num_threads == 0 picks std::thread::hardware_concurrency()
    explicit BatchDriftEvaluator(const DriftConfig& config, size_t num_threads = 0);
    ~BatchDriftEvaluator();

    // results[i] corresponds to series[i]. The first error raised by any
    // series is rethrown after all workers have joined. If a worker thread
    // cannot be started the batch finishes on the threads already running.
    std::vector<DriftResult> processBatch(const std::vector<std::vector<double>>& series) const;

    size_t getThreadCount() const { return num_threads_; }
    const DriftConfig& getConfig() const { return config_; }

private:
    DriftConfig config_;
    size_t num_threads_;
};

#endif // BATCH_EVALUATOR_H
