#pragma once

#include "method.hpp"
#include "sample_run.hpp"
#include "errors.hpp"
#include "algorithms/blank_average.hpp"
#include "io/csv_writer.hpp"
#include <optional>
#include <string>
#include <vector>

namespace trh {

/**
 * @brief Thrown when the blank average of a batch cannot be built.
 *
 * Names the blank run that failed; no sample of the batch can be
 * quantified without it.
 */
class BlankBatchError : public Error {
public:
    explicit BlankBatchError(const std::string& msg)
        : Error("Blank batch error", msg) {}
};

/**
 * @brief A sample or sample/fraction that could not be quantified.
 */
struct BatchFailure {
    std::string sample_name;
    std::string source_file;

    /// Fraction label, empty when the whole sample failed
    std::string fraction;

    /// Processing step that failed ("boundaries", "istd", "quantify")
    std::string stage;

    std::string message;

    /// One-line description for operators
    [[nodiscard]] std::string describe() const;
};

/**
 * @brief Options for batch processing.
 */
struct BatchOptions {
    /// Called after each sample (current, total); return false to stop
    ProgressCallback progress_callback = nullptr;
};

/**
 * @brief Outcome of a batch run.
 */
struct BatchResult {
    /// One record per quantified sample/fraction
    std::vector<io::ResultRecord> records;

    /// Samples or fractions that failed
    std::vector<BatchFailure> failures;

    /// Blank average the samples were corrected with
    std::optional<algorithms::BlankAverage> blank_average;

    /// Number of samples visited (less than requested if cancelled)
    std::size_t samples_processed = 0;

    [[nodiscard]] bool hasFailures() const noexcept { return !failures.empty(); }
};

/**
 * @brief Quantifies every sample of a batch against its blank runs.
 *
 * Builds the blank average once, then for each sample resolves its
 * fractions, identifies its internal standard and computes one
 * concentration per fraction of the method's mode. Quantification errors
 * are recorded per sample/fraction and the batch continues.
 *
 * Usage:
 * @code
 * BatchProcessor processor(io::loadMethod("trh.xml"));
 * BatchResult result = processor.run(blanks, samples);
 * io::CsvWriter().write(result.records, "results.csv",
 *                       io::standardFieldnames());
 * @endcode
 */
class BatchProcessor {
public:
    /**
     * @brief Construct for a method.
     *
     * @throws std::invalid_argument if the method fails validation
     */
    explicit BatchProcessor(MethodConfig method, BatchOptions options = {})
        : method_(std::move(method)), options_(std::move(options)) {
        method_.validate();
    }

    /**
     * @brief Run the batch.
     *
     * @param blanks Blank runs of the batch
     * @param samples Sample runs to quantify
     * @return Records, failures and the blank average
     * @throws BlankBatchError if the blank average cannot be built
     */
    BatchResult run(const std::vector<SampleRun>& blanks,
                    const std::vector<SampleRun>& samples) const;

    /**
     * @brief Build the blank average of the batch.
     *
     * @throws BlankBatchError naming the first blank run that fails
     */
    algorithms::BlankAverage buildBlankAverage(
        const std::vector<SampleRun>& blanks) const;

    /**
     * @brief Quantify one sample, appending records or failures.
     */
    void quantifySample(const SampleRun& sample,
                        const algorithms::BlankAverage& blank_average,
                        BatchResult& result) const;

    const MethodConfig& method() const { return method_; }
    const BatchOptions& options() const { return options_; }

private:
    MethodConfig method_;
    BatchOptions options_;
};

} // namespace trh
