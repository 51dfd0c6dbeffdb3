#pragma once

/**
 * @file trh.hpp
 * @brief Main header for the TRH quantification library.
 *
 * Include this header to get access to all TRH core functionality.
 *
 * @example
 * @code
 * #include <trh/trh.hpp>
 *
 * int main() {
 *     auto method = trh::io::loadMethod("trh_method.xml");
 *     std::vector<trh::SampleRun> blanks = {trh::io::loadReport("blank1.csv")};
 *     std::vector<trh::SampleRun> samples = {trh::io::loadReport("s1.csv")};
 *
 *     trh::BatchProcessor processor(method);
 *     auto result = processor.run(blanks, samples);
 *     trh::io::CsvWriter().write(result.records, "results.csv",
 *                                trh::io::standardFieldnames());
 *     return result.hasFailures() ? 1 : 0;
 * }
 * @endcode
 */

// Core types
#include "types.hpp"
#include "errors.hpp"

// Data structures
#include "peak.hpp"
#include "sample_run.hpp"
#include "method.hpp"

// Algorithms
#include "algorithms/retention_index.hpp"
#include "algorithms/istd_locator.hpp"
#include "algorithms/fraction_slicer.hpp"
#include "algorithms/blank_average.hpp"
#include "algorithms/concentration.hpp"

// I/O
#include "io/zlib.hpp"
#include "io/report_reader.hpp"
#include "io/method_reader.hpp"
#include "io/csv_writer.hpp"

// Batch processing
#include "batch.hpp"

/**
 * @namespace trh
 * @brief Root namespace for the TRH library.
 */

/**
 * @namespace trh::io
 * @brief Readers and writers for reports, methods and result tables.
 */

/**
 * @namespace trh::algorithms
 * @brief Fraction resolution, internal standard and quantification algorithms.
 */
