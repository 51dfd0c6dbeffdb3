#include "trh/batch.hpp"
#include "trh/algorithms/concentration.hpp"
#include <iomanip>
#include <sstream>

namespace trh {

namespace {

std::string formatFixed(double value, int decimal_places) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(decimal_places) << value;
    return out.str();
}

std::string formatNumber(double value) {
    std::ostringstream out;
    out << std::setprecision(12) << value;
    return out.str();
}

std::string runLabel(const SampleRun& run) {
    std::string label = "'" + run.name() + "'";
    if (!run.sourceFile().empty()) {
        label += " (" + run.sourceFile() + ")";
    }
    return label;
}

} // namespace

std::string BatchFailure::describe() const {
    std::string text = "Sample '" + sample_name + "'";
    if (!source_file.empty()) text += " (" + source_file + ")";
    if (!fraction.empty()) text += ", fraction " + fraction;
    text += ", " + stage + ": " + message;
    return text;
}

algorithms::BlankAverage BatchProcessor::buildBlankAverage(
    const std::vector<SampleRun>& blanks) const {
    if (blanks.empty()) {
        throw BlankBatchError("no blank runs supplied");
    }

    // Summarize run by run so a failure names its blank
    std::vector<algorithms::BlankRunSummary> summaries;
    summaries.reserve(blanks.size());
    for (const auto& blank : blanks) {
        try {
            summaries.push_back(algorithms::summarizeBlankRun(
                blank.peaks(), method_.mode, method_.boundaries, method_.istd));
        } catch (const Error& e) {
            throw BlankBatchError("blank run " + runLabel(blank) + ": " + e.what());
        }
    }

    return algorithms::averageBlankRuns(summaries, method_.mode);
}

void BatchProcessor::quantifySample(const SampleRun& sample,
                                    const algorithms::BlankAverage& blank_average,
                                    BatchResult& result) const {
    auto fail = [&](const std::string& fraction, const std::string& stage,
                    const Error& e) {
        BatchFailure failure;
        failure.sample_name = sample.name();
        failure.source_file = sample.sourceFile();
        failure.fraction = fraction;
        failure.stage = stage;
        failure.message = e.what();
        result.failures.push_back(std::move(failure));
    };

    std::vector<algorithms::FractionSlice> slices;
    try {
        slices = algorithms::sliceFractions(sample.peaks(), method_.mode,
                                            method_.boundaries);
    } catch (const Error& e) {
        fail("", "boundaries", e);
        return;
    }

    algorithms::IstdMatch istd;
    try {
        istd = algorithms::findInternalStandard(sample.peaks(), method_.istd);
    } catch (const Error& e) {
        fail("", "istd", e);
        return;
    }

    const algorithms::QuantificationOptions options =
        method_.quantificationFor(sample.name());

    for (const auto& slice : slices) {
        const std::string label = toString(slice.fraction);
        try {
            algorithms::QuantificationBreakdown q = algorithms::quantify(
                sample.peaks(), slice.low, slice.high, istd.peak.area(),
                blank_average, blank_average.fractionArea(slice.fraction),
                method_.calibrationFor(slice.fraction), options);

            io::ResultRecord record;
            record["sample_name"] = sample.name();
            record["acquired_time"] = sample.acquiredTime();
            record["fraction"] = label;
            record["concentration"] = formatFixed(q.concentration,
                                                  options.decimal_places);
            record["area"] = formatNumber(q.area);
            record["istd_area"] = formatNumber(q.istd);
            record["response_ratio"] = formatNumber(q.response_ratio);
            record["dilution_factor"] = formatNumber(options.dilution_factor);
            record["source_file"] = sample.sourceFile();
            result.records.push_back(std::move(record));
        } catch (const Error& e) {
            fail(label, "quantify", e);
        }
    }
}

BatchResult BatchProcessor::run(const std::vector<SampleRun>& blanks,
                                const std::vector<SampleRun>& samples) const {
    BatchResult result;
    result.blank_average = buildBlankAverage(blanks);

    const int total = static_cast<int>(samples.size());
    for (const auto& sample : samples) {
        quantifySample(sample, *result.blank_average, result);
        ++result.samples_processed;

        if (options_.progress_callback &&
            !options_.progress_callback(static_cast<int>(result.samples_processed),
                                        total)) {
            break;  // User cancelled
        }
    }
    return result;
}

} // namespace trh
