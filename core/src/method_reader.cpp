#include "trh/io/method_reader.hpp"
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <stdexcept>
#include <pugixml.hpp>

namespace trh {
namespace io {

namespace {

// Element and attribute names of the method format
namespace xml {
    constexpr const char* ROOT = "trhMethod";
    constexpr const char* BOUNDARIES = "boundaries";
    constexpr const char* ISTD = "istd";
    constexpr const char* DILUTION = "dilution";
    constexpr const char* SAMPLE = "sample";
    constexpr const char* CALIBRATION = "calibration";

    constexpr const char* MODE_C6_C10 = "c6c10";
    constexpr const char* MODE_FULL = "full";
}

std::string describe(pugi::xml_node node, const char* attr) {
    return std::string("attribute '") + attr + "' of <" + node.name() + ">";
}

double parseDouble(pugi::xml_node node, const char* attr, const char* text) {
    errno = 0;
    char* end = nullptr;
    double value = std::strtod(text, &end);
    if (end == text || *end != '\0' || errno == ERANGE || !std::isfinite(value)) {
        throw MethodParseError("Invalid number '" + std::string(text) + "' in " +
                               describe(node, attr));
    }
    return value;
}

double requiredDouble(pugi::xml_node node, const char* attr) {
    pugi::xml_attribute a = node.attribute(attr);
    if (!a) {
        throw MethodParseError("Missing " + describe(node, attr));
    }
    return parseDouble(node, attr, a.value());
}

double optionalDouble(pugi::xml_node node, const char* attr, double fallback) {
    pugi::xml_attribute a = node.attribute(attr);
    return a ? parseDouble(node, attr, a.value()) : fallback;
}

pugi::xml_node requiredChild(pugi::xml_node parent, const char* name) {
    pugi::xml_node child = parent.child(name);
    if (!child) {
        throw MethodParseError(std::string("Missing <") + name + "> element");
    }
    return child;
}

void parseBoundaries(pugi::xml_node node, MethodConfig& method) {
    auto& b = method.boundaries;
    if (method.mode == AnalysisMode::C6_C10) {
        b.c6_c10_end = requiredDouble(node, "c6c10End");
        return;
    }
    b.c6_c10_end = optionalDouble(node, "c6c10End", 0.0);
    b.c10_c16_start = requiredDouble(node, "c10c16Start");
    b.c10_c16_end = requiredDouble(node, "c10c16End");
    b.c16_c34_end = requiredDouble(node, "c16c34End");
    b.c34_c40_end = requiredDouble(node, "c34c40End");
}

void parseIstd(pugi::xml_node node, MethodConfig& method) {
    method.istd.rt = requiredDouble(node, "rt");
    method.istd.rt_tolerance = requiredDouble(node, "rtTolerance");
    method.istd.area = requiredDouble(node, "area");
    method.istd.area_tolerance = requiredDouble(node, "areaTolerance");
    method.istd_concentration = requiredDouble(node, "concentration");
}

void parseDilution(pugi::xml_node node, MethodConfig& method) {
    if (!node) return;

    method.default_dilution = optionalDouble(node, "default", 1.0);
    for (auto sample : node.children(xml::SAMPLE)) {
        std::string name = sample.attribute("name").value();
        if (name.empty()) {
            throw MethodParseError("Missing " + describe(sample, "name"));
        }
        method.sample_dilutions[name] = requiredDouble(sample, "factor");
    }
}

void parseCalibrations(pugi::xml_node root, MethodConfig& method) {
    for (auto cal : root.children(xml::CALIBRATION)) {
        std::string label = cal.attribute("fraction").value();
        Fraction fraction = Fraction::C6_C10;
        if (!parseFraction(label, fraction)) {
            throw MethodParseError("Unknown fraction '" + label + "' in " +
                                   describe(cal, "fraction"));
        }
        if (method.calibrations.count(fraction) != 0) {
            throw MethodParseError("Duplicate calibration for fraction " + label);
        }
        method.calibrations[fraction] = algorithms::CalibrationModel(
            requiredDouble(cal, "slope"), requiredDouble(cal, "intercept"));
    }
}

MethodConfig parseDocument(const pugi::xml_document& doc) {
    pugi::xml_node root = doc.child(xml::ROOT);
    if (!root) {
        throw MethodParseError(std::string("No <") + xml::ROOT + "> element found");
    }

    MethodConfig method;
    method.name = root.attribute("name").value();

    std::string mode = root.attribute("mode").as_string(xml::MODE_FULL);
    if (mode == xml::MODE_C6_C10) {
        method.mode = AnalysisMode::C6_C10;
    } else if (mode == xml::MODE_FULL) {
        method.mode = AnalysisMode::FULL_TRH;
    } else {
        throw MethodParseError("Unknown analysis mode '" + mode + "'");
    }

    if (auto places = root.attribute("decimalPlaces")) {
        double value = parseDouble(root, "decimalPlaces", places.value());
        if (value < 0.0 || value > 15.0 || value != std::floor(value)) {
            throw MethodParseError("decimalPlaces must be an integer in 0-15");
        }
        method.decimal_places = static_cast<int>(value);
    }

    parseBoundaries(requiredChild(root, xml::BOUNDARIES), method);
    parseIstd(requiredChild(root, xml::ISTD), method);
    parseDilution(root.child(xml::DILUTION), method);
    parseCalibrations(root, method);

    try {
        method.validate();
    } catch (const std::invalid_argument& e) {
        throw MethodParseError(e.what());
    }
    return method;
}

} // namespace

MethodConfig MethodReader::read(const std::string& filename) const {
    pugi::xml_document doc;
    pugi::xml_parse_result result = doc.load_file(filename.c_str());

    if (!result) {
        throw MethodParseError("Failed to parse file " + filename + ": " +
                               std::string(result.description()));
    }

    try {
        return parseDocument(doc);
    } catch (const MethodParseError& e) {
        throw MethodParseError(filename + ": " + e.detail());
    }
}

MethodConfig MethodReader::parseString(const std::string& content) const {
    pugi::xml_document doc;
    pugi::xml_parse_result result = doc.load_string(content.c_str());

    if (!result) {
        throw MethodParseError("Failed to parse content: " +
                               std::string(result.description()));
    }
    return parseDocument(doc);
}

} // namespace io
} // namespace trh
