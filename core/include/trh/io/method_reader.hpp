#pragma once

#include "../method.hpp"
#include "../errors.hpp"
#include <string>

namespace trh {
namespace io {

/**
 * @brief Reader for XML quantification method files.
 *
 * Expected layout:
 * @code
 * <trhMethod name="TRH GC-MS" mode="full" decimalPlaces="2">
 *   <boundaries c6c10End="5.2" c10c16Start="5.2" c10c16End="9.8"
 *               c16c34End="17.4" c34c40End="20.1"/>
 *   <istd rt="8.45" rtTolerance="0.1" area="250000" areaTolerance="75000"
 *         concentration="20"/>
 *   <dilution default="1">
 *     <sample name="S-104" factor="10"/>
 *   </dilution>
 *   <calibration fraction="C10-C16" slope="0.82" intercept="0.01"/>
 * </trhMethod>
 * @endcode
 *
 * Mode is "c6c10" or "full". Only the boundaries used by the mode are
 * required, and every fraction of the mode needs a calibration. The parsed
 * method is checked with MethodConfig::validate().
 */
class MethodReader {
public:
    MethodReader() = default;

    /**
     * @brief Read a method file.
     *
     * @param filename Path to the XML method file
     * @return Parsed method
     * @throws MethodParseError if the file cannot be read or is invalid
     */
    MethodConfig read(const std::string& filename) const;

    /**
     * @brief Parse method XML from a string.
     *
     * @throws MethodParseError if the content is invalid
     */
    MethodConfig parseString(const std::string& content) const;
};

/**
 * @brief Convenience function to load a method file.
 */
inline MethodConfig loadMethod(const std::string& filename) {
    MethodReader reader;
    return reader.read(filename);
}

} // namespace io
} // namespace trh
