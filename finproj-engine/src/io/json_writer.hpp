#ifndef FINPROJ_IO_JSON_WRITER_HPP
#define FINPROJ_IO_JSON_WRITER_HPP

#include <ostream>
#include <string>
#include "../forecaster.hpp"

namespace finproj {
namespace io {

// Write ForecastResult to JSON format
// The output includes resolved assumptions with provenance, the opening
// position, every period's five statements, warnings and the backtest
void write_forecast_result_json(std::ostream& os, const ForecastResult& result,
                                bool pretty_print = true);

// Write ForecastResult to JSON file
void write_forecast_result_json(const std::string& filepath, const ForecastResult& result,
                                bool pretty_print = true);

} // namespace io
} // namespace finproj

#endif // FINPROJ_IO_JSON_WRITER_HPP
