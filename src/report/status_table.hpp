#pragma once

#include "report/run_report.hpp"

#include <cstddef>
#include <string>

namespace comfytest::report {

// Cell text for one level: PASS, FAIL, SKIP, or `--` when the level was not
// requested (or never reached a terminal state).
const char* StatusCell(const LevelResult& result);

// Level-by-platform table printed at the end of `run`, followed by one line
// per failed level and up to `max_diagnostics` diagnostics under each.
std::string RenderStatusTable(const RunReport& report, std::size_t max_diagnostics = 10);

} // namespace comfytest::report
