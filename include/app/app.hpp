#pragma once

#include <iosfwd>
#include <string>
#include <vector>

namespace tokenmeter {

inline constexpr int kExitOk = 0;
inline constexpr int kExitFatal = 1;
inline constexpr int kExitUsage = 2;

/**
 * @brief Full command-line pipeline: flags, config, read, filter, aggregate,
 *        render.
 *
 * Reports and "no data" notices go to `out`, errors and usage text to `err`.
 * Diagnostics still go through utils::log.
 *
 * @param args Arguments without the program name
 * @return kExitOk, kExitFatal or kExitUsage
 */
[[nodiscard]] int run_app(const std::vector<std::string>& args,
                          std::ostream& out,
                          std::ostream& err,
                          const std::string& prog = "tokenmeter");

} // namespace tokenmeter
