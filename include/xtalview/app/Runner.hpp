#pragma once

#include <iosfwd>
#include <optional>

#include "xtalview/config/IniConfig.hpp"
#include "xtalview/config/SceneConfig.hpp"

namespace xtalview {

// Runner: main() only handles CLI + config, then calls Runner(cfg).run().
// Runner loads the RunConfig, builds the scenes for the configured mode and
// logs a summary for each structure. A mode given here replaces [run] mode.
class Runner {
public:
  explicit Runner(const IniConfig& cfg, std::optional<RunMode> mode = std::nullopt);

  // Execute the run. Returns 0 on success.
  int run();

  // Load and validate the config, including lattice parameters and repeat
  // counts, without building any structure (CLI: --validate-config).
  int validate_config();

  const RunConfig& config() const { return rc_; }

private:
  const IniConfig& cfg_;
  RunConfig rc_;
};

} // namespace xtalview
