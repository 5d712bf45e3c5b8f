#include "xtalview/app/Runner.hpp"

#include <cstddef>
#include <iomanip>
#include <iostream>
#include <string>

#include "xtalview/app/Pipeline.hpp"
#include "xtalview/build/LatticeBuilder.hpp"
#include "xtalview/build/Replicator.hpp"
#include "xtalview/build/WireBuilder.hpp"
#include "xtalview/core/UnitCell.hpp"
#include "xtalview/render/Scene.hpp"

namespace {

void log_cell_parameters(const std::string& label, const xtalview::CellParameters& p) {
  std::cerr << "  " << label << ": a=" << p.a << " b=" << p.b << " c=" << p.c
            << " alpha=" << p.alpha << " beta=" << p.beta << " gamma=" << p.gamma << "\n";
}

void log_scene(const xtalview::render::Scene& s) {
  std::cerr << "[xtalview] " << s.title << "\n";
  std::cerr << "  atoms: " << s.atoms.size() << "\n";
  std::cerr << "  species:";
  for (const auto& g : s.groups) {
    std::cerr << " " << g.species << "=" << g.idx.size() << "(" << g.style.color << ")";
  }
  std::cerr << "\n";
  log_cell_parameters("cell", xtalview::cell_parameters(s.atoms.cell));

  const auto deg = s.bonds.degree();
  std::size_t deg_sum = 0;
  for (const auto d : deg) deg_sum += d;
  std::cerr << "  bonds: " << s.bonds.edge_count() << " (threshold " << s.bonds.threshold << ")\n";
  std::cerr << "  mean_coordination: "
            << (deg.empty() ? 0.0 : static_cast<double>(deg_sum) / static_cast<double>(deg.size())) << "\n";

  const auto& f = s.frame;
  std::cerr << "  view_center: (" << f.center[0] << ", " << f.center[1] << ", " << f.center[2] << ")\n";
  std::cerr << "  view_half_extent: " << f.half_extent << "\n";
  std::cerr << "  cell_edges: " << f.cell_edges.size() << "\n";
}

void log_render_settings(const xtalview::SharedParams& sh) {
  const auto& r = sh.render;
  std::cerr << "[xtalview] render settings\n"
            << "  atom_size: " << r.atom_size << " atom_alpha: " << r.atom_alpha << "\n"
            << "  bond_width: " << r.bond_width << " bond_alpha: " << r.bond_alpha << "\n"
            << "  initial_view: elev=" << r.elev << " azim=" << r.azim << "\n";
}

} // namespace

namespace xtalview {

Runner::Runner(const IniConfig& cfg, std::optional<RunMode> mode) : cfg_(cfg), rc_(load_run_config(cfg)) {
  if (mode) rc_.mode = *mode;
}

int Runner::validate_config() {
  if (rc_.mode == RunMode::Compare) {
    const UnitCell b2 = build::make_b2_cell(rc_.b2);
    const UnitCell b19p = build::make_b19p_cell(rc_.b19p);
    build::validate_repeat_counts(rc_.b2_repeat);
    build::validate_repeat_counts(rc_.b19p_repeat);
    if (rc_.shared.expected_atoms) {
      const std::size_t n_b2 = b2.size() * rc_.b2_repeat.product();
      const std::size_t n_b19p = b19p.size() * rc_.b19p_repeat.product();
      if (n_b2 != *rc_.shared.expected_atoms || n_b19p != *rc_.shared.expected_atoms) {
        throw InvalidParameterError("Runner: repeat counts give " + std::to_string(n_b2) + " (B2) and " +
                                    std::to_string(n_b19p) + " (B19') atoms, expected " +
                                    std::to_string(*rc_.shared.expected_atoms));
      }
    }
  } else {
    (void)build::make_b2_cell(rc_.wire.lattice);
    (void)build::wire_repeat_counts(rc_.wire);
  }

  std::cerr << "[xtalview] validation OK (no structure built)\n"
            << "         config=" << cfg_.source() << "\n"
            << "         mode=" << run_mode_name(rc_.mode) << "\n";
  return 0;
}

int Runner::run() {
  std::cerr << std::fixed << std::setprecision(3);
  std::cerr << "[xtalview] config: " << cfg_.source() << " mode=" << run_mode_name(rc_.mode) << "\n";

  if (rc_.mode == RunMode::Compare) {
    std::cerr << "[xtalview] creating B2 austenite and B19' martensite structures...\n";
    const auto cmp = app::build_phase_comparison(rc_);
    log_cell_parameters("B2 unit cell", cmp.b2_cell.parameters());
    log_cell_parameters("B19' unit cell", cmp.b19p_cell.parameters());
    log_scene(cmp.austenite);
    log_scene(cmp.martensite);
  } else {
    std::cerr << "[xtalview] creating wire structure...\n";
    const auto ws = app::build_wire_scene(rc_);
    const auto& n = ws.wire.repeats;
    std::cerr << "  block: " << n.nx << "x" << n.ny << "x" << n.nz
              << " cells, radius " << ws.wire.region.radius << "\n";
    log_scene(ws.scene);
  }

  log_render_settings(rc_.shared);
  return 0;
}

} // namespace xtalview
