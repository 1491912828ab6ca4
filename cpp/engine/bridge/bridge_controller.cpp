#include "engine/bridge/bridge_controller.hpp"

#include "engine/bridge/bridge_sweep.hpp"
#include "engine/core/error.hpp"
#include "engine/core/text.hpp"
#include "engine/portal/resonance_portal.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace gate {

void BridgeConfig::validate_or_throw() const {
  if (!std::isfinite(base_frequency_hz) || base_frequency_hz <= 0.0) {
    throw ValidationError("BridgeConfig: base_frequency_hz must be > 0");
  }
  if (!std::isfinite(detune_hz)) {
    throw ValidationError("BridgeConfig: detune_hz must be finite");
  }
  if (!std::isfinite(energy_rate_W) || energy_rate_W < 0.0) {
    throw ValidationError("BridgeConfig: energy_rate_W must be >= 0");
  }
}

BridgeConfig BridgeConfig::from_settings(const SimSettings& s) {
  BridgeConfig c;
  c.base_frequency_hz = s.resonance.nominal_frequency_hz;
  c.detune_hz = s.resonance.detune_default_hz;
  c.energy_rate_W = s.resonance.energy_rate_W;
  return c;
}

namespace {

std::unique_ptr<IPortal> make_portal(const BridgeConfig& cfg, double freq_hz, const SimSettings& s) {
  cfg.validate_or_throw();
  return std::make_unique<ResonancePortal>(freq_hz, cfg.energy_rate_W, s.portal);
}

}  // namespace

BridgeController::BridgeController(const BridgeConfig& cfg,
                                   const SimSettings& settings,
                                   std::unique_ptr<IRunIdGenerator> run_ids)
    : BridgeController(make_portal(cfg, cfg.base_frequency_hz, settings),
                       make_portal(cfg, cfg.base_frequency_hz + cfg.detune_hz, settings),
                       cfg.detune_hz,
                       settings,
                       std::move(run_ids)) {}

BridgeController::BridgeController(std::unique_ptr<IPortal> portal_a,
                                   std::unique_ptr<IPortal> portal_b,
                                   double detune_hz,
                                   const SimSettings& settings,
                                   std::unique_ptr<IRunIdGenerator> run_ids)
    : portal_a_(std::move(portal_a)),
      portal_b_(std::move(portal_b)),
      detune_hz_(detune_hz),
      settings_(settings),
      run_ids_(std::move(run_ids)) {
  GATE_ENSURE(portal_a_ != nullptr, ErrorCode::kInvalidArgument, "BridgeController: portal_a is null");
  GATE_ENSURE(portal_b_ != nullptr, ErrorCode::kInvalidArgument, "BridgeController: portal_b is null");
  GATE_ENSURE(run_ids_ != nullptr, ErrorCode::kInvalidArgument, "BridgeController: run id generator is null");
  if (!std::isfinite(detune_hz_)) throw ValidationError("BridgeController: detune_hz must be finite");
  settings_.validate_or_throw();
}

void BridgeController::note_(LogLevel lvl, const std::string& msg) {
  status_log_.push_back(std::string("[") + to_string(lvl) + "] " + msg);
  log(lvl, run_id_.value_or("no-run") + ": " + msg);
}

IPortal& BridgeController::portal_(PortalId id) const {
  switch (id) {
    case PortalId::A: return *portal_a_;
    case PortalId::B: return *portal_b_;
  }
  GATE_THROW(ErrorCode::kOutOfRange, "BridgeController: unknown portal id");
}

bool& BridgeController::lock_flag_(PortalId id) {
  switch (id) {
    case PortalId::A: return locked_a_;
    case PortalId::B: return locked_b_;
  }
  GATE_THROW(ErrorCode::kOutOfRange, "BridgeController: unknown portal id");
}

// ----------------------------- Run initialization ----------------------------

void BridgeController::initialize_run(std::optional<double> payload_volume_L,
                                      std::optional<double> payload_mass_kg,
                                      std::optional<double> floor_temp_a_C,
                                      std::optional<bool> floor_contact_a,
                                      std::optional<double> floor_temp_b_C,
                                      std::optional<bool> floor_contact_b) {
  portal_a_->reset();
  portal_b_->reset();
  portal_a_->sense_payload(payload_volume_L, payload_mass_kg);
  portal_b_->sense_payload(payload_volume_L, payload_mass_kg);
  portal_a_->floor_sensor(floor_temp_a_C, floor_contact_a);
  portal_b_->floor_sensor(floor_temp_b_C, floor_contact_b);

  status_log_.clear();
  unlock_all();
  run_id_ = run_ids_->next();
  note_(LogLevel::INFO, "Run " + *run_id_ + " initialized.");
}

void BridgeController::initialize_run(const RunInputs& in) {
  initialize_run(in.payload_volume_L, in.payload_mass_kg,
                 in.floor_temp_a_C, in.floor_contact_a,
                 in.floor_temp_b_C, in.floor_contact_b);
}

// ----------------------------- Bridge formation ------------------------------

BridgeInputs BridgeController::current_inputs(double energy_input_J) const noexcept {
  BridgeInputs in;
  in.energy_input_J = energy_input_J;
  in.energy_a_J = portal_a_->energy_J();
  in.stability_a = portal_a_->stability();
  in.stability_b = portal_b_->stability();
  in.safe_a = portal_a_->safety_status();
  in.safe_b = portal_b_->safety_status();
  in.detune_hz = detune_hz_;
  return in;
}

void BridgeController::form_bridge(std::optional<double> energy_input_J) {
  const double e_in = energy_input_J.value_or(std::min(portal_a_->energy_J(), portal_b_->energy_J()));

  // NaN fails the comparison and is stored as 0 as well.
  transfer_energy_J_ = (e_in > 0.0) ? e_in : 0.0;

  const BridgeStrength bs = compute_bridge_strength(current_inputs(e_in), settings_);
  bridge_strength_ = bs.strength;

  if (bs.stability_penalty) {
    note_(LogLevel::WARN, "Portal stability below threshold - bridge degraded.");
  }
  if (bs.safety_veto) {
    note_(LogLevel::ERROR, "Safety failure - bridge formation blocked.");
  }
  if (bs.at_maximum) {
    note_(LogLevel::INFO, "Bridge formed at maximum strength.");
  } else {
    note_(LogLevel::INFO, "Bridge strength updated: " + text::fixed(bridge_strength_, 2));
  }
}

// ----------------------------- Payload transfer ------------------------------

TransferOutcome BridgeController::transfer_payload() {
  const BridgeSettings& b = settings_.bridge;

  if (bridge_strength_ < b.min_transfer_strength) {
    note_(LogLevel::WARN, "Transfer failed: bridge strength " + text::fixed(bridge_strength_, 3) +
                              " < " + text::fixed(b.min_transfer_strength, 3) + " minimum");
    return TransferOutcome::fail(TransferFailure::InsufficientBridgeStrength);
  }

  const double available_J = std::min(portal_a_->energy_J(), portal_b_->energy_J());
  transfer_energy_J_ = available_J * bridge_strength_ * b.transfer_efficiency;

  if (!(transfer_energy_J_ > b.min_transfer_energy_J)) {
    note_(LogLevel::WARN, "Transfer failed: insufficient transfer energy " + text::fixed(transfer_energy_J_, 1) +
                              " J (need > " + text::fixed(b.min_transfer_energy_J, 1) + " J)");
    return TransferOutcome::fail(TransferFailure::InsufficientTransferEnergy);
  }

  const double consumed_J = transfer_energy_J_ * b.transfer_overhead_frac;
  portal_a_->debit_energy(consumed_J);
  portal_b_->debit_energy(consumed_J);
  portal_a_->clear_payload();
  portal_b_->clear_payload();
  bridge_strength_ = 0.0;
  unlock_all();

  note_(LogLevel::INFO, "Transfer success: " + text::fixed(transfer_energy_J_, 1) +
                            " J transferred, payloads cleared");

  TransferOutcome out;
  out.success = true;
  out.energy_transferred_J = transfer_energy_J_;
  out.energy_consumed_J = consumed_J;
  out.payloads_cleared = true;
  out.bridge_reset = true;
  return out;
}

// ----------------------------- Status ----------------------------------------

std::vector<std::string> BridgeController::full_status() const {
  auto portal_line = [](const char* label, const IPortal& p) {
    return std::string("Portal ") + label + " freq: " + text::fixed(p.freq_hz(), 3) +
           " Hz, stability: " + text::fixed(p.stability(), 2) +
           ", safety: " + text::yes_no(p.safety_status());
  };

  std::vector<std::string> report;
  report.push_back("Run ID: " + run_id_.value_or("None"));
  report.push_back(portal_line("A", *portal_a_));
  report.push_back(portal_line("B", *portal_b_));
  report.push_back("Detune: " + text::fixed(detune_hz_, 3) + " Hz");
  report.push_back("Bridge strength: " + text::fixed(bridge_strength_, 2) +
                   ", transfer energy: " + text::fixed(transfer_energy_J_, 2) + " J");
  report.push_back("Status log:");

  for (auto& line : portal_a_->report_status()) report.push_back(std::move(line));
  for (auto& line : portal_b_->report_status()) report.push_back(std::move(line));
  report.insert(report.end(), status_log_.begin(), status_log_.end());
  return report;
}

// ----------------------------- Reset -----------------------------------------

void BridgeController::reset() {
  portal_a_->reset();
  portal_b_->reset();
  bridge_strength_ = 0.0;
  transfer_energy_J_ = 0.0;
  status_log_.clear();
  unlock_all();
  if (run_id_) log(LogLevel::INFO, *run_id_ + ": run reset");
  run_id_.reset();
}

// ----------------------------- Operator controls -----------------------------

void BridgeController::set_portal_power(PortalId id, bool on) {
  IPortal& p = portal_(id);
  p.set_powered(on);
  if (!on) lock_flag_(id) = false;
  note_(LogLevel::INFO, std::string("Portal ") + to_string(id) + (on ? " powered on." : " powered down."));
}

void BridgeController::adjust_portal_energy(PortalId id, EnergyAdjust dir) {
  IPortal& p = portal_(id);
  const std::string label = std::string("Portal ") + to_string(id);
  if (!p.powered()) {
    note_(LogLevel::WARN, label + " energy adjustment ignored: portal powered down.");
    return;
  }

  const double step_J = settings_.portal.energy_step_J;
  if (dir == EnergyAdjust::Increase) {
    p.credit_energy(step_J);
    note_(LogLevel::INFO, label + " energy increased to " + text::fixed(p.energy_J(), 1) + " J");
  } else {
    p.debit_energy(step_J);
    note_(LogLevel::INFO, label + " energy decreased to " + text::fixed(p.energy_J(), 1) + " J");
  }
}

PortalScan BridgeController::scan_portal(PortalId id) const {
  const IPortal& p = portal_(id);
  PortalScan s;
  s.portal = id;
  s.freq_hz = p.freq_hz();
  s.energy_J = p.energy_J();
  s.stability = p.stability();
  s.safe = p.safety_status();
  s.has_payload = p.has_payload();
  s.powered = p.powered();
  s.locked = portal_locked(id);
  return s;
}

bool BridgeController::portal_locked(PortalId id) const {
  switch (id) {
    case PortalId::A: return locked_a_;
    case PortalId::B: return locked_b_;
  }
  GATE_THROW(ErrorCode::kOutOfRange, "BridgeController: unknown portal id");
}

bool BridgeController::lock_portal(PortalId id) {
  const IPortal& p = portal_(id);
  const std::string label = std::string("Portal ") + to_string(id);

  const char* refusal = nullptr;
  if (!p.powered()) {
    refusal = "portal powered down";
  } else if (!p.safety_status()) {
    refusal = "safety fault";
  } else if (!p.has_payload()) {
    refusal = "no payload";
  }

  bool& flag = lock_flag_(id);
  if (refusal) {
    flag = false;
    note_(LogLevel::WARN, label + " lock refused: " + refusal + ".");
    return false;
  }

  const bool was_ready = transport_ready();
  flag = true;
  note_(LogLevel::INFO, label + " locked for transport.");
  if (!was_ready && transport_ready()) {
    note_(LogLevel::INFO, "Transport ready: both portals locked.");
  }
  return true;
}

void BridgeController::unlock_all() noexcept {
  locked_a_ = false;
  locked_b_ = false;
}

bool BridgeController::apply_optimal(const SweepReport& report) {
  if (!report.approved || report.points.empty()) {
    note_(LogLevel::WARN, "Apply optimal refused: sweep not approved.");
    return false;
  }

  note_(LogLevel::INFO, "Applying optimal energy input " + text::fixed(report.optimal.energy_input_J, 1) +
                            " J (detune held at " + text::fixed(detune_hz_, 3) + " Hz)");
  form_bridge(report.optimal.energy_input_J);
  return true;
}

}  // namespace gate
