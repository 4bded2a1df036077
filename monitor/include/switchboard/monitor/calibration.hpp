#pragma once
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <switchboard/common/types.hpp>
#include <switchboard/monitor/accuracy_metrics.hpp>
#include <utility>

namespace switchboard {

  inline constexpr const char* CALIBRATION_CHECKPOINT_VERSION = "1.0";

  /// "provider/model"
  [[nodiscard]] std::string calibration_key(Provider provider, const std::string& model);
  [[nodiscard]] std::pair<Provider, std::string> parse_calibration_key(const std::string& key);

  // Learned corrections for one (provider, model) pair
  struct CalibrationEntry {
    double cost_factor = 1.0;
    double latency_factor = 1.0;
    std::optional<double> learned_quality;
    double quality_accuracy = 1.0;
    std::uint64_t samples = 0;
    double drift_penalty = 0.0;  // [0, 1); scales confidence and routing score down
  };

  // Immutable once published; readers hold a shared_ptr for the duration of a request
  struct CalibrationSnapshot {
    std::map<std::string, CalibrationEntry> entries;
    std::uint64_t version = 0;

    [[nodiscard]] const CalibrationEntry* find(Provider provider, const std::string& model) const;
  };

  struct CalibrationOptions {
    double learning_rate = 0.1;
    double min_factor = 0.1;
    double max_factor = 10.0;
  };

  /// Copy-on-write calibration store: writers publish a new snapshot, readers never block
  /// on the monitor's processing.
  class CalibrationTable {
  public:
    explicit CalibrationTable(CalibrationOptions options = {});

    CalibrationTable(const CalibrationTable&) = delete;
    CalibrationTable& operator=(const CalibrationTable&) = delete;

    [[nodiscard]] std::shared_ptr<const CalibrationSnapshot> snapshot() const;

    /// Moves the pair's factors toward actual/predicted by one learning-rate step
    void observe(const CandidatePrediction& predicted, const ExecutionOutcome& actual,
                 std::optional<double> observed_quality, double quality_accuracy);

    void set_drift_penalty(Provider provider, const std::string& model, double penalty);
    void replace(CalibrationSnapshot snapshot);

    [[nodiscard]] const CalibrationOptions& options() const noexcept { return options_; }

  private:
    void publish_locked(CalibrationSnapshot next);

    CalibrationOptions options_;
    mutable std::mutex mutex_;
    std::shared_ptr<const CalibrationSnapshot> current_;
  };

  // =============================================================================
  // CalibrationCheckpoint
  // =============================================================================

  /// Persisted monitor state: calibration entries plus accuracy baselines
  struct CalibrationCheckpoint {
    std::string version = CALIBRATION_CHECKPOINT_VERSION;
    std::map<std::string, CalibrationEntry> entries;
    std::map<std::string, AccuracyMetrics> baselines;

    [[nodiscard]] static CalibrationCheckpoint from_json(const std::string& path);
    [[nodiscard]] static CalibrationCheckpoint from_json_string(const std::string& json_str);
    [[nodiscard]] static CalibrationCheckpoint from_msgpack(const std::string& path);
    [[nodiscard]] static CalibrationCheckpoint from_msgpack_string(const std::string& data);

    void to_json(const std::string& path) const;
    [[nodiscard]] std::string to_json_string() const;
    void to_msgpack(const std::string& path) const;
    [[nodiscard]] std::string to_msgpack_string() const;

    void validate() const;
  };

}  // namespace switchboard
