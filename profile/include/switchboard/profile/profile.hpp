#pragma once
#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <switchboard/common/types.hpp>
#include <switchboard/monitor/accuracy_metrics.hpp>
#include <switchboard/monitor/accuracy_monitor.hpp>
#include <switchboard/prediction/catalog.hpp>
#include <switchboard/quota/pool_manager.hpp>
#include <switchboard/routing/engine.hpp>
#include <vector>

namespace switchboard {

  inline constexpr const char* ENGINE_PROFILE_VERSION = "1";

  /// Pool entry as written in the profile; the key is either inline or read from the
  /// environment when the profile is resolved
  struct PoolSpec {
    std::string pool_id;
    Provider provider = Provider::OpenAI;
    std::string api_key;
    std::string api_key_env;
    int daily_limit = 0;
    int priority = 5;

    /// Throws std::runtime_error when api_key_env names an unset variable
    [[nodiscard]] PoolConfig resolve() const;
  };

  struct QuotaProfile {
    int instant_daily_limit = 25;
    double upgrade_prompt_ratio = 0.8;
    int reset_poll_seconds = 30;
  };

  struct RoutingProfile {
    StrategyWeights balanced_weights;
    double min_cost = 1e-6;
    double min_latency_ms = 1.0;
    int chars_per_token = 4;
    int default_completion_tokens = 256;
    size_t confidence_samples = 10;
    double heuristic_quality = 0.7;
    double clean_stop_bonus = 0.1;
    size_t decision_log_capacity = 1000;
  };

  struct MonitoringProfile {
    PerformanceThresholds thresholds;
    DriftOptions drift;
    double learning_rate = 0.1;
    int alert_cooldown_seconds = 300;
    size_t max_history = 1000;
    size_t baseline_window = 50;
    size_t drift_window = 50;
    size_t queue_capacity = 10000;
    double default_quality = 0.7;
    SamplingOptions sampling;
  };

  /// Accuracy baseline pinned for one (provider, model) pair
  struct BaselineSpec {
    Provider provider = Provider::OpenAI;
    std::string model;
    double overall_accuracy = 0.0;
    double overall_stddev = 0.0;
    double cost_accuracy = 0.0;
    double latency_accuracy = 0.0;
    double quality_accuracy = 0.0;
    size_t sample_size = 0;

    [[nodiscard]] AccuracyMetrics to_metrics() const;
  };

  struct EngineProfile {
    std::string version = ENGINE_PROFILE_VERSION;
    std::string log_level = "info";
    std::vector<ModelSpec> models;
    std::vector<PoolSpec> pools;
    QuotaProfile quota;
    RoutingProfile routing;
    MonitoringProfile monitoring;
    std::vector<BaselineSpec> baselines;
    std::map<Provider, std::string> endpoints;  // base URL overrides
    std::optional<std::string> calibration_path;

    [[nodiscard]] static EngineProfile from_json(const std::string& path);
    [[nodiscard]] static EngineProfile from_json_string(const std::string& json_str);

    /// MessagePack encoding of the same document
    [[nodiscard]] static EngineProfile from_binary_string(const std::string& data);

    void to_json(const std::string& path) const;
    [[nodiscard]] std::string to_json_string() const;
    [[nodiscard]] std::string to_binary_string() const;

    /// Throws std::invalid_argument describing the first problem found
    void validate() const;

    // Option structs for the components built from this profile
    [[nodiscard]] QuotaOptions quota_options() const;
    [[nodiscard]] MonitorOptions monitor_options() const;
    [[nodiscard]] EngineOptions engine_options() const;
    [[nodiscard]] std::vector<PoolConfig> resolve_pools() const;

    /// Configured base URL, or the provider's public endpoint
    [[nodiscard]] std::string endpoint(Provider provider) const;
  };

}  // namespace switchboard
