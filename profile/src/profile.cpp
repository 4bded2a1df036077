#include <cstdlib>
#include <format>
#include <fstream>
#include <nlohmann/json.hpp>
#include <set>
#include <sstream>
#include <stdexcept>
#include <switchboard/common/json.hpp>
#include <switchboard/common/tracy.hpp>
#include <switchboard/profile/profile.hpp>
#include <switchboard/providers/wire.hpp>

namespace switchboard {

  // ============================================================================
  // JSON Serialization - Config Structs
  // ============================================================================

  void to_json(json& j, const PoolSpec& p) {
    j = json{{"pool_id", p.pool_id},
             {"provider", p.provider},
             {"daily_limit", p.daily_limit},
             {"priority", p.priority}};
    if (!p.api_key_env.empty()) {
      j["api_key_env"] = p.api_key_env;
    } else {
      j["api_key"] = p.api_key;
    }
  }

  void from_json(const json& j, PoolSpec& p) {
    j.at("pool_id").get_to(p.pool_id);
    j.at("provider").get_to(p.provider);
    j.at("daily_limit").get_to(p.daily_limit);
    p.api_key = j.value("api_key", "");
    p.api_key_env = j.value("api_key_env", "");
    p.priority = j.value("priority", 5);
  }

  void to_json(json& j, const QuotaProfile& q) {
    j = json{{"instant_daily_limit", q.instant_daily_limit},
             {"upgrade_prompt_ratio", q.upgrade_prompt_ratio},
             {"reset_poll_seconds", q.reset_poll_seconds}};
  }

  void from_json(const json& j, QuotaProfile& q) {
    q.instant_daily_limit = j.value("instant_daily_limit", 25);
    q.upgrade_prompt_ratio = j.value("upgrade_prompt_ratio", 0.8);
    q.reset_poll_seconds = j.value("reset_poll_seconds", 30);
  }

  void to_json(json& j, const RoutingProfile& r) {
    j = json{{"balanced_weights",
              {{"cost", r.balanced_weights.cost},
               {"speed", r.balanced_weights.speed},
               {"quality", r.balanced_weights.quality}}},
             {"min_cost", r.min_cost},
             {"min_latency_ms", r.min_latency_ms},
             {"chars_per_token", r.chars_per_token},
             {"default_completion_tokens", r.default_completion_tokens},
             {"confidence_samples", r.confidence_samples},
             {"heuristic_quality", r.heuristic_quality},
             {"clean_stop_bonus", r.clean_stop_bonus},
             {"decision_log_capacity", r.decision_log_capacity}};
  }

  void from_json(const json& j, RoutingProfile& r) {
    if (j.contains("balanced_weights")) {
      const auto& w = j.at("balanced_weights");
      r.balanced_weights.cost = w.value("cost", 0.3);
      r.balanced_weights.speed = w.value("speed", 0.3);
      r.balanced_weights.quality = w.value("quality", 0.4);
    }
    r.min_cost = j.value("min_cost", 1e-6);
    r.min_latency_ms = j.value("min_latency_ms", 1.0);
    r.chars_per_token = j.value("chars_per_token", 4);
    r.default_completion_tokens = j.value("default_completion_tokens", 256);
    r.confidence_samples = j.value("confidence_samples", size_t{10});
    r.heuristic_quality = j.value("heuristic_quality", 0.7);
    r.clean_stop_bonus = j.value("clean_stop_bonus", 0.1);
    r.decision_log_capacity = j.value("decision_log_capacity", size_t{1000});
  }

  void to_json(json& j, const MonitoringProfile& m) {
    j = json{{"thresholds",
              {{"max_response_time_ms", m.thresholds.max_response_time_ms},
               {"max_error_rate", m.thresholds.max_error_rate},
               {"min_accuracy", m.thresholds.min_accuracy},
               {"max_routing_latency_ms", m.thresholds.max_routing_latency_ms},
               {"min_throughput_rps", m.thresholds.min_throughput_rps}}},
             {"drift",
              {{"drift_threshold", m.drift.drift_threshold},
               {"confidence_level", m.drift.confidence_level},
               {"min_sample_size", m.drift.min_sample_size}}},
             {"sampling",
              {{"strategy", std::string(to_string(m.sampling.strategy))},
               {"base_rate", m.sampling.base_rate},
               {"high_volume_rps", m.sampling.high_volume_rps},
               {"slow_request_ms", m.sampling.slow_request_ms},
               {"seed", m.sampling.seed}}},
             {"learning_rate", m.learning_rate},
             {"alert_cooldown_seconds", m.alert_cooldown_seconds},
             {"max_history", m.max_history},
             {"baseline_window", m.baseline_window},
             {"drift_window", m.drift_window},
             {"queue_capacity", m.queue_capacity},
             {"default_quality", m.default_quality}};
  }

  void from_json(const json& j, MonitoringProfile& m) {
    if (j.contains("thresholds")) {
      const auto& t = j.at("thresholds");
      m.thresholds.max_response_time_ms = t.value("max_response_time_ms", 5000.0);
      m.thresholds.max_error_rate = t.value("max_error_rate", 0.05);
      m.thresholds.min_accuracy = t.value("min_accuracy", 0.95);
      m.thresholds.max_routing_latency_ms = t.value("max_routing_latency_ms", 200.0);
      m.thresholds.min_throughput_rps = t.value("min_throughput_rps", 0.0);
    }
    if (j.contains("drift")) {
      const auto& d = j.at("drift");
      m.drift.drift_threshold = d.value("drift_threshold", 0.05);
      m.drift.confidence_level = d.value("confidence_level", 0.95);
      m.drift.min_sample_size = d.value("min_sample_size", size_t{10});
    }
    if (j.contains("sampling")) {
      const auto& s = j.at("sampling");
      auto name = s.value("strategy", std::string("uniform"));
      auto strategy = parse_sampling_strategy(name);
      if (!strategy) {
        throw std::invalid_argument(std::format("unknown sampling strategy '{}'", name));
      }
      m.sampling.strategy = *strategy;
      m.sampling.base_rate = s.value("base_rate", 1.0);
      m.sampling.high_volume_rps = s.value("high_volume_rps", 100.0);
      m.sampling.slow_request_ms = s.value("slow_request_ms", 5000.0);
      m.sampling.seed = s.value("seed", std::uint64_t{0});
    }
    m.learning_rate = j.value("learning_rate", 0.1);
    m.alert_cooldown_seconds = j.value("alert_cooldown_seconds", 300);
    m.max_history = j.value("max_history", size_t{1000});
    m.baseline_window = j.value("baseline_window", size_t{50});
    m.drift_window = j.value("drift_window", size_t{50});
    m.queue_capacity = j.value("queue_capacity", size_t{10000});
    m.default_quality = j.value("default_quality", 0.7);
  }

  void to_json(json& j, const BaselineSpec& b) {
    j = json{{"provider", b.provider},
             {"model", b.model},
             {"overall_accuracy", b.overall_accuracy},
             {"overall_stddev", b.overall_stddev},
             {"cost_accuracy", b.cost_accuracy},
             {"latency_accuracy", b.latency_accuracy},
             {"quality_accuracy", b.quality_accuracy},
             {"sample_size", b.sample_size}};
  }

  void from_json(const json& j, BaselineSpec& b) {
    j.at("provider").get_to(b.provider);
    j.at("model").get_to(b.model);
    j.at("overall_accuracy").get_to(b.overall_accuracy);
    j.at("sample_size").get_to(b.sample_size);
    b.overall_stddev = j.value("overall_stddev", 0.0);
    // per-metric accuracies default to the overall figure
    b.cost_accuracy = j.value("cost_accuracy", b.overall_accuracy);
    b.latency_accuracy = j.value("latency_accuracy", b.overall_accuracy);
    b.quality_accuracy = j.value("quality_accuracy", b.overall_accuracy);
  }

  namespace {

    EngineProfile profile_from(const json& j) {
      EngineProfile profile;
      profile.version = j.value("version", std::string(ENGINE_PROFILE_VERSION));
      profile.log_level = j.value("log_level", std::string("info"));

      j.at("models").get_to(profile.models);
      j.at("pools").get_to(profile.pools);
      if (j.contains("quota")) j.at("quota").get_to(profile.quota);
      if (j.contains("routing")) j.at("routing").get_to(profile.routing);
      if (j.contains("monitoring")) j.at("monitoring").get_to(profile.monitoring);
      if (j.contains("baselines")) j.at("baselines").get_to(profile.baselines);

      if (j.contains("endpoints")) {
        for (const auto& [name, url] : j.at("endpoints").items()) {
          auto provider = parse_provider(name);
          if (!provider) throw std::invalid_argument(std::format("unknown provider '{}'", name));
          profile.endpoints[*provider] = url.get<std::string>();
        }
      }
      if (j.contains("calibration_path") && !j["calibration_path"].is_null()) {
        profile.calibration_path = j["calibration_path"].get<std::string>();
      }

      profile.validate();
      return profile;
    }

    json profile_to(const EngineProfile& profile) {
      json j;
      j["version"] = profile.version;
      j["log_level"] = profile.log_level;
      j["models"] = profile.models;
      j["pools"] = profile.pools;
      j["quota"] = profile.quota;
      j["routing"] = profile.routing;
      j["monitoring"] = profile.monitoring;
      j["baselines"] = profile.baselines;

      json endpoints = json::object();
      for (const auto& [provider, url] : profile.endpoints) {
        endpoints[std::string(to_string(provider))] = url;
      }
      j["endpoints"] = endpoints;
      if (profile.calibration_path) j["calibration_path"] = *profile.calibration_path;
      return j;
    }

  }  // namespace

  // ============================================================================
  // PoolSpec / BaselineSpec
  // ============================================================================

  PoolConfig PoolSpec::resolve() const {
    std::string key = api_key;
    if (!api_key_env.empty()) {
      const char* value = std::getenv(api_key_env.c_str());
      if (value == nullptr || *value == '\0') {
        throw std::runtime_error(std::format("pool '{}': environment variable {} is not set",
                                             pool_id, api_key_env));
      }
      key = value;
    }
    return PoolConfig{.pool_id = pool_id,
                      .provider = provider,
                      .api_key = std::move(key),
                      .daily_limit = daily_limit,
                      .priority = priority};
  }

  AccuracyMetrics BaselineSpec::to_metrics() const {
    AccuracyMetrics m;
    m.cost_accuracy = cost_accuracy;
    m.latency_accuracy = latency_accuracy;
    m.quality_accuracy = quality_accuracy;
    m.overall_accuracy = overall_accuracy;
    m.overall_stddev = overall_stddev;
    m.match_rate = 1.0;
    m.success_rate = 1.0;
    m.sample_size = sample_size;
    return m;
  }

  // ============================================================================
  // JSON / MessagePack I/O
  // ============================================================================

  EngineProfile EngineProfile::from_json(const std::string& path) {
    SWITCHBOARD_ZONE;
    std::ifstream file(path);
    if (!file.is_open()) {
      throw std::runtime_error(std::format("Failed to open profile file: {}", path));
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return from_json_string(buffer.str());
  }

  EngineProfile EngineProfile::from_json_string(const std::string& json_str) {
    SWITCHBOARD_ZONE;
    return profile_from(json::parse(json_str));
  }

  EngineProfile EngineProfile::from_binary_string(const std::string& data) {
    SWITCHBOARD_ZONE;
    return profile_from(json::from_msgpack(data));
  }

  void EngineProfile::to_json(const std::string& path) const {
    std::ofstream file(path);
    if (!file.is_open()) {
      throw std::runtime_error(std::format("Failed to open profile file for writing: {}", path));
    }
    file << to_json_string();
  }

  std::string EngineProfile::to_json_string() const { return profile_to(*this).dump(2); }

  std::string EngineProfile::to_binary_string() const {
    auto bytes = json::to_msgpack(profile_to(*this));
    return std::string(bytes.begin(), bytes.end());
  }

  // ============================================================================
  // Validation
  // ============================================================================

  void EngineProfile::validate() const {
    if (version != ENGINE_PROFILE_VERSION) {
      throw std::invalid_argument(std::format("unsupported profile version '{}' (expected '{}')",
                                              version, ENGINE_PROFILE_VERSION));
    }
    if (models.empty()) throw std::invalid_argument("profile must list at least one model");
    if (pools.empty()) throw std::invalid_argument("profile must list at least one pool");

    std::set<std::string> pool_ids;
    for (const auto& pool : pools) {
      if (pool.pool_id.empty()) throw std::invalid_argument("pool_id must not be empty");
      if (!pool_ids.insert(pool.pool_id).second) {
        throw std::invalid_argument(std::format("duplicate pool '{}'", pool.pool_id));
      }
      if (pool.daily_limit <= 0) {
        throw std::invalid_argument(
            std::format("pool '{}' daily_limit must be positive, got {}", pool.pool_id,
                        pool.daily_limit));
      }
      if (pool.priority < 1 || pool.priority > 10) {
        throw std::invalid_argument(std::format("pool '{}' priority must be within [1, 10], got {}",
                                                pool.pool_id, pool.priority));
      }
      if (pool.api_key.empty() && pool.api_key_env.empty()) {
        throw std::invalid_argument(
            std::format("pool '{}' needs api_key or api_key_env", pool.pool_id));
      }
    }

    if (quota.instant_daily_limit <= 0) {
      throw std::invalid_argument("quota.instant_daily_limit must be positive");
    }
    if (quota.upgrade_prompt_ratio <= 0.0 || quota.upgrade_prompt_ratio > 1.0) {
      throw std::invalid_argument("quota.upgrade_prompt_ratio must be within (0, 1]");
    }
    if (quota.reset_poll_seconds <= 0) {
      throw std::invalid_argument("quota.reset_poll_seconds must be positive");
    }

    if (routing.chars_per_token <= 0) {
      throw std::invalid_argument("routing.chars_per_token must be positive");
    }
    if (routing.heuristic_quality < 0.0 || routing.heuristic_quality > 1.0) {
      throw std::invalid_argument("routing.heuristic_quality must be within [0, 1]");
    }

    if (monitoring.learning_rate <= 0.0 || monitoring.learning_rate > 1.0) {
      throw std::invalid_argument("monitoring.learning_rate must be within (0, 1]");
    }
    if (monitoring.sampling.base_rate < 0.0 || monitoring.sampling.base_rate > 1.0) {
      throw std::invalid_argument("monitoring.sampling.base_rate must be within [0, 1]");
    }
    if (monitoring.alert_cooldown_seconds < 0) {
      throw std::invalid_argument("monitoring.alert_cooldown_seconds must not be negative");
    }

    for (const auto& b : baselines) {
      if (b.overall_accuracy < 0.0 || b.overall_accuracy > 1.0) {
        throw std::invalid_argument(
            std::format("baseline {}/{} overall_accuracy must be within [0, 1]",
                        to_string(b.provider), b.model));
      }
    }
  }

  // ============================================================================
  // Component Options
  // ============================================================================

  QuotaOptions EngineProfile::quota_options() const {
    return QuotaOptions{.instant_daily_limit = quota.instant_daily_limit,
                        .upgrade_prompt_ratio = quota.upgrade_prompt_ratio};
  }

  MonitorOptions EngineProfile::monitor_options() const {
    MonitorOptions options;
    options.thresholds = monitoring.thresholds;
    options.drift = monitoring.drift;
    options.calibration.learning_rate = monitoring.learning_rate;
    options.sampling = monitoring.sampling;
    options.alert_cooldown = std::chrono::seconds{monitoring.alert_cooldown_seconds};
    options.max_history = monitoring.max_history;
    options.baseline_window = monitoring.baseline_window;
    options.drift_window = monitoring.drift_window;
    options.queue_capacity = monitoring.queue_capacity;
    options.default_quality = monitoring.default_quality;
    return options;
  }

  EngineOptions EngineProfile::engine_options() const {
    EngineOptions options;
    options.predictor.features.chars_per_token = routing.chars_per_token;
    options.predictor.features.default_completion_tokens = routing.default_completion_tokens;
    options.predictor.confidence_samples = routing.confidence_samples;
    options.scoring.balanced = routing.balanced_weights;
    options.scoring.min_cost = routing.min_cost;
    options.scoring.min_latency_ms = routing.min_latency_ms;
    options.heuristic_quality = routing.heuristic_quality;
    options.clean_stop_bonus = routing.clean_stop_bonus;
    options.decision_log_capacity = routing.decision_log_capacity;
    return options;
  }

  std::vector<PoolConfig> EngineProfile::resolve_pools() const {
    std::vector<PoolConfig> resolved;
    resolved.reserve(pools.size());
    for (const auto& pool : pools) resolved.push_back(pool.resolve());
    return resolved;
  }

  std::string EngineProfile::endpoint(Provider provider) const {
    auto it = endpoints.find(provider);
    return it != endpoints.end() ? it->second : default_base_url(provider);
  }

}  // namespace switchboard
