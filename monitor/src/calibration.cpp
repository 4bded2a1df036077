#include <algorithm>
#include <cmath>
#include <format>
#include <fstream>
#include <msgpack.hpp>
#include <nlohmann/json.hpp>
#include <sstream>
#include <stdexcept>
#include <switchboard/common/tracy.hpp>
#include <switchboard/monitor/calibration.hpp>

using json = nlohmann::json;

namespace switchboard {

  std::string calibration_key(Provider provider, const std::string& model) {
    return std::format("{}/{}", to_string(provider), model);
  }

  std::pair<Provider, std::string> parse_calibration_key(const std::string& key) {
    auto slash = key.find('/');
    if (slash == std::string::npos || slash + 1 >= key.size()) {
      throw std::invalid_argument(std::format("calibration key '{}' is not provider/model", key));
    }
    auto provider = parse_provider(std::string_view(key).substr(0, slash));
    if (!provider) {
      throw std::invalid_argument(std::format("calibration key '{}' has an unknown provider", key));
    }
    return {*provider, key.substr(slash + 1)};
  }

  const CalibrationEntry* CalibrationSnapshot::find(Provider provider,
                                                    const std::string& model) const {
    auto it = entries.find(calibration_key(provider, model));
    return it == entries.end() ? nullptr : &it->second;
  }

  // ============================================================================
  // CalibrationTable
  // ============================================================================

  CalibrationTable::CalibrationTable(CalibrationOptions options)
      : options_(options), current_(std::make_shared<const CalibrationSnapshot>()) {
    if (options_.learning_rate <= 0.0 || options_.learning_rate > 1.0) {
      throw std::invalid_argument(std::format("learning_rate must be within (0, 1], got {}",
                                              options_.learning_rate));
    }
    if (options_.min_factor <= 0.0 || options_.min_factor > options_.max_factor) {
      throw std::invalid_argument("calibration factor bounds must satisfy 0 < min <= max");
    }
  }

  std::shared_ptr<const CalibrationSnapshot> CalibrationTable::snapshot() const {
    std::lock_guard lock(mutex_);
    return current_;
  }

  void CalibrationTable::observe(const CandidatePrediction& predicted,
                                 const ExecutionOutcome& actual,
                                 std::optional<double> observed_quality,
                                 double quality_accuracy) {
    SWITCHBOARD_ZONE;
    const double lr = options_.learning_rate;
    auto step = [&](double factor, double predicted_value, double actual_value) {
      if (predicted_value <= 0.0 || actual_value <= 0.0) return factor;
      const double target = factor * (actual_value / predicted_value);
      return std::clamp((1.0 - lr) * factor + lr * target, options_.min_factor,
                        options_.max_factor);
    };

    std::lock_guard lock(mutex_);
    CalibrationSnapshot next = *current_;
    auto& entry = next.entries[calibration_key(actual.provider, actual.model)];

    if (actual.success) {
      entry.cost_factor = step(entry.cost_factor, predicted.predicted_cost, actual.cost);
      entry.latency_factor
          = step(entry.latency_factor, predicted.predicted_latency_ms, actual.latency_ms);
      if (observed_quality) {
        const double prior = entry.learned_quality.value_or(predicted.predicted_quality);
        entry.learned_quality = std::clamp((1.0 - lr) * prior + lr * *observed_quality, 0.0, 1.0);
      }
    }
    entry.quality_accuracy = std::clamp(quality_accuracy, 0.0, 1.0);
    ++entry.samples;

    publish_locked(std::move(next));
  }

  void CalibrationTable::set_drift_penalty(Provider provider, const std::string& model,
                                           double penalty) {
    std::lock_guard lock(mutex_);
    const auto key = calibration_key(provider, model);
    auto it = current_->entries.find(key);
    const double clamped = std::clamp(penalty, 0.0, 0.95);
    if (it != current_->entries.end() && it->second.drift_penalty == clamped) return;

    CalibrationSnapshot next = *current_;
    next.entries[key].drift_penalty = clamped;
    publish_locked(std::move(next));
  }

  void CalibrationTable::replace(CalibrationSnapshot snapshot) {
    std::lock_guard lock(mutex_);
    publish_locked(std::move(snapshot));
  }

  void CalibrationTable::publish_locked(CalibrationSnapshot next) {
    next.version = current_->version + 1;
    current_ = std::make_shared<const CalibrationSnapshot>(std::move(next));
  }

  // ============================================================================
  // JSON Serialization - CalibrationEntry / AccuracyMetrics
  // ============================================================================

  namespace {

    json entry_to_json(const CalibrationEntry& e) {
      json j = {{"cost_factor", e.cost_factor},
                {"latency_factor", e.latency_factor},
                {"quality_accuracy", e.quality_accuracy},
                {"samples", e.samples},
                {"drift_penalty", e.drift_penalty}};
      j["learned_quality"] = e.learned_quality ? json(*e.learned_quality) : json(nullptr);
      return j;
    }

    CalibrationEntry entry_from_json(const json& j) {
      CalibrationEntry e;
      e.cost_factor = j.value("cost_factor", 1.0);
      e.latency_factor = j.value("latency_factor", 1.0);
      e.quality_accuracy = j.value("quality_accuracy", 1.0);
      e.samples = j.value("samples", std::uint64_t{0});
      e.drift_penalty = j.value("drift_penalty", 0.0);
      if (j.contains("learned_quality") && !j["learned_quality"].is_null()) {
        e.learned_quality = j["learned_quality"].get<double>();
      }
      return e;
    }

    json baseline_to_json(const AccuracyMetrics& m) {
      return {{"cost_accuracy", m.cost_accuracy},
              {"latency_accuracy", m.latency_accuracy},
              {"quality_accuracy", m.quality_accuracy},
              {"overall_accuracy", m.overall_accuracy},
              {"overall_stddev", m.overall_stddev},
              {"match_rate", m.match_rate},
              {"success_rate", m.success_rate},
              {"sample_size", m.sample_size}};
    }

    AccuracyMetrics baseline_from_json(const json& j) {
      AccuracyMetrics m;
      j.at("overall_accuracy").get_to(m.overall_accuracy);
      j.at("sample_size").get_to(m.sample_size);
      m.overall_stddev = j.value("overall_stddev", 0.0);
      m.cost_accuracy = j.value("cost_accuracy", m.overall_accuracy);
      m.latency_accuracy = j.value("latency_accuracy", m.overall_accuracy);
      m.quality_accuracy = j.value("quality_accuracy", m.overall_accuracy);
      m.match_rate = j.value("match_rate", 1.0);
      m.success_rate = j.value("success_rate", 1.0);
      return m;
    }

    double msgpack_double(const std::map<std::string, msgpack::object>& map, const char* key,
                          double fallback) {
      auto it = map.find(key);
      if (it == map.end() || it->second.type == msgpack::type::NIL) return fallback;
      return it->second.as<double>();
    }

  }  // namespace

  // ============================================================================
  // JSON I/O
  // ============================================================================

  CalibrationCheckpoint CalibrationCheckpoint::from_json(const std::string& path) {
    SWITCHBOARD_ZONE;
    std::ifstream file(path);
    if (!file.is_open()) {
      throw std::runtime_error(std::format("Failed to open calibration file: {}", path));
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return from_json_string(buffer.str());
  }

  CalibrationCheckpoint CalibrationCheckpoint::from_json_string(const std::string& json_str) {
    SWITCHBOARD_ZONE;
    json j = json::parse(json_str);

    CalibrationCheckpoint checkpoint;
    checkpoint.version = j.value("version", CALIBRATION_CHECKPOINT_VERSION);

    if (j.contains("entries")) {
      for (const auto& [key, value] : j.at("entries").items()) {
        checkpoint.entries.emplace(key, entry_from_json(value));
      }
    }
    if (j.contains("baselines")) {
      for (const auto& [key, value] : j.at("baselines").items()) {
        checkpoint.baselines.emplace(key, baseline_from_json(value));
      }
    }

    checkpoint.validate();
    return checkpoint;
  }

  std::string CalibrationCheckpoint::to_json_string() const {
    json j;
    j["version"] = version;

    json entries_json = json::object();
    for (const auto& [key, entry] : entries) entries_json[key] = entry_to_json(entry);
    j["entries"] = entries_json;

    json baselines_json = json::object();
    for (const auto& [key, metrics] : baselines) baselines_json[key] = baseline_to_json(metrics);
    j["baselines"] = baselines_json;

    return j.dump(2);
  }

  void CalibrationCheckpoint::to_json(const std::string& path) const {
    std::ofstream file(path);
    if (!file.is_open()) {
      throw std::runtime_error(std::format("Failed to open calibration file for writing: {}", path));
    }
    file << to_json_string();
  }

  // ============================================================================
  // MessagePack I/O
  // ============================================================================

  CalibrationCheckpoint CalibrationCheckpoint::from_msgpack(const std::string& path) {
    SWITCHBOARD_ZONE;
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file) {
      throw std::runtime_error(std::format("Failed to open msgpack file: {}", path));
    }
    auto size = file.tellg();
    file.seekg(0, std::ios::beg);

    std::string data(static_cast<size_t>(size), '\0');
    if (!file.read(data.data(), size)) {
      throw std::runtime_error(std::format("Failed to read msgpack file: {}", path));
    }
    return from_msgpack_string(data);
  }

  CalibrationCheckpoint CalibrationCheckpoint::from_msgpack_string(const std::string& data) {
    SWITCHBOARD_ZONE;
    msgpack::object_handle handle = msgpack::unpack(data.data(), data.size());
    auto map = handle.get().as<std::map<std::string, msgpack::object>>();

    CalibrationCheckpoint checkpoint;
    checkpoint.version = map.contains("version") ? map.at("version").as<std::string>()
                                                 : CALIBRATION_CHECKPOINT_VERSION;

    if (map.contains("entries")) {
      auto entries = map.at("entries").as<std::map<std::string, msgpack::object>>();
      for (const auto& [key, obj] : entries) {
        auto fields = obj.as<std::map<std::string, msgpack::object>>();
        CalibrationEntry e;
        e.cost_factor = msgpack_double(fields, "cost_factor", 1.0);
        e.latency_factor = msgpack_double(fields, "latency_factor", 1.0);
        e.quality_accuracy = msgpack_double(fields, "quality_accuracy", 1.0);
        e.drift_penalty = msgpack_double(fields, "drift_penalty", 0.0);
        e.samples = fields.contains("samples") ? fields.at("samples").as<std::uint64_t>() : 0;
        if (fields.contains("learned_quality")
            && fields.at("learned_quality").type != msgpack::type::NIL) {
          e.learned_quality = fields.at("learned_quality").as<double>();
        }
        checkpoint.entries.emplace(key, e);
      }
    }

    if (map.contains("baselines")) {
      auto baselines = map.at("baselines").as<std::map<std::string, msgpack::object>>();
      for (const auto& [key, obj] : baselines) {
        auto fields = obj.as<std::map<std::string, msgpack::object>>();
        if (!fields.contains("overall_accuracy") || !fields.contains("sample_size")) {
          throw std::invalid_argument(
              std::format("baseline '{}' must contain overall_accuracy and sample_size", key));
        }
        AccuracyMetrics m;
        m.overall_accuracy = fields.at("overall_accuracy").as<double>();
        m.sample_size = fields.at("sample_size").as<size_t>();
        m.overall_stddev = msgpack_double(fields, "overall_stddev", 0.0);
        m.cost_accuracy = msgpack_double(fields, "cost_accuracy", m.overall_accuracy);
        m.latency_accuracy = msgpack_double(fields, "latency_accuracy", m.overall_accuracy);
        m.quality_accuracy = msgpack_double(fields, "quality_accuracy", m.overall_accuracy);
        m.match_rate = msgpack_double(fields, "match_rate", 1.0);
        m.success_rate = msgpack_double(fields, "success_rate", 1.0);
        checkpoint.baselines.emplace(key, m);
      }
    }

    checkpoint.validate();
    return checkpoint;
  }

  std::string CalibrationCheckpoint::to_msgpack_string() const {
    msgpack::sbuffer buffer;
    msgpack::packer<msgpack::sbuffer> pk(&buffer);

    pk.pack_map(3);

    pk.pack("version");
    pk.pack(version);

    pk.pack("entries");
    pk.pack_map(static_cast<uint32_t>(entries.size()));
    for (const auto& [key, e] : entries) {
      pk.pack(key);
      pk.pack_map(6);
      pk.pack("cost_factor");
      pk.pack(e.cost_factor);
      pk.pack("latency_factor");
      pk.pack(e.latency_factor);
      pk.pack("quality_accuracy");
      pk.pack(e.quality_accuracy);
      pk.pack("samples");
      pk.pack(e.samples);
      pk.pack("drift_penalty");
      pk.pack(e.drift_penalty);
      pk.pack("learned_quality");
      if (e.learned_quality) {
        pk.pack(*e.learned_quality);
      } else {
        pk.pack_nil();
      }
    }

    pk.pack("baselines");
    pk.pack_map(static_cast<uint32_t>(baselines.size()));
    for (const auto& [key, m] : baselines) {
      pk.pack(key);
      pk.pack_map(8);
      pk.pack("cost_accuracy");
      pk.pack(m.cost_accuracy);
      pk.pack("latency_accuracy");
      pk.pack(m.latency_accuracy);
      pk.pack("quality_accuracy");
      pk.pack(m.quality_accuracy);
      pk.pack("overall_accuracy");
      pk.pack(m.overall_accuracy);
      pk.pack("overall_stddev");
      pk.pack(m.overall_stddev);
      pk.pack("match_rate");
      pk.pack(m.match_rate);
      pk.pack("success_rate");
      pk.pack(m.success_rate);
      pk.pack("sample_size");
      pk.pack(static_cast<std::uint64_t>(m.sample_size));
    }

    return std::string(buffer.data(), buffer.size());
  }

  void CalibrationCheckpoint::to_msgpack(const std::string& path) const {
    std::string binary_data = to_msgpack_string();
    std::ofstream file(path, std::ios::binary);
    if (!file.is_open()) {
      throw std::runtime_error(std::format("Failed to open msgpack file for writing: {}", path));
    }
    file.write(binary_data.data(), static_cast<std::streamsize>(binary_data.size()));
  }

  // ============================================================================
  // Validation
  // ============================================================================

  void CalibrationCheckpoint::validate() const {
    if (version != CALIBRATION_CHECKPOINT_VERSION) {
      throw std::invalid_argument(std::format("unsupported calibration checkpoint version '{}'",
                                              version));
    }

    for (const auto& [key, e] : entries) {
      (void)parse_calibration_key(key);
      if (!(e.cost_factor > 0.0) || !(e.latency_factor > 0.0)) {
        throw std::invalid_argument(
            std::format("calibration '{}' factors must be positive", key));
      }
      if (e.drift_penalty < 0.0 || e.drift_penalty >= 1.0) {
        throw std::invalid_argument(
            std::format("calibration '{}' drift_penalty must be within [0, 1), got {}", key,
                        e.drift_penalty));
      }
      if (e.learned_quality && (*e.learned_quality < 0.0 || *e.learned_quality > 1.0)) {
        throw std::invalid_argument(
            std::format("calibration '{}' learned_quality must be within [0, 1]", key));
      }
    }

    for (const auto& [key, m] : baselines) {
      (void)parse_calibration_key(key);
      if (m.overall_accuracy < 0.0 || m.overall_accuracy > 1.0) {
        throw std::invalid_argument(
            std::format("baseline '{}' overall_accuracy must be within [0, 1], got {}", key,
                        m.overall_accuracy));
      }
    }
  }

}  // namespace switchboard
