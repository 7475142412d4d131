#include "utils/PipelineConfig.hpp"
#include "utils/ConfigTemplates.hpp"
#include "utils/StorageUtils.hpp"
#include "utils/StringUtils.hpp"
#include "core/VigilErrors.hpp"
#include <cmath>
#include <functional>
#include <map>

using Vigil::Core::ConfigError;

namespace VigilUtils {

    PipelineConfig::PipelineConfig()
        : ledgerNamespace(VigilTemplates::DEFAULT_NAMESPACE),
          nodeUrl(VigilTemplates::DEFAULT_NODE_URL),
          dataDir(VigilTemplates::DEFAULT_DATA_DIR) {}

    void PipelineConfig::validate() {
        if (tickSecs == 0) {
            throw ConfigError("tick_secs must be positive");
        }
        if (windowSecs == 0 || windowSecs % tickSecs != 0) {
            throw ConfigError("window_secs (" + std::to_string(windowSecs) +
                              ") must be a positive multiple of tick_secs (" + std::to_string(tickSecs) + ")");
        }
        samplesPerWindow = windowSecs / tickSecs;

        if (gracePeriodSecs >= maxStalenessSecs) {
            throw ConfigError("grace_period_secs must be smaller than max_staleness_secs");
        }
        if (minIncrement < 1) {
            throw ConfigError("min_increment must be at least 1");
        }
        if (!(thresholdFraction > 0.0 && thresholdFraction <= 1.0)) {
            throw ConfigError("threshold_fraction must be in (0, 1]");
        }
        // The threshold is an exact integer ceiling in ppm, so the fraction must be ppm-representable.
        long long ppm = std::llround(thresholdFraction * 1000000.0);
        if (ppm == 0 || std::fabs(static_cast<double>(ppm) / 1000000.0 - thresholdFraction) > 1e-12) {
            throw ConfigError("threshold_fraction must be a whole number of parts per million (at least 0.000001)");
        }
        thresholdPpm = static_cast<uint32_t>(ppm);

        if (ringCapacity < samplesPerWindow) {
            throw ConfigError("ring_capacity (" + std::to_string(ringCapacity) +
                              ") cannot hold one window of " + std::to_string(samplesPerWindow) + " samples");
        }

        if (ledgerNamespace.empty()) {
            throw ConfigError("namespace must not be empty");
        }
        if (postingMode == PostingMode::REAL) {
            bool hexId = ledgerNamespace.size() == 20 && isHex(ledgerNamespace);
            if (!hexId && ledgerNamespace.size() > 10) {
                throw ConfigError("namespace must be at most 10 bytes or 20 hex characters in real posting mode");
            }
            if (nodeUrl.rfind("http://", 0) != 0) {
                throw ConfigError("node_url must be an http:// URL");
            }
        }

        if (retryAttempts == 0) {
            throw ConfigError("retry_attempts must be at least 1");
        }
        if (retryInitialBackoffMs > retryMaxBackoffMs) {
            throw ConfigError("retry_initial_backoff_ms exceeds retry_max_backoff_ms");
        }
        if (!signingSeedHex.empty() && (signingSeedHex.size() != 64 || !isHex(signingSeedHex))) {
            throw ConfigError("signing_seed_hex must be 64 hex characters");
        }
        if (ingestPort < 0 || ingestPort > 65535) {
            throw ConfigError("ingest_port out of range");
        }
    }

    PipelineConfig presetConfig(const std::string& name) {
        for (const auto& preset : VigilTemplates::TIMING_PRESETS) {
            if (preset.name == name) {
                PipelineConfig config;
                config.tickSecs = preset.tickSecs;
                config.windowSecs = preset.windowSecs;
                config.ringCapacity = preset.ringCapacity;
                return config;
            }
        }
        throw ConfigError("unknown preset: " + name);
    }

    namespace {
        PostingMode parsePostingMode(const std::string& s) {
            if (s == "real") return PostingMode::REAL;
            if (s == "mock") return PostingMode::MOCK;
            throw ConfigError("posting_mode must be 'real' or 'mock', got '" + s + "'");
        }

        ProverBackend parseProverBackend(const std::string& s) {
            if (s == "digest") return ProverBackend::DIGEST;
            if (s == "signed") return ProverBackend::SIGNED;
            throw ConfigError("prover_backend must be 'digest' or 'signed', got '" + s + "'");
        }

        PartialWindowPolicy parsePartialPolicy(const std::string& s) {
            if (s == "skip") return PartialWindowPolicy::SKIP;
            if (s == "emit") return PartialWindowPolicy::EMIT;
            throw ConfigError("partial_window_policy must be 'skip' or 'emit', got '" + s + "'");
        }

        using Setter = std::function<void(PipelineConfig&, const nlohmann::json&)>;

        const std::map<std::string, Setter>& setters() {
            static const std::map<std::string, Setter> table = {
                { "tick_secs",          [](PipelineConfig& c, const nlohmann::json& v) { c.tickSecs = v.get<uint64_t>(); } },
                { "window_secs",        [](PipelineConfig& c, const nlohmann::json& v) { c.windowSecs = v.get<uint64_t>(); } },
                { "max_staleness_secs", [](PipelineConfig& c, const nlohmann::json& v) { c.maxStalenessSecs = v.get<uint64_t>(); } },
                { "grace_period_secs",  [](PipelineConfig& c, const nlohmann::json& v) { c.gracePeriodSecs = v.get<uint64_t>(); } },
                { "min_increment",      [](PipelineConfig& c, const nlohmann::json& v) { c.minIncrement = v.get<int64_t>(); } },
                { "require_sampled_count_advance",
                                        [](PipelineConfig& c, const nlohmann::json& v) { c.requireSampledCountAdvance = v.get<bool>(); } },
                { "ring_capacity",      [](PipelineConfig& c, const nlohmann::json& v) { c.ringCapacity = v.get<uint64_t>(); } },
                { "threshold_fraction", [](PipelineConfig& c, const nlohmann::json& v) { c.thresholdFraction = v.get<double>(); } },
                { "partial_window_policy",
                                        [](PipelineConfig& c, const nlohmann::json& v) { c.partialWindowPolicy = parsePartialPolicy(v.get<std::string>()); } },
                { "salt",               [](PipelineConfig& c, const nlohmann::json& v) { c.salt = v.get<std::string>(); } },
                { "proofs_enabled",     [](PipelineConfig& c, const nlohmann::json& v) { c.proofsEnabled = v.get<bool>(); } },
                { "prover_backend",     [](PipelineConfig& c, const nlohmann::json& v) { c.proverBackend = parseProverBackend(v.get<std::string>()); } },
                { "namespace",          [](PipelineConfig& c, const nlohmann::json& v) { c.ledgerNamespace = v.get<std::string>(); } },
                { "posting_mode",       [](PipelineConfig& c, const nlohmann::json& v) { c.postingMode = parsePostingMode(v.get<std::string>()); } },
                { "post_every_sample",  [](PipelineConfig& c, const nlohmann::json& v) { c.postEverySample = v.get<bool>(); } },
                { "node_url",           [](PipelineConfig& c, const nlohmann::json& v) { c.nodeUrl = v.get<std::string>(); } },
                { "node_auth_token",    [](PipelineConfig& c, const nlohmann::json& v) { c.nodeAuthToken = v.get<std::string>(); } },
                { "retry_attempts",     [](PipelineConfig& c, const nlohmann::json& v) { c.retryAttempts = v.get<uint32_t>(); } },
                { "retry_initial_backoff_ms",
                                        [](PipelineConfig& c, const nlohmann::json& v) { c.retryInitialBackoffMs = v.get<uint64_t>(); } },
                { "retry_max_backoff_ms",
                                        [](PipelineConfig& c, const nlohmann::json& v) { c.retryMaxBackoffMs = v.get<uint64_t>(); } },
                { "signing_seed_hex",   [](PipelineConfig& c, const nlohmann::json& v) { c.signingSeedHex = v.get<std::string>(); } },
                { "data_dir",           [](PipelineConfig& c, const nlohmann::json& v) { c.dataDir = v.get<std::string>(); } },
                { "ingest_port",        [](PipelineConfig& c, const nlohmann::json& v) { c.ingestPort = v.get<int>(); } },
                { "shutdown_grace_ms",  [](PipelineConfig& c, const nlohmann::json& v) { c.shutdownGraceMs = v.get<uint64_t>(); } }
            };
            return table;
        }
    }

    void applyJsonOverrides(PipelineConfig& config, const nlohmann::json& overrides) {
        if (!overrides.is_object()) {
            throw ConfigError("configuration root must be a JSON object");
        }
        for (const auto& [key, value] : overrides.items()) {
            if (key == "preset") continue;  // consumed by loadConfigFile

            auto it = setters().find(key);
            if (it == setters().end()) {
                throw ConfigError("unknown configuration key: " + key);
            }
            try {
                it->second(config, value);
            } catch (const nlohmann::json::exception& e) {
                throw ConfigError("bad value for " + key + ": " + e.what());
            }
        }
    }

    PipelineConfig loadConfigFile(const std::string& path) {
        std::string content;
        if (!readFile(path, content)) {
            throw ConfigError("cannot read config file: " + path);
        }

        nlohmann::json doc = nlohmann::json::parse(content, nullptr, false);
        if (doc.is_discarded()) {
            throw ConfigError("config file is not valid JSON: " + path);
        }

        std::string preset = VigilTemplates::DEFAULT_PRESET;
        if (doc.is_object() && doc.contains("preset")) {
            if (!doc["preset"].is_string()) {
                throw ConfigError("preset must be a string");
            }
            preset = doc["preset"].get<std::string>();
        }

        PipelineConfig config = presetConfig(preset);
        applyJsonOverrides(config, doc);
        return config;
    }

    std::string toString(PostingMode mode) {
        return mode == PostingMode::REAL ? "real" : "mock";
    }

    std::string toString(ProverBackend backend) {
        return backend == ProverBackend::SIGNED ? "signed" : "digest";
    }

    std::string toString(PartialWindowPolicy policy) {
        return policy == PartialWindowPolicy::EMIT ? "emit" : "skip";
    }
}
