#ifndef VIGIL_PIPELINE_CONFIG_HPP
#define VIGIL_PIPELINE_CONFIG_HPP

#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>

namespace VigilUtils {

    enum class PostingMode { REAL, MOCK };

    enum class ProverBackend { DIGEST, SIGNED };

    // What the Batch Generator does when fewer than k samples are waiting.
    enum class PartialWindowPolicy { SKIP, EMIT };

    /**
     * @brief Every recognized option of the pipeline. Defaults are the "standard" preset.
     * validate() must run once before use; it fills the derived fields.
     */
    struct PipelineConfig {
        // --- Sampling ---
        uint64_t tickSecs = 30;
        uint64_t maxStalenessSecs = 120;
        uint64_t gracePeriodSecs = 45;      // inclusive: age <= grace passes
        int64_t minIncrement = 1;
        bool requireSampledCountAdvance = true;
        uint64_t ringCapacity = 288;

        // --- Batching ---
        uint64_t windowSecs = 600;
        double thresholdFraction = 0.95;
        PartialWindowPolicy partialWindowPolicy = PartialWindowPolicy::SKIP;
        std::string salt;

        // --- Proofs ---
        bool proofsEnabled = true;
        ProverBackend proverBackend = ProverBackend::DIGEST;

        // --- Ledger ---
        std::string ledgerNamespace;
        PostingMode postingMode = PostingMode::MOCK;
        bool postEverySample = true;
        std::string nodeUrl;
        std::string nodeAuthToken;
        uint32_t retryAttempts = 5;
        uint64_t retryInitialBackoffMs = 500;
        uint64_t retryMaxBackoffMs = 8000;
        std::string signingSeedHex;

        // --- Process ---
        std::string dataDir;
        int ingestPort = 4318;
        uint64_t shutdownGraceMs = 5000;

        // --- Derived by validate() ---
        uint64_t samplesPerWindow = 0;  // k = windowSecs / tickSecs
        uint32_t thresholdPpm = 0;      // thresholdFraction in parts per million

        PipelineConfig();

        /**
         * @brief Startup checks. Throws Vigil::Core::ConfigError on the first violation.
         */
        void validate();
    };

    /**
     * @brief Defaults with the named timing preset applied. Throws ConfigError on unknown names.
     */
    PipelineConfig presetConfig(const std::string& name);

    /**
     * @brief Overlays snake_case keys of a JSON object. Unknown keys and type mismatches are ConfigErrors.
     */
    void applyJsonOverrides(PipelineConfig& config, const nlohmann::json& overrides);

    /**
     * @brief Reads a JSON config file. A "preset" key selects the base before the overlay.
     */
    PipelineConfig loadConfigFile(const std::string& path);

    std::string toString(PostingMode mode);
    std::string toString(ProverBackend backend);
    std::string toString(PartialWindowPolicy policy);
}

#endif
