#ifndef VIGIL_CONFIGTEMPLATES_HPP
#define VIGIL_CONFIGTEMPLATES_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace VigilTemplates {

    /**
     * @brief Named timing preset. The remaining options keep their defaults.
     */
    struct TimingPreset {
        std::string name;
        uint64_t tickSecs;
        uint64_t windowSecs;
        uint64_t ringCapacity;
    };

    // "standard" is the default: 30 s ticks, 10 minute windows (k = 20).
    extern const std::string DEFAULT_PRESET;

    // standard (30 s / 600 s), hourly (60 s / 3600 s), rapid (30 s / 60 s)
    extern const std::vector<TimingPreset> TIMING_PRESETS;

    extern const std::string DEFAULT_NAMESPACE;
    extern const std::string DEFAULT_NODE_URL;
    extern const std::string DEFAULT_DATA_DIR;
}

#endif
