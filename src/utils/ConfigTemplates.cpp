#include "utils/ConfigTemplates.hpp"

namespace VigilTemplates {

    const std::string DEFAULT_PRESET = "standard";

    const std::vector<TimingPreset> TIMING_PRESETS = {
        { "standard", 30, 600,  288 },
        { "hourly",   60, 3600, 288 },
        { "rapid",    30, 60,   288 }
    };

    const std::string DEFAULT_NAMESPACE = "vigil";
    const std::string DEFAULT_NODE_URL = "http://localhost:26658";
    const std::string DEFAULT_DATA_DIR = "data";
}
