#pragma once

namespace Vigil::Core {

enum class PipelineState {
    STARTING,
    UP,
    DEGRADED,   // last ledger post failed, sampling continues
    STOPPED
};

}
