// © 2026 Beatrix Zselezny. All rights reserved.
// Vigil Liveness Attestation Pipeline
// Twin-Timer Scheduler: sampler and batch ticks plus the bus worker pool

#ifndef VIGIL_SCHEDULER_HPP
#define VIGIL_SCHEDULER_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include "rxcpp/rx.hpp"

namespace Vigil::Core {

    class AttestationPipeline; // Forward declaration

    /**
     * @brief Owns the schedulers and both subscriptions.
     * `timers` holds the two interval streams, `lifetime` holds the bus chains; they are
     * torn down separately so queued work can drain after the clocks stop.
     */
    class Scheduler {
    private:
        // --- State ---
        std::atomic<bool> running{false};
        AttestationPipeline* active = nullptr;

        rxcpp::composite_subscription timers;
        rxcpp::composite_subscription lifetime;

        // --- RxCpp Schedulers ---

        // 1. Sampler clock: dedicated thread
        rxcpp::schedulers::scheduler sampler_scheduler;

        // 2. Batch clock: dedicated thread
        rxcpp::schedulers::scheduler batch_scheduler;

        // 3. Bus workers: proving, posting, archival
        rxcpp::schedulers::scheduler worker_scheduler;

    public:
        Scheduler();
        ~Scheduler();

        void start(AttestationPipeline& pipeline);

        /**
         * @brief Stops both clocks, then waits up to `grace` for in-flight tasks.
         * Returns the number of tasks abandoned when the grace period ran out.
         */
        uint32_t stop(std::chrono::milliseconds grace);

        [[nodiscard]] bool isRunning() const { return running.load(); }

        // --- Accessors ---
        rxcpp::schedulers::scheduler getWorkerScheduler() const {
            return worker_scheduler;
        }
    };
}

#endif // VIGIL_SCHEDULER_HPP
