// © 2026 Beatrix Zselezny. All rights reserved.
// Vigil Liveness Attestation Pipeline

#include "core/Scheduler.hpp"
#include "core/AttestationPipeline.hpp"
#include "core/VigilBus.hpp"
#include <iostream>

namespace Vigil::Core {

    Scheduler::Scheduler() {
        sampler_scheduler = rxcpp::schedulers::make_new_thread();
        batch_scheduler = rxcpp::schedulers::make_new_thread();
        worker_scheduler = rxcpp::schedulers::make_event_loop();
    }

    Scheduler::~Scheduler() {
        if (running && active) {
            stop(std::chrono::milliseconds(active->getConfig().shutdownGraceMs));
        }
    }

    void Scheduler::start(AttestationPipeline& pipeline) {
        if (running) return;
        running = true;
        active = &pipeline;

        const auto& config = pipeline.getConfig();
        pipeline.getBus().startReactive(lifetime, *this);

        rxcpp::observable<>::interval(std::chrono::seconds(config.tickSecs),
                                      rxcpp::identity_one_worker(sampler_scheduler))
            .subscribe(timers, [&pipeline](long) {
                pipeline.samplerTick(pipeline.getClock().now());
            });

        rxcpp::observable<>::interval(std::chrono::seconds(config.windowSecs),
                                      rxcpp::identity_one_worker(batch_scheduler))
            .subscribe(timers, [&pipeline](long) {
                pipeline.batchTick();
            });

        pipeline.getTelemetry().state = PipelineState::UP;
        std::cout << "[Scheduler] Sampler every " << config.tickSecs << "s, batch every "
                  << config.windowSecs << "s (k=" << config.samplesPerWindow << ")." << std::endl;
    }

    uint32_t Scheduler::stop(std::chrono::milliseconds grace) {
        if (!running) return 0;

        if (timers.is_subscribed()) {
            timers.unsubscribe();
        }

        uint32_t abandoned = 0;
        VigilBus& bus = active->getBus();
        if (!bus.awaitIdle(grace)) {
            bus.cancelPending();
            abandoned = bus.inflightTasks();
            std::cerr << "[Scheduler] Grace period of " << grace.count() << "ms elapsed, "
                      << abandoned << " task(s) abandoned." << std::endl;
        }

        if (lifetime.is_subscribed()) {
            lifetime.unsubscribe();
        }

        active->getTelemetry().state = PipelineState::STOPPED;
        running = false;
        std::cout << "[Scheduler] Stopped." << std::endl;
        return abandoned;
    }
}
