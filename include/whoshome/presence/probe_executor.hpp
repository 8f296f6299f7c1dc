#pragma once

#include "../core/device.hpp"
#include "../core/types.hpp"
#include "../net/cancel.hpp"
#include "../probe/prober.hpp"
#include <atomic>
#include <chrono>
#include <datapod/datapod.hpp>
#include <echo/echo.hpp>
#include <exception>
#include <thread>
#include <vector>

namespace whoshome {
    namespace presence {

        // ─── Runs one cycle's probes ────────────────────────────────────────────────
        // Outcomes come back in the order of the device list. Every device gets
        // exactly one probe per call, so a device is never probed twice at once.
        // All probes share one deadline: timeout_ms after the call started. A
        // device still waiting for a probe when it passes comes back Skipped.
        class ProbeExecutor {
          public:
            virtual ~ProbeExecutor() = default;

            virtual dp::Vector<ProbeOutcome> run(const dp::Vector<const Device *> &devices, u32 timeout_ms,
                                                 const CancelSignal *cancel) = 0;
        };

        namespace detail {
            using steady = std::chrono::steady_clock;

            inline u32 remaining_ms(steady::time_point deadline) noexcept {
                auto now = steady::now();
                if (now >= deadline)
                    return 0;
                return static_cast<u32>(std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count());
            }

            // One probe under the joint deadline; a throwing prober counts as a miss
            inline ProbeOutcome probe_one(Prober &prober, const Device &device, steady::time_point deadline,
                                          const CancelSignal *cancel) {
                if (cancel && cancel->raised())
                    return ProbeOutcome::Cancelled;
                u32 left = remaining_ms(deadline);
                if (left == 0)
                    return ProbeOutcome::Skipped;
                try {
                    return prober.probe(device, left, cancel);
                } catch (const std::exception &e) {
                    echo::category("whoshome.executor")
                        .error(prober.name(), " probe of ", device.name, " (", device.address_text(),
                               ") threw: ", e.what());
                    return ProbeOutcome::Unreachable;
                }
            }
        } // namespace detail

        // ─── Sequential executor ────────────────────────────────────────────────────
        // Deterministic order; used by tests and the simulation. With a real prober
        // a slow device eats into the shared deadline of the ones after it.
        class SequentialProbeExecutor : public ProbeExecutor {
            Prober &prober_;

          public:
            explicit SequentialProbeExecutor(Prober &prober) : prober_(prober) {}

            dp::Vector<ProbeOutcome> run(const dp::Vector<const Device *> &devices, u32 timeout_ms,
                                         const CancelSignal *cancel) override {
                const auto deadline = detail::steady::now() + std::chrono::milliseconds(timeout_ms);
                dp::Vector<ProbeOutcome> outcomes;
                for (const Device *d : devices) {
                    outcomes.push_back(detail::probe_one(prober_, *d, deadline, cancel));
                }
                return outcomes;
            }
        };

        // ─── Threaded executor ──────────────────────────────────────────────────────
        // Up to max_parallel workers pull devices off a shared index; each writes only
        // its own result slot. run() joins every worker before returning, and no
        // worker outlives the joint deadline or a raised cancel signal.
        class ThreadedProbeExecutor : public ProbeExecutor {
            Prober &prober_;
            u32 max_parallel_;

          public:
            ThreadedProbeExecutor(Prober &prober, u32 max_parallel)
                : prober_(prober), max_parallel_(max_parallel == 0 ? 1 : max_parallel) {}

            u32 max_parallel() const noexcept { return max_parallel_; }

            dp::Vector<ProbeOutcome> run(const dp::Vector<const Device *> &devices, u32 timeout_ms,
                                         const CancelSignal *cancel) override {
                const usize n = devices.size();
                dp::Vector<ProbeOutcome> outcomes(n, ProbeOutcome::Skipped);
                if (n == 0)
                    return outcomes;

                const auto deadline = detail::steady::now() + std::chrono::milliseconds(timeout_ms);
                std::atomic<usize> next{0};
                auto worker = [&]() {
                    for (usize i = next.fetch_add(1); i < n; i = next.fetch_add(1)) {
                        outcomes[i] = detail::probe_one(prober_, *devices[i], deadline, cancel);
                    }
                };

                const usize workers = n < max_parallel_ ? n : static_cast<usize>(max_parallel_);
                std::vector<std::thread> threads;
                threads.reserve(workers);
                for (usize w = 0; w < workers; ++w) {
                    threads.emplace_back(worker);
                }
                for (auto &t : threads) {
                    t.join();
                }
                return outcomes;
            }
        };

    } // namespace presence
    using namespace presence;
} // namespace whoshome
