#pragma once

#include "../core/device.hpp"
#include "../core/types.hpp"
#include "../net/cancel.hpp"
#include <datapod/datapod.hpp>

namespace whoshome {
    namespace probe {

        // ─── Reachability check for one device ─────────────────────────────────────
        // probe() must return within timeout_ms, and promptly with Cancelled once
        // cancel is raised. It is called concurrently for different devices, so
        // implementations keep no per-call state in members.
        class Prober {
          public:
            virtual ~Prober() = default;

            virtual ProbeOutcome probe(const Device &device, u32 timeout_ms, const CancelSignal *cancel) = 0;
            virtual dp::String name() const = 0;
        };

    } // namespace probe
    using namespace probe;
} // namespace whoshome
