#pragma once

#include "openklv/klv.h"
#include "openklv/local_set.h"
#include "openklv/universal_set.h"

#include <cstdint>

/**
 * \file resource_policy.h
 * \brief Resource limit policy for OpenKLV read/dump workflows.
 */

namespace openklv {

/**
 * \brief Storage-agnostic resource limits for untrusted KLV input.
 *
 * The file mapping cap is off by default. Decode limits are applied at each
 * nesting level by \ref apply_resource_policy.
 */
struct KlvResourcePolicy final {
    /// Optional file mapping cap (0 = unlimited).
    uint64_t max_file_bytes = 0;

    /// Per-triplet limits.
    KlvDecodeLimits klv_limits;

    /// Per-local-set limits.
    LocalSetLimits local_set_limits;

    /// Per-source limits.
    UniversalSetLimits universal_set_limits;
};

inline void
apply_resource_policy(const KlvResourcePolicy& policy,
                      KlvDecodeOptions* klv) noexcept
{
    if (klv) {
        klv->limits = policy.klv_limits;
    }
}

inline void
apply_resource_policy(const KlvResourcePolicy& policy,
                      LocalSetOptions* local_set) noexcept
{
    if (local_set) {
        apply_resource_policy(policy, &local_set->klv);
        local_set->limits = policy.local_set_limits;
    }
}

inline void
apply_resource_policy(const KlvResourcePolicy& policy,
                      UniversalSetOptions* universal_set) noexcept
{
    if (universal_set) {
        apply_resource_policy(policy, &universal_set->local_set);
        universal_set->limits = policy.universal_set_limits;
    }
}

}  // namespace openklv
