#pragma once

#include <functional>

#include "../storage/mutation_batch.h"

namespace Claimstone {

/**
 * Interface for asserting that an identity is claimed by exactly one writer
 */
class IUniquenessConstraint {
public:
    // Receives the commit batch; writes added to it land only if the claim does.
    using MutationCallback = std::function<void(MutationBatch&)>;

    virtual ~IUniquenessConstraint() = default;

    // Throws NotUniqueException if another writer holds the identity.
    virtual void Acquire() = 0;
    virtual void AcquireAndApplyMutation(const MutationCallback& callback) = 0;
    virtual void Release() = 0;
};

} // namespace Claimstone
