#pragma once

#include <vector>

#include "core/Commit.hpp"
#include "util/Expected.hpp"

namespace gitlanes {

/**
 * @brief Check that a commit list is safe to lay out
 * 
 * calculateLanes() trusts its input; this is the optional hardening step
 * in front of it. Rejects, reporting the first problem found:
 *   - an empty commit hash                       (InvalidCommit)
 *   - the same hash on two rows                  (DuplicateCommit)
 *   - an empty parent hash                       (InvalidCommit)
 *   - a commit naming itself as parent           (OrderViolation)
 *   - a parent listed above its child            (OrderViolation)
 * 
 * Parents that are not in the list at all are fine.
 */
Expected<void> validateCommits(const std::vector<Commit>& commits);

}
