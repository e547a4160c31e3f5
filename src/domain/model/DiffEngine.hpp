/**
 * @file DiffEngine.hpp
 * @brief Structural comparison of two model snapshots.
 */

#pragma once

#include <optional>
#include <set>
#include <string>

#include "domain/model/ChangeSet.hpp"
#include "domain/model/Snapshot.hpp"

namespace safetyreview::domain::model {

/**
 * @brief Stateless domain service producing a ChangeSet from two snapshots.
 *
 * The output is complete and deterministic but not minimal. Both the
 * "compare on review open" and the explicit "Compare Versions" actions go
 * through diff(); they only differ in which snapshots they pass.
 */
class DiffEngine {
public:
    /**
     * @brief Computes the changes turning @p oldSnapshot into @p newSnapshot.
     * @param scope When set, only entities in scope, links with both endpoints
     *        in scope and allocations of in-scope entities are compared.
     * @throws MalformedSnapshotError if either snapshot has dangling references.
     */
    static ChangeSet diff(const Snapshot& oldSnapshot,
                          const Snapshot& newSnapshot,
                          const std::optional<std::set<std::string>>& scope = std::nullopt);

    /**
     * @brief Trims the longest common prefix and suffix of two strings.
     *
     * Trimming stops on UTF-8 boundaries so deleted and inserted spans are
     * always valid text for highlighting.
     */
    static TextDelta textDelta(const std::string& oldText, const std::string& newText);
};

} // namespace safetyreview::domain::model
