/**
 * @file DiffEngine.cpp
 * @brief Implementation of DiffEngine.
 */

#include "domain/model/DiffEngine.hpp"

#include <algorithm>
#include <iterator>
#include <vector>

namespace safetyreview::domain::model {

namespace {

bool isContinuationByte(char c) {
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

std::vector<FieldChange> compareFields(const Entity& oldEntity, const Entity& newEntity) {
    std::vector<FieldChange> changes;

    if (oldEntity.kind != newEntity.kind) {
        std::string oldKind = EntityKindToString(oldEntity.kind);
        std::string newKind = EntityKindToString(newEntity.kind);
        changes.push_back({"kind", oldKind, newKind, DiffEngine::textDelta(oldKind, newKind)});
    }

    // Both maps are ordered, walk them in lockstep so fields come out sorted by name.
    auto oldIt = oldEntity.fields.begin();
    auto newIt = newEntity.fields.begin();
    while (oldIt != oldEntity.fields.end() || newIt != newEntity.fields.end()) {
        FieldChange change;
        if (newIt == newEntity.fields.end() ||
            (oldIt != oldEntity.fields.end() && oldIt->first < newIt->first)) {
            change.field = oldIt->first;
            change.oldValue = oldIt->second;
            change.removed = true;
            ++oldIt;
        } else if (oldIt == oldEntity.fields.end() || newIt->first < oldIt->first) {
            change.field = newIt->first;
            change.newValue = newIt->second;
            change.added = true;
            ++newIt;
        } else {
            bool same = oldIt->second == newIt->second;
            change.field = oldIt->first;
            change.oldValue = oldIt->second;
            change.newValue = newIt->second;
            ++oldIt;
            ++newIt;
            if (same) continue;
        }
        change.delta = DiffEngine::textDelta(change.oldValue, change.newValue);
        changes.push_back(std::move(change));
    }
    return changes;
}

} // namespace

TextDelta DiffEngine::textDelta(const std::string& oldText, const std::string& newText) {
    size_t limit = std::min(oldText.size(), newText.size());

    size_t prefix = 0;
    while (prefix < limit && oldText[prefix] == newText[prefix]) {
        ++prefix;
    }
    while (prefix > 0 &&
           ((prefix < oldText.size() && isContinuationByte(oldText[prefix])) ||
            (prefix < newText.size() && isContinuationByte(newText[prefix])))) {
        --prefix;
    }

    size_t suffix = 0;
    size_t maxSuffix = limit - prefix;
    while (suffix < maxSuffix &&
           oldText[oldText.size() - 1 - suffix] == newText[newText.size() - 1 - suffix]) {
        ++suffix;
    }
    while (suffix > 0 && isContinuationByte(oldText[oldText.size() - suffix])) {
        --suffix;
    }

    TextDelta delta;
    delta.prefix = oldText.substr(0, prefix);
    delta.deleted = oldText.substr(prefix, oldText.size() - prefix - suffix);
    delta.inserted = newText.substr(prefix, newText.size() - prefix - suffix);
    delta.suffix = oldText.substr(oldText.size() - suffix);
    return delta;
}

ChangeSet DiffEngine::diff(const Snapshot& oldSnapshot,
                           const Snapshot& newSnapshot,
                           const std::optional<std::set<std::string>>& scope) {
    oldSnapshot.validate();
    newSnapshot.validate();

    auto inScope = [&scope](const std::string& id) {
        return !scope || scope->count(id) > 0;
    };

    ChangeSet changeSet(oldSnapshot.version(), newSnapshot.version());
    const auto& oldEntities = oldSnapshot.entities();
    const auto& newEntities = newSnapshot.entities();

    std::vector<ChangeRecord> removed;
    std::vector<ChangeRecord> modified;
    std::vector<ChangeRecord> allocations;

    for (const auto& [id, entity] : newEntities) {
        if (!inScope(id) || oldEntities.count(id)) continue;
        changeSet.append({ChangeKind::EntityAdded, id, entity.kind});
    }

    for (const auto& [id, oldEntity] : oldEntities) {
        if (!inScope(id)) continue;

        auto newIt = newEntities.find(id);
        if (newIt == newEntities.end()) {
            removed.push_back({ChangeKind::EntityRemoved, id, oldEntity.kind});
            continue;
        }

        const Entity& newEntity = newIt->second;
        auto fieldChanges = compareFields(oldEntity, newEntity);
        if (!fieldChanges.empty()) {
            ChangeRecord record{ChangeKind::EntityModified, id, newEntity.kind};
            record.fieldChanges = std::move(fieldChanges);
            modified.push_back(std::move(record));
        }

        std::vector<std::string> addedReqs;
        std::vector<std::string> removedReqs;
        std::set_difference(newEntity.allocations.begin(), newEntity.allocations.end(),
                            oldEntity.allocations.begin(), oldEntity.allocations.end(),
                            std::back_inserter(addedReqs));
        std::set_difference(oldEntity.allocations.begin(), oldEntity.allocations.end(),
                            newEntity.allocations.begin(), newEntity.allocations.end(),
                            std::back_inserter(removedReqs));
        for (const auto& reqId : addedReqs) {
            ChangeRecord record{ChangeKind::AllocationAdded, id, newEntity.kind};
            record.requirementId = reqId;
            allocations.push_back(std::move(record));
        }
        for (const auto& reqId : removedReqs) {
            ChangeRecord record{ChangeKind::AllocationRemoved, id, newEntity.kind};
            record.requirementId = reqId;
            allocations.push_back(std::move(record));
        }
    }

    for (auto& record : removed) changeSet.append(std::move(record));
    for (auto& record : modified) changeSet.append(std::move(record));

    auto linkInScope = [&inScope](const Link& link) {
        return inScope(link.source) && inScope(link.target);
    };

    for (const auto& link : newSnapshot.links()) {
        if (linkInScope(link) && !oldSnapshot.links().count(link)) {
            ChangeRecord record{ChangeKind::LinkAdded, link.source};
            record.link = link;
            changeSet.append(std::move(record));
        }
    }
    for (const auto& link : oldSnapshot.links()) {
        if (linkInScope(link) && !newSnapshot.links().count(link)) {
            ChangeRecord record{ChangeKind::LinkRemoved, link.source};
            record.link = link;
            changeSet.append(std::move(record));
        }
    }

    for (auto& record : allocations) changeSet.append(std::move(record));
    return changeSet;
}

} // namespace safetyreview::domain::model
