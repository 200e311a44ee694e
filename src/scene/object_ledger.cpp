/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "scene/object_ledger.hpp"
#include "core/events.hpp"
#include "core/logger.hpp"
#include <algorithm>
#include <utility>
#include <vector>

namespace arp::scene {

    ObjectId ObjectLedger::commit(PlacedObject object) {
        const ObjectId id = next_id_++;
        object.id = id;

        // Handlers may undo or reset, so the event is built before the object moves in
        events::state::ObjectPlaced placed{
            .id = id,
            .model = object.model,
            .mode = object.mode,
            .anchor = object.anchor};

        objects_.push_back(std::move(object));
        LOG_DEBUG("Committed object {} '{}' ({}, ledger size {})",
                  id, placed.model, to_string(placed.mode), objects_.size());

        placed.emit();
        return id;
    }

    std::optional<PlacedObject> ObjectLedger::undoLast() {
        if (objects_.empty()) {
            LOG_DEBUG("Nothing to undo");
            return std::nullopt;
        }

        PlacedObject removed = std::move(objects_.back());
        objects_.pop_back();

        LOG_DEBUG("Removed object {} '{}'", removed.id, removed.model);
        events::state::ObjectRemoved{.id = removed.id}.emit();

        return removed;
    }

    size_t ObjectLedger::resetAll() {
        // Newest first, same order repeated undo would use
        std::vector<ObjectId> removed;
        removed.reserve(objects_.size());
        for (auto it = objects_.rbegin(); it != objects_.rend(); ++it) {
            removed.push_back(it->id);
        }
        objects_.clear();

        if (!removed.empty()) {
            LOG_DEBUG("Removed all {} objects", removed.size());
        }
        for (const ObjectId id : removed) {
            events::state::ObjectRemoved{.id = id}.emit();
        }
        return removed.size();
    }

    const PlacedObject* ObjectLedger::find(ObjectId id) const {
        auto it = std::find_if(objects_.begin(), objects_.end(),
                               [id](const PlacedObject& object) { return object.id == id; });
        return it != objects_.end() ? &*it : nullptr;
    }

    const PlacedObject* ObjectLedger::last() const {
        return objects_.empty() ? nullptr : &objects_.back();
    }

    std::vector<const PlacedObject*> ObjectLedger::objectsAttachedTo(tracking::AnchorId anchor) const {
        std::vector<const PlacedObject*> result;
        for (const auto& object : objects_) {
            if (object.anchor == anchor) {
                result.push_back(&object);
            }
        }
        return result;
    }

} // namespace arp::scene
