/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "scene/placed_object.hpp"
#include <cstddef>
#include <optional>
#include <vector>

namespace arp::scene {

    // Placed objects in commit order. Only the newest entry can be removed
    // individually; everything else goes through resetAll().
    class ObjectLedger {
    public:
        ObjectLedger() = default;
        ~ObjectLedger() = default;

        // Delete copy operations
        ObjectLedger(const ObjectLedger&) = delete;
        ObjectLedger& operator=(const ObjectLedger&) = delete;

        // Appends the object and assigns it a fresh id, which is returned
        ObjectId commit(PlacedObject object);

        // Removes the most recently committed object, nullopt when empty
        std::optional<PlacedObject> undoLast();

        // Removes every object. Returns how many were removed, 0 when already empty.
        size_t resetAll();

        // Direct queries
        size_t size() const { return objects_.size(); }
        bool empty() const { return objects_.empty(); }
        const PlacedObject* find(ObjectId id) const;
        const PlacedObject* last() const;
        const std::vector<PlacedObject>& getObjects() const { return objects_; }
        std::vector<const PlacedObject*> objectsAttachedTo(tracking::AnchorId anchor) const;

    private:
        std::vector<PlacedObject> objects_;
        ObjectId next_id_ = 1;
    };

} // namespace arp::scene
