#pragma once

#include <mutex>
#include <string>
#include <vector>

#include "../../../../OTM_Shared/include/otm/shared/Types.h"
#include "ItemCatalog.h"

namespace otm::combat {

class MessageSink;

enum class RoomKind {
    Normal,
    Stairs,
    Safe,
    Boss
};

const char* toString(RoomKind kind);
RoomKind parseRoomKind(const std::string& name);

struct Exit {
    std::string direction;
    shared::RoomId target;

    // up/down exits lead between floors
    bool isVertical() const;
};

/**
 * Room
 *
 * Identity, floor and exits are fixed at world load. Occupants (player names,
 * NPC handles) and floor items change at runtime under the room's own lock.
 */
class Room {
public:
    Room(shared::RoomId id, std::string name, std::string description, shared::FloorNumber floor, RoomKind kind);

    const shared::RoomId& id() const { return id_; }
    const std::string& name() const { return name_; }
    const std::string& description() const { return description_; }
    shared::FloorNumber floor() const { return floor_; }
    RoomKind kind() const { return kind_; }

    // Load-time only
    void addExit(const std::string& direction, const shared::RoomId& target);
    const std::vector<Exit>& exits() const { return exits_; }
    std::vector<Exit> horizontalExits() const;

    void addPlayer(const std::string& playerName);
    bool removePlayer(const std::string& playerName);
    bool hasPlayer(const std::string& playerName) const;
    std::vector<std::string> players() const;

    void addNpc(shared::NpcHandle handle);
    bool removeNpc(shared::NpcHandle handle);
    bool hasNpc(shared::NpcHandle handle) const;
    std::vector<shared::NpcHandle> npcs() const;

    void addItem(Item item);
    std::vector<Item> items() const;

    // Sends text to every player present except those listed
    void broadcast(MessageSink& sink, const std::string& text, const std::vector<std::string>& exclude = {}) const;

private:
    const shared::RoomId id_;
    const std::string name_;
    const std::string description_;
    const shared::FloorNumber floor_;
    const RoomKind kind_;
    std::vector<Exit> exits_;

    mutable std::mutex mutex_;
    std::vector<std::string> players_;
    std::vector<shared::NpcHandle> npcs_;
    std::vector<Item> items_;
};

} // namespace otm::combat
