#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "../../../../OTM_Shared/include/otm/shared/Types.h"
#include "Room.h"
#include "NpcRegistry.h"
#include "PlayerSession.h"

namespace otm::combat {

/**
 * World
 *
 * Room graph plus the movement helpers the engine needs. The set of rooms is
 * fixed once loading completes; only room contents change afterwards, so
 * lookups take no world-level lock.
 */
class World {
public:
    // Load-time only. Returns nullptr if the id is already taken.
    Room* addRoom(shared::RoomId id, std::string name, std::string description,
                  shared::FloorNumber floor, RoomKind kind = RoomKind::Normal);

    Room* findRoom(const shared::RoomId& id) const;
    std::vector<Room*> rooms() const;
    std::vector<Room*> roomsOnFloor(shared::FloorNumber floor) const;

    // Highest floor number holding at least one room; floors count from 1
    int floorCount() const;

    void setStartingRoom(const shared::RoomId& id) { startingRoom_ = id; }
    const shared::RoomId& startingRoomId() const { return startingRoom_; }
    Room* startingRoom() const { return findRoom(startingRoom_); }

    // Living NPC with this name (case-insensitive) present in the room
    std::shared_ptr<Npc> findNpcInRoom(const Room& room, const std::string& npcName, const NpcRegistry& npcs) const;

    void placeNpc(Npc& npc, Room& room) const;
    bool moveNpc(Npc& npc, const shared::RoomId& to) const;

    void placePlayer(PlayerSession& player, Room& room) const;
    bool movePlayer(PlayerSession& player, const shared::RoomId& to) const;

    // Name, description, exits, visible NPCs and floor items
    std::string describeRoom(const Room& room, const NpcRegistry& npcs, const std::string& viewer) const;

private:
    std::map<shared::RoomId, std::unique_ptr<Room>> rooms_;
    shared::RoomId startingRoom_;
};

} // namespace otm::combat
