#include "../include/otm/combat/World.h"

#include "../../OTM_Shared/include/otm/shared/Logger.h"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <utility>

namespace otm::combat {

namespace {
    bool equalsIgnoreCase(const std::string& a, const std::string& b) {
        return a.size() == b.size() &&
            std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
                return std::tolower(x) == std::tolower(y);
            });
    }
}

Room* World::addRoom(shared::RoomId id, std::string name, std::string description,
                     shared::FloorNumber floor, RoomKind kind) {
    if (rooms_.count(id) > 0) {
        return nullptr;
    }
    auto room = std::make_unique<Room>(id, std::move(name), std::move(description), floor, kind);
    Room* raw = room.get();
    rooms_.emplace(std::move(id), std::move(room));
    return raw;
}

Room* World::findRoom(const shared::RoomId& id) const {
    auto it = rooms_.find(id);
    return it == rooms_.end() ? nullptr : it->second.get();
}

std::vector<Room*> World::rooms() const {
    std::vector<Room*> result;
    result.reserve(rooms_.size());
    for (const auto& [id, room] : rooms_) {
        result.push_back(room.get());
    }
    return result;
}

std::vector<Room*> World::roomsOnFloor(shared::FloorNumber floor) const {
    std::vector<Room*> result;
    for (const auto& [id, room] : rooms_) {
        if (room->floor() == floor) {
            result.push_back(room.get());
        }
    }
    return result;
}

int World::floorCount() const {
    int highest = 0;
    for (const auto& [id, room] : rooms_) {
        highest = std::max(highest, room->floor());
    }
    return highest;
}

std::shared_ptr<Npc> World::findNpcInRoom(const Room& room, const std::string& npcName, const NpcRegistry& npcs) const {
    for (const auto handle : room.npcs()) {
        auto npc = npcs.get(handle);
        if (npc != nullptr && npc->isAlive() && equalsIgnoreCase(npc->name(), npcName)) {
            return npc;
        }
    }
    return nullptr;
}

void World::placeNpc(Npc& npc, Room& room) const {
    npc.setCurrentRoom(room.id());
    room.addNpc(npc.handle());
}

bool World::moveNpc(Npc& npc, const shared::RoomId& to) const {
    Room* dest = findRoom(to);
    if (dest == nullptr) {
        shared::logWarn("world", std::string{"moveNpc: unknown room="} + to + ", npc=" + npc.name());
        return false;
    }
    if (Room* from = findRoom(npc.currentRoom())) {
        from->removeNpc(npc.handle());
    }
    placeNpc(npc, *dest);
    return true;
}

void World::placePlayer(PlayerSession& player, Room& room) const {
    player.setRoom(room.id());
    room.addPlayer(player.name());
}

bool World::movePlayer(PlayerSession& player, const shared::RoomId& to) const {
    Room* dest = findRoom(to);
    if (dest == nullptr) {
        shared::logWarn("world", std::string{"movePlayer: unknown room="} + to + ", player=" + player.name());
        return false;
    }
    if (Room* from = findRoom(player.room())) {
        from->removePlayer(player.name());
    }
    placePlayer(player, *dest);
    return true;
}

std::string World::describeRoom(const Room& room, const NpcRegistry& npcs, const std::string& viewer) const {
    std::ostringstream out;
    out << "\n" << room.name() << "\n" << room.description() << "\n";

    const auto& exits = room.exits();
    out << "Exits: ";
    if (exits.empty()) {
        out << "none";
    }
    for (std::size_t i = 0; i < exits.size(); ++i) {
        out << (i > 0 ? ", " : "") << exits[i].direction;
    }
    out << "\n";

    for (const auto handle : room.npcs()) {
        const auto npc = npcs.get(handle);
        if (npc != nullptr && npc->isAlive()) {
            out << npc->name() << " is here.\n";
        }
    }
    for (const auto& name : room.players()) {
        if (name != viewer) {
            out << name << " is here.\n";
        }
    }
    const auto items = room.items();
    if (!items.empty()) {
        out << "You see: ";
        for (std::size_t i = 0; i < items.size(); ++i) {
            out << (i > 0 ? ", " : "") << items[i].name;
        }
        out << "\n";
    }
    return out.str();
}

} // namespace otm::combat
