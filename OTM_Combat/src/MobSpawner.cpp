#include "../include/otm/combat/MobSpawner.h"

#include "../../OTM_Shared/include/otm/shared/Logger.h"

namespace otm::combat {

MobSpawner::MobSpawner(World& world, NpcRegistry& npcs, const NpcTemplateStore& templates, shared::RandomSource& rng)
    : world_(world)
    , npcs_(npcs)
    , templates_(templates)
    , rng_(rng) {
}

std::optional<shared::NpcHandle> MobSpawner::spawn(const std::string& templateId, const shared::RoomId& roomId, bool respawns) {
    const NpcTemplate* tmpl = templates_.find(templateId);
    if (tmpl == nullptr) {
        shared::logWarn("spawner", std::string{"Unknown template="} + templateId + ", room=" + roomId);
        return std::nullopt;
    }
    Room* room = world_.findRoom(roomId);
    if (room == nullptr) {
        shared::logWarn("spawner", std::string{"Unknown room="} + roomId + ", template=" + templateId);
        return std::nullopt;
    }

    const shared::NpcHandle handle = npcs_.create(*tmpl, room->id(), room->floor(), respawns);
    const auto npc = npcs_.get(handle);
    world_.placeNpc(*npc, *room);

    shared::logDebug("spawner", std::string{"Spawned npc="} + npc->name() +
                     ", handle=" + std::to_string(handle) +
                     ", room=" + roomId +
                     ", floor=" + std::to_string(room->floor()));
    return handle;
}

int MobSpawner::spawnInitial(const std::vector<SpawnPoint>& spawns) {
    int created = 0;
    for (const auto& point : spawns) {
        if (spawn(point.templateId, point.room)) {
            ++created;
        }
    }
    shared::logInfo("spawner", std::string{"Initial population: "} + std::to_string(created) + "/" +
                    std::to_string(spawns.size()) + " NPC(s) spawned");
    return created;
}

int MobSpawner::spawnAdditional(shared::FloorNumber floor, int count) {
    if (count <= 0) {
        return 0;
    }

    std::vector<Room*> eligibleRooms;
    for (Room* room : world_.roomsOnFloor(floor)) {
        if (room->kind() == RoomKind::Normal) {
            eligibleRooms.push_back(room);
        }
    }
    const auto candidates = templates_.forFloor(floor);
    if (eligibleRooms.empty() || candidates.empty()) {
        shared::logDebug("spawner", std::string{"No eligible rooms or templates on floor="} + std::to_string(floor));
        return 0;
    }

    int created = 0;
    for (int i = 0; i < count; ++i) {
        Room* room = eligibleRooms[rng_.nextInt(0, static_cast<int>(eligibleRooms.size()) - 1)];
        const NpcTemplate* tmpl = candidates[rng_.nextInt(0, static_cast<int>(candidates.size()) - 1)];
        if (spawn(tmpl->templateId, room->id(), false)) {
            ++created;
        }
    }
    return created;
}

} // namespace otm::combat
