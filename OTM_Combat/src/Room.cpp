#include "../include/otm/combat/Room.h"
#include "../include/otm/combat/MessageSink.h"

#include <algorithm>
#include <cctype>
#include <utility>

namespace otm::combat {

const char* toString(RoomKind kind) {
    switch (kind) {
        case RoomKind::Normal: return "normal";
        case RoomKind::Stairs: return "stairs";
        case RoomKind::Safe:   return "safe";
        case RoomKind::Boss:   return "boss";
    }
    return "normal";
}

RoomKind parseRoomKind(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "stairs") return RoomKind::Stairs;
    if (lower == "safe") return RoomKind::Safe;
    if (lower == "boss") return RoomKind::Boss;
    return RoomKind::Normal;
}

bool Exit::isVertical() const {
    return direction == "up" || direction == "down";
}

Room::Room(shared::RoomId id, std::string name, std::string description, shared::FloorNumber floor, RoomKind kind)
    : id_(std::move(id))
    , name_(std::move(name))
    , description_(std::move(description))
    , floor_(floor)
    , kind_(kind) {
}

void Room::addExit(const std::string& direction, const shared::RoomId& target) {
    exits_.push_back(Exit{ direction, target });
}

std::vector<Exit> Room::horizontalExits() const {
    std::vector<Exit> result;
    for (const auto& exit : exits_) {
        if (!exit.isVertical()) {
            result.push_back(exit);
        }
    }
    return result;
}

void Room::addPlayer(const std::string& playerName) {
    std::scoped_lock lock(mutex_);
    if (std::find(players_.begin(), players_.end(), playerName) == players_.end()) {
        players_.push_back(playerName);
    }
}

bool Room::removePlayer(const std::string& playerName) {
    std::scoped_lock lock(mutex_);
    auto it = std::find(players_.begin(), players_.end(), playerName);
    if (it == players_.end()) {
        return false;
    }
    players_.erase(it);
    return true;
}

bool Room::hasPlayer(const std::string& playerName) const {
    std::scoped_lock lock(mutex_);
    return std::find(players_.begin(), players_.end(), playerName) != players_.end();
}

std::vector<std::string> Room::players() const {
    std::scoped_lock lock(mutex_);
    return players_;
}

void Room::addNpc(shared::NpcHandle handle) {
    std::scoped_lock lock(mutex_);
    if (std::find(npcs_.begin(), npcs_.end(), handle) == npcs_.end()) {
        npcs_.push_back(handle);
    }
}

bool Room::removeNpc(shared::NpcHandle handle) {
    std::scoped_lock lock(mutex_);
    auto it = std::find(npcs_.begin(), npcs_.end(), handle);
    if (it == npcs_.end()) {
        return false;
    }
    npcs_.erase(it);
    return true;
}

bool Room::hasNpc(shared::NpcHandle handle) const {
    std::scoped_lock lock(mutex_);
    return std::find(npcs_.begin(), npcs_.end(), handle) != npcs_.end();
}

std::vector<shared::NpcHandle> Room::npcs() const {
    std::scoped_lock lock(mutex_);
    return npcs_;
}

void Room::addItem(Item item) {
    std::scoped_lock lock(mutex_);
    items_.push_back(std::move(item));
}

std::vector<Item> Room::items() const {
    std::scoped_lock lock(mutex_);
    return items_;
}

void Room::broadcast(MessageSink& sink, const std::string& text, const std::vector<std::string>& exclude) const {
    // copy out so the sink runs without the room lock
    const std::vector<std::string> present = players();
    for (const auto& name : present) {
        if (std::find(exclude.begin(), exclude.end(), name) != exclude.end()) {
            continue;
        }
        sink.sendMessage(name, text);
    }
}

} // namespace otm::combat
