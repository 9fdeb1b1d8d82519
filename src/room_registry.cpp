#include "room_registry.hpp"

namespace relaycp {

size_t Room::size() const {
    std::lock_guard<std::mutex> lk(mu_);
    return members_.size();
}

std::vector<std::string> Room::peer_ids() const {
    std::lock_guard<std::mutex> lk(mu_);
    std::vector<std::string> out;
    out.reserve(members_.size());
    for (const auto& kv : members_) out.push_back(kv.first);
    return out;
}

bool Room::has_member(const std::string& peer_id) const {
    std::lock_guard<std::mutex> lk(mu_);
    return members_.count(peer_id) != 0;
}

bool Room::has_member(const std::string& peer_id, const PeerLink* link) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = members_.find(peer_id);
    return it != members_.end() && it->second.link.get() == link;
}

void Room::broadcast_peers_locked() {
    std::vector<std::string> ids;
    ids.reserve(members_.size());
    for (const auto& kv : members_) ids.push_back(kv.first);
    auto msg = std::make_shared<const proto::Message>(proto::make_peers(ids, id_));
    for (const auto& kv : members_) kv.second.link->deliver(msg);
}

RoomRegistry::RoomRegistry(RegistryLimits limits, Logger& logger)
    : limits_(limits), logger_(logger) {}

std::shared_ptr<Room> RoomRegistry::get_or_create_room(const std::string& room_id) {
    std::lock_guard<std::mutex> lk(rooms_mu_);
    auto it = rooms_.find(room_id);
    if (it != rooms_.end()) {
        bool closed = false;
        {
            std::lock_guard<std::mutex> rlk(it->second->mu_);
            closed = it->second->closed_;
        }
        if (!closed) return it->second;
        // Retired but not yet erased: the replacement takes its place.
        rooms_.erase(it);
    }

    if (limits_.max_rooms > 0 && rooms_.size() >= limits_.max_rooms) {
        logger_.warn("room limit reached (" + std::to_string(limits_.max_rooms) +
                     "), refusing room " + room_id);
        return nullptr;
    }

    auto room = std::make_shared<Room>(room_id);
    rooms_.emplace(room_id, room);
    logger_.debug("room created: " + room_id + " total=" + std::to_string(rooms_.size()));
    return room;
}

std::shared_ptr<Room> RoomRegistry::find(const std::string& room_id) const {
    std::lock_guard<std::mutex> lk(rooms_mu_);
    auto it = rooms_.find(room_id);
    if (it == rooms_.end()) return nullptr;
    return it->second;
}

bool RoomRegistry::reserve_slot(const std::string& source, const std::string& room_id) {
    if (limits_.max_rooms_per_source == 0) return true;

    std::lock_guard<std::mutex> lk(sources_mu_);
    auto& rooms = sources_[source];
    auto it = rooms.find(room_id);
    if (it != rooms.end() && it->second > 0) {
        ++it->second;
        return true;
    }
    if (rooms.size() >= limits_.max_rooms_per_source) {
        if (rooms.empty()) sources_.erase(source);
        return false;
    }
    rooms[room_id] = 1;
    return true;
}

void RoomRegistry::release_slot(const std::string& source, const std::string& room_id) {
    if (limits_.max_rooms_per_source == 0) return;

    std::lock_guard<std::mutex> lk(sources_mu_);
    auto sit = sources_.find(source);
    if (sit == sources_.end()) return;

    auto& rooms = sit->second;
    auto it = rooms.find(room_id);
    if (it != rooms.end()) {
        if (it->second <= 1) rooms.erase(it);
        else --it->second;
    }
    if (rooms.empty()) sources_.erase(sit);
}

JoinResult RoomRegistry::join(const std::shared_ptr<Room>& room, const Member& member) {
    std::lock_guard<std::mutex> lk(room->mu_);
    if (room->closed_) return JoinResult::ROOM_GONE;

    auto existing = room->members_.find(member.id);
    if (existing == room->members_.end() &&
        limits_.max_peers_per_room > 0 &&
        room->members_.size() >= limits_.max_peers_per_room) {
        return JoinResult::ROOM_FULL;
    }

    if (existing != room->members_.end()) {
        logger_.debug("peer " + member.id + " replaces an older connection in room " + room->id_);
        existing->second = member;
    } else {
        room->members_.emplace(member.id, member);
    }

    member.link->deliver(std::make_shared<const proto::Message>(
        proto::make_joined(member.id, member.mnemonic, room->id_)));
    room->broadcast_peers_locked();
    return JoinResult::JOINED;
}

bool RoomRegistry::leave(const std::shared_ptr<Room>& room, const std::string& peer_id, const PeerLink* link) {
    Member gone;
    bool empty = false;
    {
        std::lock_guard<std::mutex> lk(room->mu_);
        auto it = room->members_.find(peer_id);
        if (it == room->members_.end() || it->second.link.get() != link) return false;
        gone = std::move(it->second);
        room->members_.erase(it);

        empty = room->members_.empty();
        if (empty) {
            room->closed_ = true;
        } else {
            auto notice = std::make_shared<const proto::Message>(
                proto::make_peer_disconnected(gone.id, gone.mnemonic, room->id_));
            for (const auto& kv : room->members_) kv.second.link->deliver(notice);
            room->broadcast_peers_locked();
        }
    }

    if (empty) retire(room);
    return true;
}

bool RoomRegistry::forward(const std::shared_ptr<Room>& room,
                           const std::string& from_id,
                           const PeerLink* link,
                           const std::shared_ptr<const proto::Message>& msg) {
    std::lock_guard<std::mutex> lk(room->mu_);
    auto self = room->members_.find(from_id);
    if (self == room->members_.end() || self->second.link.get() != link) return false;

    for (const auto& kv : room->members_) {
        if (kv.first == from_id) continue;
        kv.second.link->deliver(msg);
    }
    return true;
}

size_t RoomRegistry::room_count() const {
    std::lock_guard<std::mutex> lk(rooms_mu_);
    return rooms_.size();
}

size_t RoomRegistry::source_room_count(const std::string& source) const {
    std::lock_guard<std::mutex> lk(sources_mu_);
    auto it = sources_.find(source);
    return it == sources_.end() ? 0 : it->second.size();
}

std::optional<size_t> RoomRegistry::member_count(const std::string& room_id) const {
    auto room = find(room_id);
    if (!room) return std::nullopt;
    return room->size();
}

void RoomRegistry::retire(const std::shared_ptr<Room>& room) {
    std::lock_guard<std::mutex> lk(rooms_mu_);
    auto it = rooms_.find(room->id_);
    if (it != rooms_.end() && it->second == room) {
        rooms_.erase(it);
        logger_.debug("room destroyed: " + room->id_ + " total=" + std::to_string(rooms_.size()));
    }
}

} // namespace relaycp
