#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "logger.hpp"
#include "protocol.hpp"

namespace relaycp {

// Outbound side of one connection as seen by the registry. Both calls must
// be non-blocking: they are made while a room's lock is held.
class PeerLink {
public:
    virtual ~PeerLink() = default;

    virtual void deliver(const std::shared_ptr<const proto::Message>& msg) = 0;
    // Flushes what is already queued, then closes.
    virtual void close() = 0;
};

struct Member {
    std::string id;
    std::string mnemonic;
    std::shared_ptr<PeerLink> link;
};

struct RegistryLimits {
    size_t max_rooms = 10;            // 0 = unlimited
    size_t max_rooms_per_source = 2;  // 0 = unlimited
    size_t max_peers_per_room = 2;    // 0 = unlimited
};

class Room {
public:
    explicit Room(std::string id) : id_(std::move(id)) {}

    const std::string& id() const { return id_; }
    size_t size() const;
    std::vector<std::string> peer_ids() const;
    bool has_member(const std::string& peer_id) const;
    // Member under peer_id and reached through link, not a newer
    // connection that took over the same id.
    bool has_member(const std::string& peer_id, const PeerLink* link) const;

private:
    friend class RoomRegistry;

    void broadcast_peers_locked();

    const std::string id_;
    mutable std::mutex mu_;
    std::map<std::string, Member> members_;
    // Set under mu_ when the last member leaves; a closed room takes no joins.
    bool closed_ = false;
};

enum class JoinResult {
    JOINED,
    ROOM_FULL,
    ROOM_GONE   // emptied and retired between lookup and join; look it up again
};

// Rooms by id plus per-source slot accounting. Three lock domains: the room
// map, each room's membership, and the source table. Room locks are only
// ever taken inside the map lock, never the other way round.
class RoomRegistry {
public:
    RoomRegistry(RegistryLimits limits, Logger& logger);

    RoomRegistry(const RoomRegistry&) = delete;
    RoomRegistry& operator=(const RoomRegistry&) = delete;

    // nullptr when the room does not exist and the global cap is reached.
    std::shared_ptr<Room> get_or_create_room(const std::string& room_id);
    std::shared_ptr<Room> find(const std::string& room_id) const;

    bool reserve_slot(const std::string& source, const std::string& room_id);
    void release_slot(const std::string& source, const std::string& room_id);

    // On success the member receives `joined`, then every member receives
    // the new `peers` list. A member with the same id is replaced.
    JoinResult join(const std::shared_ptr<Room>& room, const Member& member);

    // Removes peer_id only while it still belongs to `link`. Remaining
    // members get `peer_disconnected` and then `peers`; an emptied room is
    // retired. Returns whether anything was removed.
    bool leave(const std::shared_ptr<Room>& room, const std::string& peer_id, const PeerLink* link);

    // Sends msg to every member except the sender. Returns false when the
    // sender is not (or no longer) a member through `link`.
    bool forward(const std::shared_ptr<Room>& room,
                 const std::string& from_id,
                 const PeerLink* link,
                 const std::shared_ptr<const proto::Message>& msg);

    size_t room_count() const;
    size_t source_room_count(const std::string& source) const;
    std::optional<size_t> member_count(const std::string& room_id) const;

    const RegistryLimits& limits() const { return limits_; }

private:
    void retire(const std::shared_ptr<Room>& room);

    const RegistryLimits limits_;
    Logger& logger_;

    mutable std::mutex rooms_mu_;
    std::unordered_map<std::string, std::shared_ptr<Room>> rooms_;

    mutable std::mutex sources_mu_;
    // source -> room id -> connections holding a slot there
    std::unordered_map<std::string, std::unordered_map<std::string, size_t>> sources_;
};

} // namespace relaycp
