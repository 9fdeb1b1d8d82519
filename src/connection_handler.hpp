#pragma once

#include <memory>
#include <string>

#include "logger.hpp"
#include "protocol.hpp"
#include "room_registry.hpp"
#include "session_journal.hpp"

namespace relaycp {

// Capacity error texts sent to the peer before the relay closes it.
extern const char* const kErrRoomsPerSource;
extern const char* const kErrRoomsGlobal;
extern const char* const kErrRoomFull;

// Per-connection relay state machine: Unjoined -> Joined -> Closing.
// Transport agnostic; the owning session feeds it frames in order from a
// single execution context and calls on_close() exactly once at the end.
class ConnectionHandler {
public:
    ConnectionHandler(RoomRegistry& registry,
                      SessionJournal* journal,
                      Logger& logger,
                      std::string source,
                      std::shared_ptr<PeerLink> link,
                      proto::Encoding default_encoding);

    ConnectionHandler(const ConnectionHandler&) = delete;
    ConnectionHandler& operator=(const ConnectionHandler&) = delete;

    void on_frame(const tlv::Bytes& frame);
    void on_close();

    // Encoding used for everything sent to this peer: the default until the
    // peer's first decodable frame, that frame's encoding afterwards.
    proto::Encoding encoding() const { return encoding_; }
    bool encoding_fixed() const { return encoding_fixed_; }

    const std::string& peer_id() const { return peer_id_; }
    const std::string& mnemonic() const { return mnemonic_; }
    std::string room_id() const;
    bool closing() const { return closing_; }

private:
    void handle_join(const proto::Message& in);
    void handle_forward(const proto::Message& in);
    void leave_current_room();
    void fail_and_close(const std::string& text);
    std::string session_id() const;

    RoomRegistry& registry_;
    SessionJournal* journal_;
    Logger& logger_;
    const std::string source_;
    std::shared_ptr<PeerLink> link_;

    proto::Encoding encoding_;
    bool encoding_fixed_ = false;

    std::string peer_id_;
    std::string mnemonic_;
    std::shared_ptr<Room> room_;
    bool closing_ = false;
    bool closed_ = false;
};

} // namespace relaycp
