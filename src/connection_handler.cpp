#include "connection_handler.hpp"

#include "mnemonic.hpp"
#include "util.hpp"

namespace relaycp {

const char* const kErrRoomsPerSource = "Maximum rooms per IP reached, try again later";
const char* const kErrRoomsGlobal = "Maximum rooms reached, try again later";
const char* const kErrRoomFull = "Room is full";

namespace {

// A room can be retired between lookup and join; bounded retries.
constexpr int kJoinAttempts = 4;

} // namespace

ConnectionHandler::ConnectionHandler(RoomRegistry& registry,
                                     SessionJournal* journal,
                                     Logger& logger,
                                     std::string source,
                                     std::shared_ptr<PeerLink> link,
                                     proto::Encoding default_encoding)
    : registry_(registry),
      journal_(journal),
      logger_(logger),
      source_(std::move(source)),
      link_(std::move(link)),
      encoding_(default_encoding),
      peer_id_("peer-" + random_hex_id()) {
    mnemonic_ = make_mnemonic(peer_id_);
    logger_.debug("new connection " + peer_id_ + " from " + source_);
}

std::string ConnectionHandler::room_id() const {
    return room_ ? room_->id() : std::string();
}

std::string ConnectionHandler::session_id() const {
    return room_id() + "/" + peer_id_;
}

void ConnectionHandler::on_frame(const tlv::Bytes& frame) {
    if (closing_ || closed_) return;

    auto decoded = proto::decode_frame(frame);
    if (!decoded) {
        logger_.warn("dropping undecodable frame from " + peer_id_ +
                     " (" + std::to_string(frame.size()) + " bytes)");
        return;
    }
    if (!encoding_fixed_) {
        encoding_ = decoded->encoding;
        encoding_fixed_ = true;
        logger_.debug(peer_id_ + " speaks " + proto::encoding_name(encoding_));
    }

    const proto::Message& in = decoded->msg;
    switch (in.kind) {
        case proto::Kind::JOIN:
            handle_join(in);
            break;
        case proto::Kind::UNKNOWN:
            logger_.warn("dropping unknown message type '" + in.type_name() + "' from " + peer_id_);
            break;
        default:
            handle_forward(in);
            break;
    }
}

void ConnectionHandler::handle_join(const proto::Message& in) {
    if (in.room_id.empty()) {
        logger_.warn("dropping join without roomId from " + peer_id_);
        return;
    }

    // Repeated join of the room we are still seated in. After a newer
    // connection took over our id this falls through to a fresh join.
    if (room_ && room_->id() == in.room_id && room_->has_member(peer_id_, link_.get())) {
        link_->deliver(std::make_shared<const proto::Message>(
            proto::make_joined(peer_id_, mnemonic_, in.room_id)));
        return;
    }
    if (room_) leave_current_room();

    if (!in.client_id.empty()) peer_id_ = in.client_id;
    mnemonic_ = make_mnemonic(peer_id_);

    if (!registry_.reserve_slot(source_, in.room_id)) {
        logger_.warn("per-source room limit reached for " + source_ + " (room " + in.room_id + ")");
        fail_and_close(kErrRoomsPerSource);
        return;
    }

    Member self{peer_id_, mnemonic_, link_};
    for (int attempt = 0; attempt < kJoinAttempts; ++attempt) {
        auto room = registry_.get_or_create_room(in.room_id);
        if (!room) {
            registry_.release_slot(source_, in.room_id);
            fail_and_close(kErrRoomsGlobal);
            return;
        }

        JoinResult r = registry_.join(room, self);
        if (r == JoinResult::JOINED) {
            room_ = room;
            logger_.debug(peer_id_ + " joined room " + in.room_id);
            if (journal_) journal_->session_started(session_id(), in.room_id, source_);
            return;
        }
        if (r == JoinResult::ROOM_FULL) {
            logger_.warn("room " + in.room_id + " is full, refusing " + peer_id_);
            registry_.release_slot(source_, in.room_id);
            fail_and_close(kErrRoomFull);
            return;
        }
    }

    logger_.warn("room " + in.room_id + " kept retiring during join of " + peer_id_);
    registry_.release_slot(source_, in.room_id);
    fail_and_close(kErrRoomsGlobal);
}

void ConnectionHandler::handle_forward(const proto::Message& in) {
    if (!room_) {
        logger_.debug("dropping " + in.type_name() + " from unjoined " + peer_id_);
        return;
    }

    auto out = std::make_shared<proto::Message>();
    out->kind = in.kind;
    out->type = in.type;
    out->from = peer_id_;
    out->mnemonic = mnemonic_;
    out->room_id = room_->id();
    out->pub = in.pub;
    out->iv_b64 = in.iv_b64;
    out->data_b64 = in.data_b64;
    out->chunk_data = in.chunk_data;
    out->chunk_num = in.chunk_num;
    out->encrypted_metadata = in.encrypted_metadata;
    out->metadata_iv = in.metadata_iv;

    if (in.kind == proto::Kind::FILE_START) {
        logger_.debug("relaying file_start in " + room_->id() +
                      (in.encrypted_metadata.empty() ? " without" : " with") + " encrypted metadata");
    }

    if (!registry_.forward(room_, peer_id_, link_.get(), out)) {
        logger_.debug("dropping " + in.type_name() + " from " + peer_id_ + ": no longer a member of " +
                      room_->id());
        return;
    }

    uint64_t n = in.chunk_data.size() + in.data_b64.size() + in.encrypted_metadata.size();
    if (journal_ && n > 0) journal_->bytes_relayed(session_id(), n);
}

void ConnectionHandler::leave_current_room() {
    if (!room_) return;
    const std::string rid = room_->id();
    if (journal_) journal_->session_ended(session_id());
    registry_.leave(room_, peer_id_, link_.get());
    registry_.release_slot(source_, rid);
    logger_.debug(peer_id_ + " left room " + rid);
    room_.reset();
}

void ConnectionHandler::fail_and_close(const std::string& text) {
    link_->deliver(std::make_shared<const proto::Message>(proto::make_error(text)));
    link_->close();
    closing_ = true;
}

void ConnectionHandler::on_close() {
    if (closed_) return;
    closed_ = true;
    leave_current_room();
    logger_.debug("closed connection " + peer_id_);
}

} // namespace relaycp
