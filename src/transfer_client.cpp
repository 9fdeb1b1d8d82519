#include "transfer_client.hpp"

#include "util.hpp"
#include "zip_archive.hpp"

#include <chrono>
#include <filesystem>
#include <stdexcept>
#include <system_error>

namespace relaycp {

namespace fs = std::filesystem;

TransferClient::TransferClient(boost::asio::any_io_executor ex,
                               ClientOptions opts,
                               Console& console,
                               Logger& logger,
                               SendFn send,
                               ExitFn on_exit)
    : ex_(ex),
      opts_(std::move(opts)),
      console_(console),
      logger_(logger),
      send_(std::move(send)),
      on_exit_(std::move(on_exit)),
      kx_(opts_.transfer.key_derivation),
      receiver_(opts_.transfer, [this](int32_t num) {
          proto::Message ack;
          ack.kind = proto::Kind::CHUNK_ACK;
          ack.chunk_num = num;
          this->send(ack);
      }),
      watchdog_timer_(ex) {}

TransferClient::~TransferClient() {
    remove_staging();
}

void TransferClient::start() {
    if (opts_.mode == ClientMode::SEND_FILE) {
        try {
            prepare_source();
        } catch (const std::exception& e) {
            console_.warn(e.what());
            finish(1);
            return;
        }
    }

    proto::Message join;
    join.kind = proto::Kind::JOIN;
    join.room_id = opts_.room;
    send(join);
    logger_.info("joining room " + opts_.room);

    schedule_watchdog();
}

void TransferClient::on_message(const proto::Message& m) {
    if (done_) return;

    switch (m.kind) {
    case proto::Kind::JOINED:
        mnemonic_ = m.mnemonic;
        console_.println("Joined room " + m.room_id + " as " + m.mnemonic);
        console_.println(sending() ? "Waiting for the receiver..." : "Waiting for the sender...");
        break;
    case proto::Kind::PEERS:
        handle_peers(m);
        break;
    case proto::Kind::PUBKEY:
        handle_pubkey(m);
        break;
    case proto::Kind::ERROR:
        console_.warn("server error: " + m.error);
        finish(1);
        break;
    case proto::Kind::PEER_DISCONNECTED:
        handle_peer_disconnected(m);
        break;
    case proto::Kind::CHUNK_ACK:
        if (sender_) sender_->on_ack(m.chunk_num);
        break;
    case proto::Kind::TRANSFER_RECEIVED:
        handle_transfer_received(m);
        break;
    case proto::Kind::TRANSFER_CANCELLED:
        handle_transfer_cancelled();
        break;
    case proto::Kind::FILE_START:
        handle_file_start(m);
        break;
    case proto::Kind::FILE_CHUNK:
        handle_file_chunk(m);
        break;
    case proto::Kind::FILE_END:
        handle_file_end();
        break;
    case proto::Kind::TEXT_MESSAGE:
        handle_text_message(m);
        break;
    default:
        logger_.debug("ignoring " + m.type_name());
        break;
    }
}

void TransferClient::on_disconnected(const std::string& reason) {
    if (done_) return;
    console_.warn("connection to relay lost: " + reason);
    finish(1);
}

void TransferClient::interrupt() {
    if (done_) return;
    console_.warn("interrupted");
    if ((sending() && transfer_started_) || receiver_.active()) send_cancel();
    finish(130);
}

// A single file goes as is. A folder, or more than one path, is zipped
// into a private staging directory first.
void TransferClient::prepare_source() {
    if (opts_.paths.empty()) throw std::runtime_error("nothing to send");

    const std::string& first = opts_.paths.front();
    if (opts_.paths.size() == 1 && !fs::is_directory(first)) {
        source_ = std::make_unique<FileSource>(first);
        outgoing_.name = base_name(first);
        return;
    }

    staging_dir_ = fs::temp_directory_path() / ("relaycp-" + random_hex_id());
    fs::create_directories(staging_dir_);

    fs::path zip;
    if (opts_.paths.size() == 1) {
        std::string folder = fs::absolute(first).lexically_normal().string();
        while (folder.size() > 1 && folder.back() == '/') folder.pop_back();
        folder = base_name(folder);
        if (folder.empty()) folder = "folder";
        console_.println("Zipping folder '" + folder + "' (" + std::to_string(count_files(first)) + " files)...");
        zip = staging_dir_ / (folder + ".zip");
        zip_directory(first, zip.string());
        outgoing_.is_folder = true;
        outgoing_.original_folder_name = folder;
    } else {
        console_.println("Zipping " + std::to_string(opts_.paths.size()) + " paths...");
        zip = staging_dir_ / "files.zip";
        zip_paths(opts_.paths, "files", zip.string());
        outgoing_.is_multiple_files = true;
    }
    outgoing_.name = zip.filename().string();
    source_ = std::make_unique<FileSource>(zip.string());
}

void TransferClient::remove_staging() {
    if (staging_dir_.empty()) return;
    std::error_code ec;
    fs::remove_all(staging_dir_, ec);
    if (ec) logger_.warn("cannot remove " + staging_dir_.string() + ": " + ec.message());
    staging_dir_.clear();
}

void TransferClient::handle_peers(const proto::Message& m) {
    logger_.debug("room has " + std::to_string(m.count) + " member(s)");
    if (kx_.on_peers(m.count)) send_pubkey();
}

void TransferClient::send_pubkey() {
    proto::Message m;
    m.kind = proto::Kind::PUBKEY;
    m.pub = kx_.public_key_b64();
    send(m);
    logger_.debug("public key announced");
}

void TransferClient::handle_pubkey(const proto::Message& m) {
    KeyExchange::PeerKeyOutcome outcome;
    try {
        outcome = kx_.on_peer_key(m.pub);
    } catch (const std::exception& e) {
        logger_.warn(std::string("rejecting peer key: ") + e.what());
        return;
    }
    if (outcome.duplicate) return;
    if (outcome.announce) send_pubkey();

    logger_.info("session key established with " + (m.mnemonic.empty() ? m.from : m.mnemonic));
    if (sending() && !transfer_started_) begin_transfer();
}

void TransferClient::begin_transfer() {
    transfer_started_ = true;

    if (opts_.mode == ClientMode::SEND_TEXT) {
        SealedField sealed = seal_text(opts_.text, kx_.key());
        proto::Message m;
        m.kind = proto::Kind::TEXT_MESSAGE;
        m.encrypted_metadata = sealed.data_b64;
        m.metadata_iv = sealed.iv_b64;
        send(m);
        console_.println("Text sent, waiting for confirmation...");
        awaiting_receipt_ = true;
        receipt_wait_since_ms_ = now_ms();
        return;
    }

    TransferMetadata meta = outgoing_;
    try {
        meta.hash = hash_source(*source_);
    } catch (const std::exception& e) {
        console_.warn(e.what());
        send_cancel();
        finish(1);
        return;
    }

    console_.println("Sending " + meta.name + " (" + std::to_string(source_->size()) + " bytes)");
    std::weak_ptr<TransferClient> weak = weak_from_this();
    sender_ = std::make_shared<ChunkSender>(
        ex_, opts_.transfer, kx_.key(), std::move(source_),
        [weak](const proto::Message& out, WrittenFn written) {
            if (auto self = weak.lock()) self->send_(out, std::move(written));
        },
        logger_);
    sender_->start(meta, [weak](const TransferOutcome& outcome) {
        if (auto self = weak.lock()) self->on_sent(outcome);
    });
}

void TransferClient::on_sent(const TransferOutcome& outcome) {
    if (done_) return;
    if (!outcome.ok) {
        console_.warn("transfer failed: " + outcome.reason);
        send_cancel();
        finish(1);
        return;
    }
    console_.println("All chunks acknowledged, waiting for confirmation...");
    awaiting_receipt_ = true;
    receipt_wait_since_ms_ = now_ms();
}

void TransferClient::handle_peer_disconnected(const proto::Message& m) {
    console_.println("Peer " + (m.mnemonic.empty() ? m.peer_id : m.mnemonic) + " left the room");
    kx_.reset();

    if (sending()) {
        if (!transfer_started_) return;
        if (sender_ && !sender_->finished()) {
            sender_->abort("peer disconnected");
            return;
        }
        if (awaiting_receipt_) {
            console_.warn("transfer failed: peer left before confirming");
            finish(1);
        }
        return;
    }

    // Receivers keep waiting for the next sender.
    if (receiver_.active()) {
        receiver_.abort();
        drop_partial_output();
        console_.warn("transfer interrupted; waiting for the sender to retry");
    }
}

void TransferClient::handle_transfer_received(const proto::Message& m) {
    if (!sending() || !transfer_started_) return;
    try {
        TransferKind kind = open_transfer_kind(SealedField{m.data_b64, m.iv_b64}, kx_.key());
        logger_.debug(std::string("receipt for ") + (kind == TransferKind::TEXT ? "text" : "file"));
    } catch (const std::exception& e) {
        logger_.warn(std::string("unreadable transfer receipt: ") + e.what());
    }
    console_.println("Transfer complete");
    finish(0);
}

void TransferClient::handle_transfer_cancelled() {
    if (sending()) {
        if (!transfer_started_) return;
        console_.warn("receiver refused the transfer");
        finish(1);
        return;
    }
    if (receiver_.active()) {
        console_.warn("sender cancelled the transfer");
        finish(1);
    }
}

void TransferClient::handle_file_start(const proto::Message& m) {
    if (sending()) return;
    if (!kx_.ready()) {
        logger_.warn("file_start before key agreement, dropped");
        return;
    }

    TransferMetadata meta;
    try {
        meta = open_metadata(SealedField{m.encrypted_metadata, m.metadata_iv}, kx_.key());
    } catch (const std::exception& e) {
        logger_.warn(std::string("cannot open transfer metadata: ") + e.what());
        console_.warn("transfer metadata could not be decrypted");
        send_cancel();
        finish(1);
        return;
    }

    if (receiver_.active()) {
        receiver_.abort();
        drop_partial_output();
    }

    std::string name = base_name(meta.name);
    if (name.empty()) name = "received.bin";
    fs::path path = fs::path(opts_.out_dir) / name;

    std::error_code ec;
    if (fs::exists(path, ec) && !opts_.force) {
        console_.warn(path.string() + " already exists (use --force to overwrite)");
        send_cancel();
        finish(1);
        return;
    }

    extract_dir_.clear();
    if (meta.is_folder) {
        std::string folder = base_name(meta.original_folder_name);
        if (folder.empty()) folder = fs::path(name).stem().string();
        const fs::path dir = fs::path(opts_.out_dir) / folder;
        if (fs::exists(dir, ec) && !opts_.force) {
            console_.warn(dir.string() + " already exists (use --force to overwrite)");
            send_cancel();
            finish(1);
            return;
        }
        extract_dir_ = dir.string();
    }

    out_.open(path, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!out_.is_open()) {
        console_.warn("cannot write " + path.string());
        send_cancel();
        finish(1);
        return;
    }
    out_path_ = path.string();

    if (meta.is_folder) {
        console_.println("Incoming folder " + meta.original_folder_name + " (zipped)");
    } else if (meta.is_multiple_files) {
        console_.println("Incoming multi-file archive");
    }
    console_.println("Receiving " + name + " (" + std::to_string(meta.total_size) + " bytes)");

    receiver_.begin(meta, kx_.key(),
                    [this](const uint8_t* data, size_t len) {
                        out_.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(len));
                    },
                    now_ms());
}

void TransferClient::handle_file_chunk(const proto::Message& m) {
    if (sending()) return;

    auto res = receiver_.on_chunk(m.chunk_num, m.chunk_data, m.iv_b64, now_ms());
    switch (res) {
    case ChunkReceiver::ChunkResult::APPLIED:
    case ChunkReceiver::ChunkResult::BUFFERED:
        break;
    case ChunkReceiver::ChunkResult::DUPLICATE:
        logger_.debug("duplicate chunk " + std::to_string(m.chunk_num));
        break;
    case ChunkReceiver::ChunkResult::NOT_ACTIVE:
        logger_.debug("chunk " + std::to_string(m.chunk_num) + " outside a transfer, dropped");
        break;
    case ChunkReceiver::ChunkResult::INVALID:
        logger_.warn("invalid chunk number " + std::to_string(m.chunk_num));
        break;
    case ChunkReceiver::ChunkResult::DECRYPT_FAILED:
        logger_.warn("chunk " + std::to_string(m.chunk_num) + " failed authentication");
        console_.warn("transfer aborted: chunk failed to decrypt");
        receiver_.abort();
        drop_partial_output();
        send_cancel();
        finish(1);
        return;
    }

    if (!out_) {
        console_.warn("write failed: " + out_path_);
        receiver_.abort();
        drop_partial_output();
        send_cancel();
        finish(1);
    }
}

void TransferClient::handle_file_end() {
    if (sending() || !receiver_.active()) return;

    const TransferMetadata meta = receiver_.metadata();
    ChunkReceiver::Completion c = receiver_.finish();
    out_.close();

    if (!c.complete || !out_) {
        console_.warn("transfer incomplete: " + std::to_string(c.bytes) + " of " +
                      std::to_string(c.expected_bytes) + " bytes");
        drop_partial_output();
        finish(1);
        return;
    }
    if (!c.hash_ok) {
        console_.warn("warning: content hash mismatch (expected " + c.expected_hash + ", got " +
                      c.actual_hash + "); file kept");
    }

    saved_path_ = out_path_;
    out_path_.clear();
    send_receipt(TransferKind::FILE);

    if (meta.is_folder || meta.is_multiple_files) {
        finish(unpack_archive(meta) ? 0 : 1);
        return;
    }
    console_.println("Saved " + saved_path_);
    finish(0);
}

// Folder: the archive holds <folder>/..., unpacked into out_dir. Several
// files: the archive root is dropped and the files land in out_dir. The
// archive is deleted once unpacked and kept when unpacking fails.
bool TransferClient::unpack_archive(const TransferMetadata& meta) {
    const std::string archive = saved_path_;
    std::vector<std::string> files;
    try {
        if (meta.is_folder) {
            std::error_code ec;
            if (fs::exists(extract_dir_, ec)) fs::remove_all(extract_dir_);
            console_.println("Extracting folder...");
            files = extract_zip(archive, opts_.out_dir, false, opts_.force);
        } else {
            console_.println("Extracting files...");
            files = extract_zip(archive, opts_.out_dir, true, opts_.force);
        }
    } catch (const std::exception& e) {
        console_.warn(std::string("extraction failed: ") + e.what() + "; archive kept at " + archive);
        return false;
    }

    std::error_code ec;
    fs::remove(archive, ec);
    if (ec) logger_.warn("cannot remove " + archive + ": " + ec.message());

    if (meta.is_folder) {
        saved_path_ = extract_dir_;
        console_.println("Folder received: " + extract_dir_ + " (" + std::to_string(files.size()) + " files)");
        return true;
    }
    saved_path_ = opts_.out_dir;
    const fs::path base = safe_extract_path(opts_.out_dir, ".");
    console_.println("Extracted " + std::to_string(files.size()) + " file(s):");
    for (const auto& f : files) console_.println("  - " + fs::path(f).lexically_relative(base).string());
    return true;
}

void TransferClient::handle_text_message(const proto::Message& m) {
    if (sending()) return;
    if (!kx_.ready()) {
        logger_.warn("text_message before key agreement, dropped");
        return;
    }
    std::string text;
    try {
        text = open_text(SealedField{m.encrypted_metadata, m.metadata_iv}, kx_.key());
    } catch (const std::exception& e) {
        logger_.warn(std::string("cannot open text message: ") + e.what());
        return;
    }
    console_.println(text);
    send_receipt(TransferKind::TEXT);
    finish(0);
}

void TransferClient::send_cancel() {
    proto::Message m;
    m.kind = proto::Kind::TRANSFER_CANCELLED;
    send(m);
}

void TransferClient::send_receipt(TransferKind kind) {
    SealedField sealed = seal_transfer_kind(kind, kx_.key());
    proto::Message m;
    m.kind = proto::Kind::TRANSFER_RECEIVED;
    m.data_b64 = sealed.data_b64;
    m.iv_b64 = sealed.iv_b64;
    send(m);
}

void TransferClient::drop_partial_output() {
    if (out_.is_open()) out_.close();
    if (out_path_.empty()) return;
    std::error_code ec;
    fs::remove(out_path_, ec);
    if (ec) logger_.warn("cannot remove partial file " + out_path_ + ": " + ec.message());
    out_path_.clear();
}

void TransferClient::schedule_watchdog() {
    watchdog_timer_.expires_after(std::chrono::milliseconds(opts_.transfer.sweep_interval_ms));
    std::weak_ptr<TransferClient> weak = weak_from_this();
    watchdog_timer_.async_wait([weak](const boost::system::error_code& ec) {
        if (ec) return;
        if (auto self = weak.lock()) self->watchdog();
    });
}

void TransferClient::watchdog() {
    if (done_) return;
    const uint64_t now = now_ms();

    if (receiver_.expired(now)) {
        console_.warn("transfer stalled: no chunk for " + std::to_string(opts_.transfer.idle_timeout_ms) + " ms");
        receiver_.abort();
        drop_partial_output();
        finish(1);
        return;
    }
    if (awaiting_receipt_ && now - receipt_wait_since_ms_ > opts_.transfer.idle_timeout_ms) {
        console_.warn("no confirmation from the receiver");
        finish(1);
        return;
    }
    schedule_watchdog();
}

void TransferClient::finish(int code) {
    if (done_) return;
    done_ = true;
    exit_code_ = code;
    watchdog_timer_.cancel();
    // Stops the sender's timers; its completion sees done_ and does nothing.
    if (sender_ && !sender_->finished()) sender_->abort("client finished");
    if (receiver_.active()) {
        receiver_.abort();
        drop_partial_output();
    }
    remove_staging();
    logger_.info("client finished with status " + std::to_string(code));
    if (on_exit_) on_exit_(code);
}

} // namespace relaycp
