// ============================================================
// client_worker.cpp -- Per-connection command loop
// ============================================================

#include "client_worker.hpp"
#include "../common/errors.hpp"
#include "../common/logger.hpp"
#include "../common/transfer.hpp"

ClientWorker::ClientWorker(TcpSocket sock, const HostConfig& cfg,
                           const CommandDispatcher& dispatcher)
    : cfg_(cfg)
    , dispatcher_(dispatcher)
    , conn_(std::move(sock), cfg.password)
    , env_(conn_, cfg.root_dir)
{
    peer_ = conn_.peer_addr();
}

void ClientWorker::fire(WorkerEvent ev) {
    WorkerState from = state_.load();
    WorkerState to = next_state(from, ev);
    LOG_DEBUG(peer_ + ": " + worker_state_str(from) + " --" + worker_event_str(ev) +
              "--> " + worker_state_str(to));
    state_.store(to);
}

void ClientWorker::write_prompt() {
    conn_.channel().write_text(env_.current_path().string() + "> ");
}

void ClientWorker::shutdown() {
    std::lock_guard<std::mutex> lk(close_mutex_);
    if (!closed_) conn_.channel().shutdown();
}

void ClientWorker::run() {
    LOG_INFO("Client connected: " + peer_);

    try {
        env_.writeln("Connected to rshell. Type help for a list of commands.");
        write_prompt();
    } catch (const ConnectionError& e) {
        LOG_DEBUG(peer_ + ": " + e.what());
        fire(WorkerEvent::IO_FAILURE);
    }

    while (state_.load() != WorkerState::CLOSED) {
        switch (state_.load()) {
            case WorkerState::READING_COMMAND: read_command(); break;
            case WorkerState::EXECUTING:       execute();      break;
            case WorkerState::STREAMING:       stream();       break;
            case WorkerState::CLOSED:                          break;
        }
    }

    env_.mark_disconnected();
    {
        std::lock_guard<std::mutex> lk(close_mutex_);
        conn_.channel().shutdown();
        conn_.channel().close();
        closed_ = true;
    }
    LOG_INFO("Client disconnected: " + peer_);
}

void ClientWorker::read_command() {
    bool got = false;
    try {
        got = conn_.channel().read_line(line_);
    } catch (const ConnectionError& e) {
        LOG_DEBUG(peer_ + ": " + e.what());
    }
    fire(got ? WorkerEvent::LINE_RECEIVED : WorkerEvent::IO_FAILURE);
}

void ClientWorker::execute() {
    LOG_DEBUG(peer_ + " $ " + line_);
    std::string failure;
    try {
        CommandResult r = dispatcher_.dispatch(env_, line_);
        if (r.status == CommandResult::Status::TERMINATE) {
            fire(WorkerEvent::EXIT_REQUESTED);
            return;
        }
        if (r.transfer) {
            pending_ = r.transfer;
            fire(WorkerEvent::TRANSFER_REQUESTED);
            return;
        }
        fire(WorkerEvent::COMMAND_COMPLETED);
        write_prompt();
        return;
    } catch (const ConnectionError& e) {
        LOG_DEBUG(peer_ + ": " + e.what());
        fire(WorkerEvent::IO_FAILURE);
        return;
    } catch (const std::exception& e) {
        failure = e.what();
    }

    // Command failure: report it and carry on
    LOG_WARN(peer_ + ": command failed: " + failure);
    fire(WorkerEvent::COMMAND_FAILED);
    try {
        env_.writeln("Error: " + failure);
        write_prompt();
    } catch (const ConnectionError& e) {
        LOG_DEBUG(peer_ + ": " + e.what());
        fire(WorkerEvent::IO_FAILURE);
    }
}

void ClientWorker::stream() {
    TransferRequest req = *pending_;
    pending_.reset();

    TransferOptions opts = cfg_.transfer;
    std::string peer = peer_;
    opts.progress_sink = [peer](const std::string& line) {
        LOG_INFO(peer + " transfer: " + line);
    };

    try {
        TransferResult res;
        if (req.direction == TransferDirection::DOWNLOAD) {
            res = transfer::send_path(conn_, req.path, opts);
        } else {
            opts.overwrite = req.overwrite;
            transfer::request_upload(conn_, req.path);
            std::string preceding;
            if (!transfer::expect_marker(conn_.channel(), preceding)) {
                throw ConnectionError("Connection closed by " + peer_ + " before upload");
            }
            res = transfer::receive_path(conn_, env_.current_path(), opts);
            // Lines typed while the client was answering run after the upload
            conn_.channel().unread(preceding.data(), preceding.size());
        }

        if (res.ok()) {
            LOG_INFO(peer_ + ": " + direction_str(req.direction) + " " + res.path + " (" +
                     std::to_string(res.bytes) + " bytes) done");
        } else {
            LOG_WARN(peer_ + ": " + direction_str(req.direction) + " " +
                     transfer_status_str(res.status) + ": " + res.message);
        }
        fire(WorkerEvent::TRANSFER_FINISHED);
        env_.writeln(res.message);
        write_prompt();
    } catch (const ConnectionError& e) {
        Logger::get().transfer_error(peer_ + ": " + direction_str(req.direction) + " " +
                                     req.path + ": " + e.what());
        fire(WorkerEvent::IO_FAILURE);
    } catch (const ProtocolError& e) {
        LOG_WARN(peer_ + ": " + e.what());
        try {
            if (state_.load() == WorkerState::STREAMING) fire(WorkerEvent::TRANSFER_FINISHED);
            env_.writeln(std::string("Transfer aborted: ") + e.what());
            write_prompt();
        } catch (const ConnectionError& ce) {
            LOG_DEBUG(peer_ + ": " + ce.what());
            fire(WorkerEvent::IO_FAILURE);
        }
    } catch (const std::exception& e) {
        // The exchange is out of step with the peer; nothing on this
        // connection can be trusted any more
        Logger::get().transfer_error(peer_ + ": " + direction_str(req.direction) + " " +
                                     req.path + ": " + e.what());
        fire(WorkerEvent::IO_FAILURE);
    }
}
