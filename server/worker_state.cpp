// ============================================================
// worker_state.cpp
// ============================================================

#include "worker_state.hpp"
#include <string>

const char* worker_state_str(WorkerState s) {
    switch (s) {
        case WorkerState::READING_COMMAND: return "ReadingCommand";
        case WorkerState::EXECUTING:       return "Executing";
        case WorkerState::STREAMING:       return "Streaming";
        case WorkerState::CLOSED:          return "Closed";
    }
    return "?";
}

const char* worker_event_str(WorkerEvent e) {
    switch (e) {
        case WorkerEvent::LINE_RECEIVED:      return "LineReceived";
        case WorkerEvent::COMMAND_COMPLETED:  return "CommandCompleted";
        case WorkerEvent::COMMAND_FAILED:     return "CommandFailed";
        case WorkerEvent::TRANSFER_REQUESTED: return "TransferRequested";
        case WorkerEvent::TRANSFER_FINISHED:  return "TransferFinished";
        case WorkerEvent::EXIT_REQUESTED:     return "ExitRequested";
        case WorkerEvent::IO_FAILURE:         return "IoFailure";
    }
    return "?";
}

WorkerState next_state(WorkerState from, WorkerEvent ev) {
    if (ev == WorkerEvent::IO_FAILURE && from != WorkerState::CLOSED) {
        return WorkerState::CLOSED;
    }

    switch (from) {
        case WorkerState::READING_COMMAND:
            if (ev == WorkerEvent::LINE_RECEIVED) return WorkerState::EXECUTING;
            break;
        case WorkerState::EXECUTING:
            switch (ev) {
                case WorkerEvent::COMMAND_COMPLETED:
                case WorkerEvent::COMMAND_FAILED:     return WorkerState::READING_COMMAND;
                case WorkerEvent::TRANSFER_REQUESTED: return WorkerState::STREAMING;
                case WorkerEvent::EXIT_REQUESTED:     return WorkerState::CLOSED;
                default: break;
            }
            break;
        case WorkerState::STREAMING:
            if (ev == WorkerEvent::TRANSFER_FINISHED) return WorkerState::READING_COMMAND;
            break;
        case WorkerState::CLOSED:
            break;
    }

    throw std::logic_error(std::string("Illegal worker transition: ") +
                           worker_event_str(ev) + " in " + worker_state_str(from));
}
