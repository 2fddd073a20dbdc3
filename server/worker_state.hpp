#pragma once

// ============================================================
// worker_state.hpp -- Life cycle of one host-side connection
//
//   READING_COMMAND --line--> EXECUTING --done/failed--> READING_COMMAND
//                                       --transfer-----> STREAMING
//   STREAMING --finished--> READING_COMMAND
//   exit, or any I/O failure --> CLOSED (terminal)
// ============================================================

#include <stdexcept>

enum class WorkerState {
    READING_COMMAND,
    EXECUTING,
    STREAMING,
    CLOSED,
};

enum class WorkerEvent {
    LINE_RECEIVED,
    COMMAND_COMPLETED,
    COMMAND_FAILED,
    TRANSFER_REQUESTED,
    TRANSFER_FINISHED,
    EXIT_REQUESTED,
    IO_FAILURE,
};

const char* worker_state_str(WorkerState s);
const char* worker_event_str(WorkerEvent e);

// Throws std::logic_error for a transition the life cycle does not have.
WorkerState next_state(WorkerState from, WorkerEvent ev);
