#include "../server/worker_state.hpp"

#include <iostream>
#include <map>
#include <utility>

static int tests_failed = 0;

#define TEST_ASSERT(cond, msg) \
    do { \
        if (!(cond)) { \
            std::cerr << "FAIL: " << msg << " [" << __FILE__ << ":" << __LINE__ << "]" << std::endl; \
            tests_failed++; \
            return false; \
        } \
    } while (0)

static const WorkerState ALL_STATES[] = {
    WorkerState::READING_COMMAND, WorkerState::EXECUTING,
    WorkerState::STREAMING, WorkerState::CLOSED,
};

static const WorkerEvent ALL_EVENTS[] = {
    WorkerEvent::LINE_RECEIVED, WorkerEvent::COMMAND_COMPLETED, WorkerEvent::COMMAND_FAILED,
    WorkerEvent::TRANSFER_REQUESTED, WorkerEvent::TRANSFER_FINISHED,
    WorkerEvent::EXIT_REQUESTED, WorkerEvent::IO_FAILURE,
};

// Every legal transition; anything else must throw
static std::map<std::pair<WorkerState, WorkerEvent>, WorkerState> legal_table() {
    using S = WorkerState;
    using E = WorkerEvent;
    return {
        {{S::READING_COMMAND, E::LINE_RECEIVED},      S::EXECUTING},
        {{S::READING_COMMAND, E::IO_FAILURE},         S::CLOSED},
        {{S::EXECUTING,       E::COMMAND_COMPLETED},  S::READING_COMMAND},
        {{S::EXECUTING,       E::COMMAND_FAILED},     S::READING_COMMAND},
        {{S::EXECUTING,       E::TRANSFER_REQUESTED}, S::STREAMING},
        {{S::EXECUTING,       E::EXIT_REQUESTED},     S::CLOSED},
        {{S::EXECUTING,       E::IO_FAILURE},         S::CLOSED},
        {{S::STREAMING,       E::TRANSFER_FINISHED},  S::READING_COMMAND},
        {{S::STREAMING,       E::IO_FAILURE},         S::CLOSED},
    };
}

static bool test_exactly_documented_transitions() {
    auto table = legal_table();
    for (WorkerState s : ALL_STATES) {
        for (WorkerEvent e : ALL_EVENTS) {
            auto it = table.find({s, e});
            bool threw = false;
            WorkerState got = s;
            try {
                got = next_state(s, e);
            } catch (const std::logic_error&) {
                threw = true;
            }
            if (it == table.end()) {
                TEST_ASSERT(threw, worker_event_str(e) << " accepted in " << worker_state_str(s));
            } else {
                TEST_ASSERT(!threw, worker_event_str(e) << " rejected in " << worker_state_str(s));
                TEST_ASSERT(got == it->second, worker_event_str(e) << " in " << worker_state_str(s)
                            << " went to " << worker_state_str(got));
            }
        }
    }
    return true;
}

static bool test_download_session_walk() {
    WorkerState s = WorkerState::READING_COMMAND;
    s = next_state(s, WorkerEvent::LINE_RECEIVED);
    s = next_state(s, WorkerEvent::TRANSFER_REQUESTED);
    TEST_ASSERT(s == WorkerState::STREAMING, "transfer does not stream");
    s = next_state(s, WorkerEvent::TRANSFER_FINISHED);
    s = next_state(s, WorkerEvent::LINE_RECEIVED);
    s = next_state(s, WorkerEvent::COMMAND_FAILED);
    TEST_ASSERT(s == WorkerState::READING_COMMAND, "failed command is fatal");
    s = next_state(s, WorkerEvent::LINE_RECEIVED);
    s = next_state(s, WorkerEvent::EXIT_REQUESTED);
    TEST_ASSERT(s == WorkerState::CLOSED, "exit does not close");
    return true;
}

int main() {
    std::cout << "--- Worker state machine tests ---" << std::endl;

    if (test_exactly_documented_transitions()) std::cout << "PASS: transition table" << std::endl;
    if (test_download_session_walk())          std::cout << "PASS: session walk" << std::endl;

    if (tests_failed != 0) {
        std::cerr << "FAILED: " << tests_failed << " test(s)" << std::endl;
        return 1;
    }
    std::cout << "ALL PASS" << std::endl;
    return 0;
}
