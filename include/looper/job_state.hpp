#pragma once

namespace looper {

inline namespace v1 {

/**
 * @brief      The states of a job.
 *
 * The transitions are monotonic: created -> running -> {completed | failed | cancelled}. A created
 * job can also go directly to cancelled. There is no transition out of a terminal state.
 */
enum class job_state : int {
    created = 0, //!< Scheduled, but not yet picked up by a worker
    running,     //!< A worker is executing the closure
    completed,   //!< The closure returned normally; the result is available
    failed,      //!< The closure threw; the error is available
    cancelled,   //!< The job was cancelled; any result was discarded
};

//! Checks whether the given state is terminal (completed, failed or cancelled)
inline bool is_terminal(job_state s) {
    return s == job_state::completed || s == job_state::failed || s == job_state::cancelled;
}

//! Returns the name of the state, e.g. "running"
inline const char* to_string(job_state s) {
    switch (s) {
    case job_state::created:
        return "created";
    case job_state::running:
        return "running";
    case job_state::completed:
        return "completed";
    case job_state::failed:
        return "failed";
    case job_state::cancelled:
        return "cancelled";
    }
    return "unknown";
}

} // namespace v1
} // namespace looper
