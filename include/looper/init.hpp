#pragma once

#include "log.hpp"
#include "errors.hpp"

#include <cstddef>
#include <functional>

namespace looper {

inline namespace v1 {

class dispatcher_pool;

/**
 * @brief      Configuration data for looper
 *
 * Store here all the parameters needed to be passed to looper when initializing. Any parameters
 * that are left unfilled will have reasonable defaults.
 *
 * The same structure is used to configure individual @ref dispatcher_pool objects.
 */
struct init_data {
    //! The number of workers to create in the pool; 0 = number of cores available
    int num_workers_{0};
    //! The maximum number of jobs waiting in the pool's queue; 0 = unbounded
    std::size_t max_pending_{0};
    //! Function to be called at the start of each worker thread.
    //! Use this if you want to do things like setting thread priority, affinity, etc.
    std::function<void()> worker_start_fun_;
    //! The log level to be set at initialization
    log_level log_level_{log_level::warn};

    /**
     * @brief      Creates a configuration from environment variables
     *
     * Reads:
     *  - `LOOPER_NUM_WORKERS` for @ref num_workers_
     *  - `LOOPER_MAX_PENDING` for @ref max_pending_
     *  - `LOOPER_LOG_LEVEL` for @ref log_level_
     *
     * Missing or malformed values keep their defaults (a warning is logged for malformed values).
     */
    static init_data from_env();
};

/**
 * @brief      Initializes the library.
 *
 * @param      config  The configuration to be used; optional.
 *
 * Sets the log level and creates the default dispatcher pool with the given configuration. If the
 * library is already initialized this will throw @ref already_initialized.
 *
 * If this is not explicitly called the library will be initialized with the configuration obtained
 * from @ref init_data::from_env() the first time @ref default_pool() is needed.
 *
 * @see        shutdown(), is_initialized(), default_pool()
 */
void init(const init_data& config = {});

//! Determines if the library is initialized.
bool is_initialized();

/**
 * @brief      Shuts down the library.
 *
 * Shuts down the default pool (letting the submitted work finish) and destroys it. A subsequent
 * call to @ref default_pool() re-initializes the library.
 *
 * @warning    No jobs of the default pool may be referenced by scopes that are still in use.
 */
void shutdown();

/**
 * @brief      Returns the process-wide default pool, initializing the library if needed.
 *
 * Used by @ref scope::create() when no pool is given.
 */
dispatcher_pool& default_pool();

} // namespace v1
} // namespace looper
