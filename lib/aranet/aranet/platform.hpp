/**
 * ARANET Platform Layer - platform detection, worker threads and the
 * first-completion race used by discovery
 */

#ifndef ARANET_PLATFORM_HPP_
#define ARANET_PLATFORM_HPP_

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <utility>

#include "log.hpp"

// ---------------------- Platform Detection ----------------------

// ESP-IDF (bare or under Arduino): std::thread maps onto FreeRTOS tasks via esp_pthread
#if defined(ESP_PLATFORM) && !defined(ARANET_NO_ESP_PTHREAD)
    #define ARANET_HAS_ESP_PTHREAD
    #include <esp_pthread.h>
#endif

// Stack for the discovery search thread; it walks the scan results
#ifndef ARANET_SEARCH_STACK_SIZE
    #define ARANET_SEARCH_STACK_SIZE 4096
#endif

namespace aranet_sync {

/**
 * @brief Configure the next std::thread spawned by the calling thread
 *
 * On ESP-IDF the default pthread stack is too small for a BLE scan walk;
 * other platforms need nothing.
 */
inline void prepareWorkerThread(const char* name) {
#ifdef ARANET_HAS_ESP_PTHREAD
    esp_pthread_cfg_t cfg = esp_pthread_get_default_config();
    cfg.stack_size = ARANET_SEARCH_STACK_SIZE;
    cfg.thread_name = name;
    const esp_err_t rc = esp_pthread_set_cfg(&cfg);
    if (rc != ESP_OK) {
        ARANET_LOG_WARN("[sync] esp_pthread_set_cfg(%s) failed: %d, using defaults\n", name, rc);
    }
#else
    (void)name;
#endif
}

// ---------------------- Cancellation ----------------------

// State shared by the waiting side and the worker
struct CancelState {
    std::mutex mutex;
    std::condition_variable cv;
    bool cancelled = false;
    bool finished = false;
};

/**
 * @brief Worker-side view of a cancellable operation
 *
 * Holds shared ownership, so a worker abandoned by its waiter keeps
 * valid state until it exits.
 */
class CancelToken {
    std::shared_ptr<CancelState> state_;

public:
    explicit CancelToken(std::shared_ptr<CancelState> state) : state_(std::move(state)) {}

    bool cancelled() const {
        std::lock_guard<std::mutex> lock(state_->mutex);
        return state_->cancelled;
    }

    // Waits up to `period`; returns false if cancelled before or during the wait
    bool sleepFor(const std::chrono::milliseconds period) const {
        std::unique_lock<std::mutex> lock(state_->mutex);
        return !state_->cv.wait_for(lock, period, [this] { return state_->cancelled; });
    }
};

// ---------------------- First-Completion Race ----------------------

/**
 * @brief Run `search` on its own thread against a deadline
 *
 * Search signature: std::optional<T>(const CancelToken&). It may loop
 * forever as long as it polls the token.
 *
 * Whichever side finishes first wins:
 *   - search first: its result is returned and the worker is joined
 *   - deadline first: the token is cancelled, the worker is detached and
 *     std::nullopt is returned without waiting for any call the worker has
 *     in flight
 */
template<typename T>
class DeadlineRace {
    struct State : CancelState {
        std::optional<T> result;
    };

public:
    template<typename Search>
    static std::optional<T> run(Search search, const std::chrono::milliseconds deadline,
                                const char* name = "aranet_race") {
        auto state = std::make_shared<State>();

        prepareWorkerThread(name);
        std::thread worker([state, search = std::move(search)]() mutable {
            std::optional<T> found = search(CancelToken(state));

            std::lock_guard<std::mutex> lock(state->mutex);
            if (!state->cancelled) {
                state->result = std::move(found);
            }
            state->finished = true;
            state->cv.notify_all();
        });

        std::unique_lock<std::mutex> lock(state->mutex);
        if (state->cv.wait_for(lock, deadline, [&state] { return state->finished; })) {
            std::optional<T> result = std::move(state->result);
            lock.unlock();
            worker.join();
            return result;
        }

        state->cancelled = true;
        state->cv.notify_all();
        lock.unlock();
        worker.detach();
        return std::nullopt;
    }
};

} // namespace aranet_sync

#endif // ARANET_PLATFORM_HPP_
