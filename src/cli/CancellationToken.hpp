#pragma once

#include <atomic>
#include <memory>

namespace clicore {

/**
 * @brief Shared cancellation flag passed through middleware to the command
 *
 * Copies observe the same flag. The core only forwards the token; commands
 * and middleware decide whether to honor it.
 */
class CancellationToken {
public:
    CancellationToken() : state(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() const { state->store(true); }
    bool isCancellationRequested() const { return state->load(); }

private:
    std::shared_ptr<std::atomic<bool>> state;
};

}
