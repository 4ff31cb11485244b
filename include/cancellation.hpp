/**
 * @file cancellation.hpp
 * @brief Cooperative cancellation for the backup and restore loops.
 *
 * A CancellationToken is created per operation and polled by the pipeline between
 * units of work. A CancellationGuard binds the token to SIGINT/SIGTERM for the
 * lifetime of one operation and restores the previous handlers on every exit path.
 */

#ifndef CANCELLATION_HPP
#define CANCELLATION_HPP

#include <atomic>
#include <csignal>
#include <memory>

/**
 * @brief One-way "running" -> "cancelled" flag shared with the signal handler.
 *
 * Copies share the same state. The flag never resets within a run.
 */
class CancellationToken {
public:
    CancellationToken();

    /**
     * @brief Requests cancellation. Safe to call more than once.
     */
    void cancel() const noexcept;

    /**
     * @brief True once cancel() ran or an interrupt was delivered under a guard.
     */
    bool cancelled() const noexcept;

private:
    friend class CancellationGuard;
    std::shared_ptr<std::atomic<bool>> state;
};

/**
 * @brief Scoped interrupt handler installation around a pipeline loop.
 *
 * While alive, SIGINT and SIGTERM mark the bound token as cancelled instead of
 * terminating the process. Guards nest: the innermost guard receives the signal and
 * the outer binding is restored when it ends.
 */
class CancellationGuard {
public:
    /**
     * @brief Installs the interrupt handlers and binds them to token.
     *
     * @throws std::runtime_error If the handlers cannot be installed.
     */
    explicit CancellationGuard(const CancellationToken& token);

    /**
     * @brief Restores the handlers and binding that were active before construction.
     */
    ~CancellationGuard();

    CancellationGuard(const CancellationGuard&) = delete;
    CancellationGuard& operator=(const CancellationGuard&) = delete;

private:
    CancellationToken bound;
    std::atomic<bool>* previousTarget;
    struct sigaction previousInt;
    struct sigaction previousTerm;
};

#endif // CANCELLATION_HPP
