#include "cancellation.hpp"
#include <cerrno>
#include <cstring>
#include <format>
#include <stdexcept>

namespace {

// Flag of the innermost active guard; read from the signal handler.
std::atomic<std::atomic<bool>*> gActiveTarget{nullptr};

static_assert(std::atomic<bool>::is_always_lock_free, "signal handler needs a lock-free flag");
static_assert(std::atomic<std::atomic<bool>*>::is_always_lock_free, "signal handler needs a lock-free pointer");

void signalHandler(int /*sig*/) {
    std::atomic<bool>* target = gActiveTarget.load();
    if (target) {
        target->store(true);
    }
}

} // namespace

CancellationToken::CancellationToken() : state(std::make_shared<std::atomic<bool>>(false)) {}

void CancellationToken::cancel() const noexcept {
    state->store(true);
}

bool CancellationToken::cancelled() const noexcept {
    return state->load();
}

CancellationGuard::CancellationGuard(const CancellationToken& token)
    : bound(token), previousTarget(gActiveTarget.exchange(token.state.get())) {
    struct sigaction sa;
    std::memset(&sa, 0, sizeof(sa));
    sa.sa_handler = signalHandler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;

    if (sigaction(SIGINT, &sa, &previousInt) != 0) {
        int err = errno;
        gActiveTarget.store(previousTarget);
        throw std::runtime_error(std::format("Failed to install SIGINT handler: {}", std::strerror(err)));
    }
    if (sigaction(SIGTERM, &sa, &previousTerm) != 0) {
        int err = errno;
        sigaction(SIGINT, &previousInt, nullptr);
        gActiveTarget.store(previousTarget);
        throw std::runtime_error(std::format("Failed to install SIGTERM handler: {}", std::strerror(err)));
    }
}

CancellationGuard::~CancellationGuard() {
    sigaction(SIGTERM, &previousTerm, nullptr);
    sigaction(SIGINT, &previousInt, nullptr);
    gActiveTarget.store(previousTarget);
}
