/**
 * @file interrupt_guard.cpp
 * @brief SIGINT to cancel-flag routing for the feed download
 */

#include "pkgsentry/feed.hpp"

#include <atomic>
#include <csignal>

namespace pkgsentry::feed {

namespace {

static_assert(std::atomic<bool>::is_always_lock_free);
std::atomic<bool> g_interrupted{false};

void on_interrupt(int /*signal*/)
{
    g_interrupted.store(true);
}

}  // namespace

InterruptGuard::InterruptGuard()
    : m_previous(SIG_ERR)
{
    g_interrupted.store(false);
    m_previous = std::signal(SIGINT, on_interrupt);
}

InterruptGuard::~InterruptGuard()
{
    if (m_previous != SIG_ERR) {
        std::signal(SIGINT, m_previous);
    }
}

std::atomic<bool>* InterruptGuard::cancel_flag() const noexcept
{
    return &g_interrupted;
}

}  // namespace pkgsentry::feed
