#include "lmreadout/cancel.hpp"

#include <csignal>
#include <cstring>

namespace lmreadout {

static CancelToken* g_token = nullptr;

extern "C" void lmr_on_signal(int) {
    if (g_token) g_token->request_stop();
}

bool install_signal_handlers(CancelToken& token) {
    g_token = &token;

    struct sigaction sa;
    std::memset(&sa, 0, sizeof(sa));
    sa.sa_handler = lmr_on_signal;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;                      // no SA_RESTART: interrupt poll()

    if (sigaction(SIGINT,  &sa, nullptr) != 0) return false;
    if (sigaction(SIGTERM, &sa, nullptr) != 0) return false;
    return true;
}

} // namespace lmreadout
