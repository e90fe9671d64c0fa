#include "retry_policy.hpp"

bool RetryPolicy::should_retry(const TranscribeError& err) const {
    using namespace transcribe_error;

    if (std::holds_alternative<Timeout>(err) || std::holds_alternative<Network>(err)) {
        return true;
    }
    if (auto* server = std::get_if<Server>(&err)) {
        return server->status == 429 || (server->status >= 500 && server->status <= 599);
    }
    return false;
}

std::chrono::nanoseconds RetryPolicy::next_delay(std::chrono::nanoseconds previous) const {
    return previous * 2;
}
