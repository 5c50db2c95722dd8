#include "common/cancellation.hpp"

namespace streamjudge {

cancellation_token::cancellation_token()
    : flag(std::make_shared<std::atomic<bool>>(false)) {}

void cancellation_token::cancel() const {
    flag->store(true);
}

bool cancellation_token::cancelled() const {
    return flag->load();
}

}  // namespace streamjudge
