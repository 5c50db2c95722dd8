#include "judge/offloader.hpp"
#include <glog/logging.h>

namespace streamjudge {
using namespace std;
using namespace streamjudge::backend;

large_input_offloader::large_input_offloader(execution_client &client, size_t threshold)
    : client(client), threshold(threshold) {}

bool large_input_offloader::should_offload(const string &input) const {
    return input.size() >= threshold;
}

remote_result<stdin_payload> large_input_offloader::stage(const string &input) const {
    stdin_payload payload;
    if (!should_offload(input)) {
        payload.content = input;
        return payload;
    }

    auto slot = client.request_large_input_slot();
    if (!slot.ok())
        return remote_failure{"Failed to stage large input: " + slot.error()};

    auto upload = client.upload_large_input(slot.value(), input);
    if (!upload.ok())
        return remote_failure{"Failed to stage large input: " + upload.error()};

    LOG(INFO) << "Offloaded " << input.size() << " bytes of input as " << slot.value().input_id;
    payload.input_id = slot.value().input_id;
    return payload;
}

}  // namespace streamjudge
