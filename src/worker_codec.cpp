#include "benchkit/detail/worker_codec.h"

#include <string>
#include <utility>

#include <cbor_tags/cbor_decoder.h>
#include <cbor_tags/cbor_encoder.h>
#include <cbor_tags/cbor.h>

namespace benchkit::detail {

WorkerMessage make_result_message(const Output &output) {
    MsgAttemptResult result;
    result.has_answer = output.answer.has_value();
    if (output.answer)
        result.answer = *output.answer;
    result.usage.reserve(output.usage.size());
    for (const auto &[name, value] : output.usage)
        result.usage.push_back(UsageEntry{name, value});
    WorkerMessage msg{};
    msg.payload = std::move(result);
    return msg;
}

WorkerMessage make_error_message(std::string message) {
    WorkerMessage msg{};
    msg.payload = MsgAttemptError{std::move(message)};
    return msg;
}

Output to_output(const MsgAttemptResult &result) {
    Output out;
    if (result.has_answer)
        out.answer = result.answer;
    for (const auto &entry : result.usage)
        out.usage[entry.name] = entry.value;
    return out;
}

std::vector<std::byte> encode_worker_message(const WorkerMessage &msg, std::string *error) {
    std::vector<std::byte> buffer;
    auto enc = cbor::tags::make_encoder(buffer);
    auto result = enc(msg);
    if (!result) {
        if (error) {
            *error = std::string(cbor::tags::status_message(result.error()));
        }
        buffer.clear();
    }
    return buffer;
}

WorkerDecodeResult decode_worker_message(std::span<const std::byte> data) {
    WorkerDecodeResult out{};
    std::vector<std::byte> buffer(data.begin(), data.end());
    auto dec = cbor::tags::make_decoder(buffer);
    WorkerMessage msg{};
    auto result = dec(msg);
    if (!result) {
        out.ok = false;
        out.error = std::string(cbor::tags::status_message(result.error()));
        return out;
    }
    if (msg.version != WorkerMessage{}.version) {
        out.ok = false;
        out.error = "unsupported worker message version " + std::to_string(msg.version);
        return out;
    }
    out.ok = true;
    out.message = std::move(msg);
    return out;
}

} // namespace benchkit::detail
