#pragma once

#include "benchkit/types.h"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <variant>
#include <vector>

namespace benchkit::detail {

// Wire format of the single message a process worker sends back.

struct UsageEntry {
    static constexpr std::uint64_t cbor_tag = 5101;
    std::string  name;
    std::int64_t value{0};
};

struct MsgAttemptResult {
    static constexpr std::uint64_t cbor_tag = 5001;
    bool                    has_answer{false};
    std::string             answer;
    std::vector<UsageEntry> usage;
};

struct MsgAttemptError {
    static constexpr std::uint64_t cbor_tag = 5002;
    std::string message;
};

using WorkerPayload = std::variant<MsgAttemptResult, MsgAttemptError>;

struct WorkerMessage {
    std::uint32_t version{1};
    WorkerPayload payload{};
};

struct WorkerDecodeResult {
    bool          ok{false};
    std::string   error;
    WorkerMessage message{};
};

WorkerMessage make_result_message(const Output &output);
WorkerMessage make_error_message(std::string message);
Output        to_output(const MsgAttemptResult &result);

std::vector<std::byte> encode_worker_message(const WorkerMessage &msg, std::string *error = nullptr);
WorkerDecodeResult     decode_worker_message(std::span<const std::byte> data);

} // namespace benchkit::detail
