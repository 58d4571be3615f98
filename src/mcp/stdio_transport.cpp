#include <attachd/mcp/mcp_server.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>
#include <iostream>
#include <string>

namespace attachd::mcp {

StdioTransport::StdioTransport(std::istream& in, std::ostream& out) : in_(in), out_(out) {
    state_.store(TransportState::Connected);
}

void StdioTransport::send(const json& message) {
    // Input EOF (Disconnected) still allows flushing responses to in-flight requests.
    if (state_.load() == TransportState::Closing) {
        return;
    }
    std::string payload;
    try {
        payload = json_utils::dump_safe(message);
    } catch (const std::exception& e) {
        spdlog::error("StdioTransport::send serialization failed: {}", e.what());
        return;
    }
    std::lock_guard<std::mutex> lock(outMutex_);
    // NDJSON: one message per line.
    out_ << payload << "\n";
    out_.flush();
    if (!out_) {
        spdlog::error("StdioTransport: write to output failed");
        state_.store(TransportState::Closing);
    }
}

MessageResult StdioTransport::receive() {
    auto is_ws = [](unsigned char c) {
        return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
    };

    while (state_.load() == TransportState::Connected) {
        std::string line;
        if (!std::getline(in_, line)) {
            if (in_.eof()) {
                spdlog::info("StdioTransport: EOF on input; treating as client disconnect");
                state_.store(TransportState::Disconnected);
                return Error{ErrorCode::NetworkError, "EOF on stdin"};
            }
            in_.clear();
            continue;
        }

        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        // Tolerate a UTF-8 BOM and leading whitespace/record separators before the JSON.
        if (line.size() >= 3 && static_cast<unsigned char>(line[0]) == 0xEF &&
            static_cast<unsigned char>(line[1]) == 0xBB &&
            static_cast<unsigned char>(line[2]) == 0xBF) {
            line.erase(0, 3);
        }
        auto first = std::find_if_not(line.begin(), line.end(), [&](unsigned char c) {
            return is_ws(c) || c == 0x1e;
        });
        line.erase(line.begin(), first);
        if (line.empty()) {
            continue;
        }

        spdlog::debug("StdioTransport: read line: '{}'", line);
        if (line.front() == '{' || line.front() == '[') {
            auto parsed = json_utils::parse_json(line);
            if (!parsed) {
                spdlog::error("StdioTransport: failed to parse JSON: {}", line);
                recordError();
                if (!shouldRetryAfterError())
                    state_.store(TransportState::Error);
                return parsed.error();
            }
            resetErrorCount();
            return parsed;
        }

        spdlog::error("StdioTransport: invalid message format (expected NDJSON): {}", line);
        recordError();
        if (!shouldRetryAfterError())
            state_.store(TransportState::Error);
        return Error{ErrorCode::InvalidData, "Invalid message format - expected NDJSON"};
    }

    return Error{ErrorCode::NetworkError, "Transport closed during receive"};
}

bool StdioTransport::shouldRetryAfterError() const noexcept {
    constexpr size_t MAX_CONSECUTIVE_ERRORS = 5;
    return errorCount_.load() < MAX_CONSECUTIVE_ERRORS;
}

void StdioTransport::recordError() noexcept {
    errorCount_.fetch_add(1);
}

void StdioTransport::resetErrorCount() noexcept {
    errorCount_.store(0);
}

} // namespace attachd::mcp
