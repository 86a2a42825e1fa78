/**
 * @brief Implements the per-device request sequences for the bulb HTTP API.
 */
#include "bulbs/bulb/BulbClient.hpp"

#include "bulbs/bulb/BulbProtocol.hpp"
#include "bulbs/core/Error.hpp"
#include "bulbs/log/Log.hpp"

#include <optional>
#include <variant>

namespace bulbs::bulb {

using bulbs::unexpected;
using core::CommandResult;
using core::DeviceFailure;
using core::FailureKind;
namespace asio = bulbs::net::asio;

namespace {

template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

// Budget left before @p deadline; nullopt once it has passed.
std::optional<std::chrono::milliseconds> remaining(BulbClient::Deadline deadline) {
    const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - BulbClient::Clock::now());
    if (left.count() <= 0) {
        return std::nullopt;
    }
    return left;
}

DeviceFailure httpStatusFailure(const net::HttpResponse& response) {
    return DeviceFailure{FailureKind::ProtocolError,
                         core::make_error_code(core::errc::protocol_error),
                         "HTTP " + std::to_string(response.status) +
                             (response.reason.empty() ? "" : " " + response.reason)};
}

} // namespace

DeviceFailure BulbClient::classify(const core::DeviceAddress& address, const std::error_code& ec) {
    DeviceFailure failure;
    failure.cause = ec;
    if (ec == asio::error::timed_out) {
        failure.kind = FailureKind::Timeout;
    } else if (ec == std::errc::protocol_error || ec == core::errc::protocol_error) {
        failure.kind = FailureKind::ProtocolError;
        failure.detail = "malformed response";
    } else {
        failure.kind = FailureKind::ConnectionError;
        failure.detail = ec.message();
    }
    logDebug("[BulbClient] ", address, ": ", failure.describe(), "\n");
    return failure;
}

CommandResult BulbClient::execute(const core::DeviceAddress& address,
                                  const core::Operation& operation,
                                  std::chrono::milliseconds timeout) {
    const auto deadline = Clock::now() + timeout;
    return std::visit(overloaded{
        [&](const core::SetPower& op) { return write(address, protocol::powerPath(op.on), deadline); },
        [&](const core::SetBrightness& op) { return write(address, protocol::brightnessPath(op.value), deadline); },
        [&](const core::SetColor& op) { return write(address, protocol::colorPath(op.value), deadline); },
        [&](const core::Toggle&) { return flipPower(address, deadline); },
        [&](const core::QueryStatus&) { return fetchStatus(address, deadline); },
    }, operation);
}

CommandResult BulbClient::queryStatus(const core::DeviceAddress& address,
                                      std::chrono::milliseconds timeout) {
    return fetchStatus(address, Clock::now() + timeout);
}

CommandResult BulbClient::setPower(const core::DeviceAddress& address, bool on,
                                   std::chrono::milliseconds timeout) {
    return write(address, protocol::powerPath(on), Clock::now() + timeout);
}

CommandResult BulbClient::setBrightness(const core::DeviceAddress& address,
                                        core::Brightness brightness,
                                        std::chrono::milliseconds timeout) {
    return write(address, protocol::brightnessPath(brightness), Clock::now() + timeout);
}

CommandResult BulbClient::setColor(const core::DeviceAddress& address, const core::Rgb& color,
                                   std::chrono::milliseconds timeout) {
    return write(address, protocol::colorPath(color), Clock::now() + timeout);
}

CommandResult BulbClient::toggle(const core::DeviceAddress& address,
                                 std::chrono::milliseconds timeout) {
    return flipPower(address, Clock::now() + timeout);
}

CommandResult BulbClient::fetchStatus(const core::DeviceAddress& address, Deadline deadline) {
    auto left = remaining(deadline);
    if (!left) {
        return unexpected(classify(address, asio::error::timed_out));
    }
    net::HttpClient http(*left);
    auto response = http.get(address.host(), address.port(), protocol::STATUS_PATH);
    if (!response) {
        return unexpected(classify(address, response.error()));
    }
    if (!response->ok()) {
        return unexpected(httpStatusFailure(*response));
    }

    auto state = protocol::decodeStatus(response->body);
    if (!state) {
        logError("[BulbClient] ", address, " sent an unreadable status: ", response->body, "\n");
        return unexpected(DeviceFailure{FailureKind::ProtocolError, state.error(),
                                        "unreadable status body"});
    }
    return *state;
}

CommandResult BulbClient::write(const core::DeviceAddress& address, std::string_view target,
                                Deadline deadline) {
    auto left = remaining(deadline);
    if (!left) {
        return unexpected(classify(address, asio::error::timed_out));
    }
    net::HttpClient http(*left);
    auto response = http.put(address.host(), address.port(), target);
    if (!response) {
        return unexpected(classify(address, response.error()));
    }
    if (!response->ok()) {
        return unexpected(httpStatusFailure(*response));
    }

    // Some firmware answers writes with the full status; use it when it parses.
    if (auto state = protocol::decodeStatus(response->body)) {
        return *state;
    }
    return fetchStatus(address, deadline);
}

CommandResult BulbClient::flipPower(const core::DeviceAddress& address, Deadline deadline) {
    auto current = fetchStatus(address, deadline);
    if (!current) {
        return current;
    }
    return write(address, protocol::powerPath(!current->power), deadline);
}

} // namespace bulbs::bulb
