// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Types.hpp>

#include <cstdint>
#include <functional>
#include <mutex>
#include <vector>

namespace vaultlink
{

/// @brief Typed observer list for server status transitions.
///
/// Subscribers are invoked synchronously, in subscription order, on the thread that
/// publishes. A subscriber that throws is logged and does not prevent the others from running.
class StatusChannel
{
  public:
    using Handler = std::function<void(const StatusEvent&)>;
    using Token = std::uint64_t;

    /// @brief Registers @p handler and returns a token for unsubscribe().
    [[nodiscard]] auto subscribe(Handler handler) -> Token;

    /// @brief Removes the subscription identified by @p token. Unknown tokens are ignored.
    void unsubscribe(Token token);

    void publish(const StatusEvent& event);

    [[nodiscard]] auto subscriberCount() const -> std::size_t;

  private:
    struct Subscriber
    {
        Token token;
        Handler handler;
    };

    mutable std::mutex _mutex;
    std::vector<Subscriber> _subscribers;
    Token _nextToken = 1;
};

} // namespace vaultlink
