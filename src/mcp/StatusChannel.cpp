// SPDX-License-Identifier: Apache-2.0
#include "StatusChannel.hpp"

#include <core/Log.hpp>

#include <exception>
#include <vector>

namespace vaultlink
{

auto StatusChannel::subscribe(Handler handler) -> Token
{
    auto lock = std::lock_guard(_mutex);
    auto const token = _nextToken++;
    _subscribers.push_back(Subscriber { .token = token, .handler = std::move(handler) });
    return token;
}

void StatusChannel::unsubscribe(Token token)
{
    auto lock = std::lock_guard(_mutex);
    std::erase_if(_subscribers, [token](const Subscriber& s) { return s.token == token; });
}

void StatusChannel::publish(const StatusEvent& event)
{
    // Copy so handlers may subscribe or unsubscribe while being notified.
    auto subscribers = std::vector<Subscriber> {};
    {
        auto lock = std::lock_guard(_mutex);
        subscribers = _subscribers;
    }

    for (const auto& subscriber: subscribers)
    {
        try
        {
            subscriber.handler(event);
        }
        catch (const std::exception& e)
        {
            log::error("Status subscriber failed for {} ({}): {}",
                       event.serverId,
                       statusToString(event.status),
                       e.what());
        }
    }
}

auto StatusChannel::subscriberCount() const -> std::size_t
{
    auto lock = std::lock_guard(_mutex);
    return _subscribers.size();
}

} // namespace vaultlink
