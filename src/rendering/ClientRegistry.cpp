#include "ClientRegistry.h"
#include <cmath>
#include <iostream>

namespace
{
    // Sessions print from their own threads; keep lines whole.
    juce::CriticalSection& getConsoleLock()
    {
        static juce::CriticalSection consoleLock;
        return consoleLock;
    }

    double roundTo(double value, int decimals)
    {
        const double scale = std::pow(10.0, decimals);
        return std::round(value * scale) / scale;
    }
}

//==============================================================================
bool ConsoleStatusChannel::isOpen() const
{
    const juce::ScopedLock sl(getConsoleLock());
    return std::cout.good();
}

void ConsoleStatusChannel::deliver(const juce::String& jsonText)
{
    if (! isOpen())
        return;

    const juce::ScopedLock sl(getConsoleLock());
    std::cout << jsonText << std::endl;
}

//==============================================================================
ClientRegistry::ClientRegistry()
{
}

ClientRegistry::~ClientRegistry()
{
}

juce::String ClientRegistry::connect(std::shared_ptr<StatusChannel> channel)
{
    const juce::String clientId = juce::Uuid().toDashedString();

    {
        const juce::ScopedLock sl(lock);
        channels[clientId] = channel;
    }

    send(clientId, makeConnectedEvent(clientId));
    return clientId;
}

void ClientRegistry::disconnect(const juce::String& clientId)
{
    const juce::ScopedLock sl(lock);
    channels.erase(clientId);
}

bool ClientRegistry::isConnected(const juce::String& clientId) const
{
    const juce::ScopedLock sl(lock);
    return channels.find(clientId) != channels.end();
}

int ClientRegistry::getNumClients() const
{
    const juce::ScopedLock sl(lock);
    return (int) channels.size();
}

bool ClientRegistry::send(const juce::String& clientId, const juce::var& event)
{
    std::shared_ptr<StatusChannel> channel;

    {
        const juce::ScopedLock sl(lock);
        const auto it = channels.find(clientId);
        if (it != channels.end())
            channel = it->second;
    }

    if (channel == nullptr || ! channel->isOpen())
        return false;

    channel->deliver(juce::JSON::toString(event, true));
    return true;
}

juce::var ClientRegistry::makeConnectedEvent(const juce::String& clientId)
{
    auto* object = new juce::DynamicObject();
    object->setProperty("type", "connected");
    object->setProperty("clientId", clientId);
    return juce::var(object);
}

juce::var ClientRegistry::makeStatusEvent(const juce::String& message)
{
    auto* object = new juce::DynamicObject();
    object->setProperty("type", "status");
    object->setProperty("message", message);
    return juce::var(object);
}

juce::var ClientRegistry::makeProgressEvent(const BeatSyncTypes::ProgressEvent& event)
{
    auto* object = new juce::DynamicObject();
    object->setProperty("type", "progress-update");
    object->setProperty("phase", BeatSyncTypes::phaseName(event.phase));
    object->setProperty("stage", BeatSyncTypes::stageName(event.phase));
    object->setProperty("percent", roundTo(event.percent, 2));
    object->setProperty("elapsedTime", roundTo(event.elapsedSeconds, 3));
    object->setProperty("estimatedTimeLeft", roundTo(event.etaSeconds, 3));
    object->setProperty("overallPercent", roundTo(event.overallPercent, 2));
    object->setProperty("overallElapsedTime", roundTo(event.overallElapsedSeconds, 3));
    return juce::var(object);
}

//==============================================================================
StatusPublisher::StatusPublisher(ClientRegistry& r, const juce::String& id)
    : registry(&r),
      clientId(id)
{
}

void StatusPublisher::status(const juce::String& message) const
{
    if (registry != nullptr)
        registry->send(clientId, ClientRegistry::makeStatusEvent(message));
}

void StatusPublisher::progress(const BeatSyncTypes::ProgressEvent& event) const
{
    if (registry != nullptr)
        registry->send(clientId, ClientRegistry::makeProgressEvent(event));
}
