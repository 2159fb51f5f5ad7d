#pragma once
#include <juce_core/juce_core.h>
#include "BeatSyncTypes.h"
#include <map>
#include <memory>

//==============================================================================
/** Somewhere a client's status events can be written to. */
class StatusChannel
{
public:
    virtual ~StatusChannel() = default;

    virtual bool isOpen() const = 0;

    /** Writes one event, already serialised as a single-line JSON object. */
    virtual void deliver(const juce::String& jsonText) = 0;
};

//==============================================================================
/** Writes events to stdout, one JSON object per line. */
class ConsoleStatusChannel : public StatusChannel
{
public:
    ConsoleStatusChannel() = default;

    /** Open for as long as stdout accepts writes. */
    bool isOpen() const override;
    void deliver(const juce::String& jsonText) override;

private:
    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(ConsoleStatusChannel)
};

//==============================================================================
/**
 * Maps client ids to their status channels.
 *
 * Delivery is at-most-once and best-effort: an event for a client that is
 * unknown, disconnected or whose channel has closed is dropped without error.
 * Nothing is buffered for later.
 */
class ClientRegistry
{
public:
    ClientRegistry();
    ~ClientRegistry();

    /** Registers a channel under a fresh id and sends it the "connected" event. */
    juce::String connect(std::shared_ptr<StatusChannel> channel);

    void disconnect(const juce::String& clientId);

    bool isConnected(const juce::String& clientId) const;
    int getNumClients() const;

    /** @return true if the event was handed to an open channel */
    bool send(const juce::String& clientId, const juce::var& event);

    static juce::var makeConnectedEvent(const juce::String& clientId);
    static juce::var makeStatusEvent(const juce::String& message);
    static juce::var makeProgressEvent(const BeatSyncTypes::ProgressEvent& event);

private:
    mutable juce::CriticalSection lock;
    std::map<juce::String, std::shared_ptr<StatusChannel>> channels;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(ClientRegistry)
};

//==============================================================================
/**
 * A registry bound to one client id; this is what a session publishes through.
 * A default-constructed publisher drops everything.
 */
class StatusPublisher
{
public:
    StatusPublisher() = default;
    StatusPublisher(ClientRegistry& registry, const juce::String& clientId);

    void status(const juce::String& message) const;
    void progress(const BeatSyncTypes::ProgressEvent& event) const;

    const juce::String& getClientId() const noexcept { return clientId; }

private:
    ClientRegistry* registry = nullptr;
    juce::String clientId;
};
