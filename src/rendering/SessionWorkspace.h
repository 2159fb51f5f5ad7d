#pragma once
#include <juce_core/juce_core.h>

/**
 * Scoped owner of one session's temporary directory.
 *
 * The directory <root>/<sessionId> is created by create() and removed
 * recursively when the object is destroyed, whichever way the session ends
 * (success, failure result, or an exception unwinding through the pipeline).
 * Nothing else writes into it, so removal never touches another session.
 */
class SessionWorkspace
{
public:
    SessionWorkspace(const juce::File& workspaceRoot, const juce::String& sessionId);
    ~SessionWorkspace();

    /** Creates the directory; fails if it cannot be created or already exists. */
    juce::Result create();

    /** Removes the directory now; further calls and the destructor are no-ops. */
    void remove();

    const juce::String& getSessionId() const noexcept { return sessionId; }
    const juce::File& getDirectory() const noexcept { return workspaceDir; }
    const juce::Time& getCreatedAt() const noexcept { return createdAt; }

    bool isActive() const noexcept { return owned; }

    /** Shorthand for getDirectory().getChildFile(name). */
    juce::File getFile(const juce::String& name) const;

    /** A fresh random session id. */
    static juce::String createSessionId();

private:
    juce::String sessionId;
    juce::File workspaceDir;
    juce::Time createdAt;
    bool owned = false;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(SessionWorkspace)
};
