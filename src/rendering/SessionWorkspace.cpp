#include "SessionWorkspace.h"

SessionWorkspace::SessionWorkspace(const juce::File& workspaceRoot, const juce::String& id)
    : sessionId(id),
      workspaceDir(workspaceRoot.getChildFile(id)),
      createdAt(juce::Time::getCurrentTime())
{
}

SessionWorkspace::~SessionWorkspace()
{
    remove();
}

juce::Result SessionWorkspace::create()
{
    if (owned)
        return juce::Result::ok();

    if (workspaceDir.exists())
        return juce::Result::fail("Workspace already exists: " + workspaceDir.getFullPathName());

    const auto result = workspaceDir.createDirectory();
    if (result.failed())
        return juce::Result::fail("Failed to create workspace " + workspaceDir.getFullPathName() + ": " + result.getErrorMessage());

    owned = true;
    createdAt = juce::Time::getCurrentTime();
    return juce::Result::ok();
}

void SessionWorkspace::remove()
{
    if (! owned)
        return;

    owned = false;

    if (workspaceDir.exists() && ! workspaceDir.deleteRecursively())
        juce::Logger::writeToLog("WARNING: could not remove workspace " + workspaceDir.getFullPathName());
}

juce::File SessionWorkspace::getFile(const juce::String& name) const
{
    return workspaceDir.getChildFile(name);
}

juce::String SessionWorkspace::createSessionId()
{
    return juce::Uuid().toString();
}
