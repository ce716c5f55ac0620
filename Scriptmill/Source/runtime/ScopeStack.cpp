
#include <JuceHeader.h>

#include "../util/Trace.h"

#include "ScopeStack.h"

ScopeStack::ScopeStack()
{
}

ScopeStack::~ScopeStack()
{
}

void ScopeStack::enter()
{
    const juce::ScopedLock lock (criticalSection);
    scopes.add(new ScriptScope());
}

bool ScopeStack::exit()
{
    const juce::ScopedLock lock (criticalSection);
    bool success = false;
    if (scopes.size() == 0) {
        Trace(1, "ScopeStack: Exit with no open scope");
    }
    else {
        scopes.removeLast();
        success = true;
    }
    return success;
}

bool ScopeStack::setVariable(const juce::String& name, const juce::String& value)
{
    const juce::ScopedLock lock (criticalSection);
    bool success = false;
    ScriptScope* top = scopes.getLast();
    if (top == nullptr) {
        Trace(1, "ScopeStack: Setting variable %s with no open scope", name.toRawUTF8());
    }
    else {
        top->variables.set(name, value);
        success = true;
    }
    return success;
}

bool ScopeStack::getVariable(const juce::String& name, juce::String& value)
{
    const juce::ScopedLock lock (criticalSection);
    bool found = false;
    ScriptScope* top = scopes.getLast();
    if (top != nullptr && top->variables.contains(name)) {
        value = top->variables[name];
        found = true;
    }
    return found;
}

int ScopeStack::getDepth()
{
    const juce::ScopedLock lock (criticalSection);
    return scopes.size();
}

void ScopeStack::clear()
{
    const juce::ScopedLock lock (criticalSection);
    scopes.clear();
}
