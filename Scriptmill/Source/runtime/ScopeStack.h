/**
 * The runtime variable scopes of a running program.
 *
 * Generated code calls init() on entry to every function that has its own
 * script tree, and deinit() on the way out, so the depth of this stack
 * follows the call depth of the program.  Variables are only ever written
 * to and read from the top scope.
 *
 * All operations lock, one program may be running script threads of its
 * own and they share this stack.
 */

#pragma once

#include <JuceHeader.h>

/**
 * One level of variables.
 */
class ScriptScope
{
  public:

    ScriptScope() {}
    ~ScriptScope() {}

    juce::HashMap<juce::String,juce::String> variables;
};

class ScopeStack
{
    friend class MacroEngine;

  public:

    ScopeStack();
    ~ScopeStack();

    /**
     * Push an empty scope.
     */
    void enter();

    /**
     * Pop the top scope.  Returns false if there was nothing open which
     * means the generated code did not balance its init/deinit calls.
     */
    bool exit();

    /**
     * Set a variable in the top scope.  Returns false if no scope is open.
     */
    bool setVariable(const juce::String& name, const juce::String& value);

    /**
     * Read a variable from the top scope.
     */
    bool getVariable(const juce::String& name, juce::String& value);

    int getDepth();

    void clear();

  private:

    juce::CriticalSection criticalSection;

    juce::OwnedArray<ScriptScope> scopes;

};
