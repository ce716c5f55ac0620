/**
 * The runtime support functions called by a generated program.
 *
 * One of these is created by the host for each program run and handed to
 * the scripting engine, which binds the methods below to the functions
 * the generated text calls:
 *
 *     init(name, value, ...)      push a scope and bind arguments
 *     deinit()                    pop the scope
 *     initcmd(name, args...)      trace a call, always true
 *     LogOutput(level, message)   write to the log
 *     macro(text)                 expand #name# placeholders
 *     SetLogLevel(level)          change the level, returns the old one
 *     SetVariable(name, value)    bind in the top scope
 *     SetVariables(json)          bind every key of a JSON object
 *
 * There is no global state, everything a run touches lives here.
 */

#pragma once

#include <JuceHeader.h>

#include "ScopeStack.h"
#include "LogChannel.h"
#include "MacroEngine.h"

class ScriptRuntime
{
  public:

    ScriptRuntime();
    ~ScriptRuntime();

    ScopeStack* getScopes() {
        return &scopes;
    }

    LogChannel* getLog() {
        return &log;
    }

    /**
     * Prepare for a new run.  Scopes are dropped and the
     * log level goes back to the initial level.
     */
    void reset(int initialLevel = LogInfo);

    /**
     * True if the program broke scope discipline.  That means the
     * compiler generated bad code and the run can't be trusted.
     */
    bool isCorrupted() {
        return corrupted;
    }

    //
    // Call surface
    //

    void init(const juce::Array<juce::var>& args);
    bool deinit();
    bool initcmd(const juce::String& name, const juce::Array<juce::var>& args);
    void logOutput(int level, const juce::String& message);
    bool macro(const juce::String& text, MacroExpansion& expansion);
    int setLogLevel(int level);
    bool setVariable(const juce::String& name, const juce::String& value);
    bool setVariables(const juce::String& json);

    // for the host
    bool getVariable(const juce::String& name, juce::String& value);

  private:

    ScopeStack scopes;
    LogChannel log;

    bool corrupted = false;

    void internalError(const juce::String& msg);
};
