/**
 * Class used to hold the results of one compilation.
 *
 * It is created by TreeCompiler and must be disposed of by the caller.
 * Either source is set and errors is empty, or errors has the one error
 * that stopped the compilation and source is empty.  Partial output is
 * never returned.
 */

#pragma once

#include <JuceHeader.h>

#include "../model/LogLevel.h"
#include "ScriptError.h"

class ScriptCompilation
{
  public:

    ScriptCompilation() {}
    ~ScriptCompilation() {}

    // the name of the root definition that was compiled
    juce::String name;

    // the generated program
    juce::String source;

    /**
     * Errors encountered during compilation.
     * There will be at most one since the first one stops the compiler.
     */
    juce::OwnedArray<ScriptError> errors;

    bool hasErrors() {
        return (errors.size() > 0);
    }

    ScriptError* getError() {
        return (errors.size() > 0) ? errors[0] : nullptr;
    }

    //
    // Interesting statistics for the host and the tests
    //

    // number of func blocks emitted
    int functions = 0;

    // number of call statements emitted
    int calls = 0;

    // number of entries in the constant block
    int constants = 0;
};

/**
 * Settings the host passes to each compilation.
 * These come from the request header and the application configuration.
 */
class CompilerSettings
{
  public:

    CompilerSettings() {}
    ~CompilerSettings() {}

    // language of the current UI
    juce::String language {"en"};

    // language code whose table holds the definition defaults
    juce::String defaultLanguage {"en"};

    // level used by the run block when the root definition says LogInherit
    int defaultLogLevel = LogInfo;

    /**
     * Message for FieldRequired errors, %1 is replaced with the field title
     * and %2 with the script title.  The host replaces this with a localized
     * string.
     */
    juce::String fieldRequiredFormat {"The field '%1' is required in script '%2'"};

    /**
     * Message for ScriptNotFound errors, %1 is replaced with the script name.
     */
    juce::String notFoundFormat {"Unable to find script '%1'"};
};
