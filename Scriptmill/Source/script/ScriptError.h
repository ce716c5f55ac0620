/**
 * Object that describes an error encountered while compiling a script
 * tree or while running one of the runtime support functions.
 *
 * Compilation errors are fatal to the compilation, the first one stops
 * everything and the ScriptCompilation carries it back to the host.
 * Runtime errors fail only the call that raised them.
 */

#pragma once

#include <JuceHeader.h>

typedef enum {
    ScriptErrorNone,

    // a node references a definition the resolver doesn't know
    ScriptErrorNotFound,

    // a required parameter has neither a value nor a default
    ScriptErrorFieldRequired,

    // list values or predefined variables could not be encoded
    ScriptErrorSerialization,

    // macro expansion found a variable that refers to itself
    ScriptErrorVarLoop,

    // macro expansion nested too deeply
    ScriptErrorVarTooDeep,

    // broken scope discipline, means the generated code is wrong
    ScriptErrorInternal

} ScriptErrorType;

class ScriptError
{
  public:

    ScriptError();
    ScriptError(ScriptErrorType t, juce::String s, juce::String d);
    ~ScriptError();

    ScriptErrorType type = ScriptErrorNone;

    // what the error is about: the script name, the field title,
    // or the variable name depending on type
    juce::String subject;

    // for FieldRequired the title of the script owning the field
    juce::String owner;

    // the full message suitable for display
    juce::String details;

    static const char* getTypeName(ScriptErrorType t);

    juce::String toString() const;
};
