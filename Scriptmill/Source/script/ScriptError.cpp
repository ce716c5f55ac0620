
#include <JuceHeader.h>

#include "ScriptError.h"

ScriptError::ScriptError()
{
}

ScriptError::ScriptError(ScriptErrorType t, juce::String s, juce::String d)
{
    type = t;
    subject = s;
    details = d;
}

ScriptError::~ScriptError()
{
}

const char* ScriptError::getTypeName(ScriptErrorType t)
{
    const char* name = "None";
    switch (t) {
        case ScriptErrorNone: name = "None"; break;
        case ScriptErrorNotFound: name = "ScriptNotFound"; break;
        case ScriptErrorFieldRequired: name = "FieldRequired"; break;
        case ScriptErrorSerialization: name = "SerializationFailure"; break;
        case ScriptErrorVarLoop: name = "VarLoop"; break;
        case ScriptErrorVarTooDeep: name = "VarTooDeep"; break;
        case ScriptErrorInternal: name = "InternalError"; break;
    }
    return name;
}

juce::String ScriptError::toString() const
{
    return juce::String(getTypeName(type)) + ": " + details;
}
