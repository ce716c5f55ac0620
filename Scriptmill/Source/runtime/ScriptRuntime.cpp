
#include <JuceHeader.h>

#include "../util/Trace.h"

#include "ScriptRuntime.h"

ScriptRuntime::ScriptRuntime()
{
}

ScriptRuntime::~ScriptRuntime()
{
    if (scopes.getDepth() > 0)
      Trace(2, "ScriptRuntime: Destructing with %ld open scopes", (long)scopes.getDepth());
}

void ScriptRuntime::reset(int initialLevel)
{
    scopes.clear();
    log.setLevel(initialLevel);
    corrupted = false;
}

void ScriptRuntime::internalError(const juce::String& msg)
{
    corrupted = true;
    Trace(1, "ScriptRuntime: %s", msg.toRawUTF8());
    log.emit(LogError, "internal error: " + msg);
}

//////////////////////////////////////////////////////////////////////
//
// Call surface
//
//////////////////////////////////////////////////////////////////////

/**
 * Arguments come in name/value pairs, the generated code passes
 * each parameter of the function by name so the script tree
 * inside can reference them as #name#.
 */
void ScriptRuntime::init(const juce::Array<juce::var>& args)
{
    scopes.enter();

    int pairs = args.size() / 2;
    if ((args.size() % 2) != 0)
      Trace(2, "ScriptRuntime: init with unpaired argument %s",
            args.getLast().toString().toRawUTF8());

    for (int i = 0 ; i < pairs ; i++) {
        const juce::var& name = args.getReference(i * 2);
        const juce::var& value = args.getReference(i * 2 + 1);
        juce::String svalue = value.isBool() ? juce::String((bool)value ? "true" : "false")
                                             : value.toString();
        scopes.setVariable(name.toString(), svalue);
    }
}

bool ScriptRuntime::deinit()
{
    bool success = scopes.exit();
    if (!success)
      internalError("deinit without a matching init");
    return success;
}

bool ScriptRuntime::initcmd(const juce::String& name, const juce::Array<juce::var>& args)
{
    log.trace(name, args);
    return true;
}

void ScriptRuntime::logOutput(int level, const juce::String& message)
{
    log.emit(level, message);
}

bool ScriptRuntime::macro(const juce::String& text, MacroExpansion& expansion)
{
    return MacroEngine::expand(&scopes, text, expansion);
}

int ScriptRuntime::setLogLevel(int level)
{
    return log.setLevel(level);
}

bool ScriptRuntime::setVariable(const juce::String& name, const juce::String& value)
{
    bool success = scopes.setVariable(name, value);
    if (!success)
      internalError("SetVariable " + name + " with no open scope");
    return success;
}

/**
 * Load the predefined variables of a script, a flat JSON object
 * produced by the compiler.
 */
bool ScriptRuntime::setVariables(const juce::String& json)
{
    juce::var parsed;
    juce::Result result = juce::JSON::parse(json, parsed);
    if (result.failed()) {
        Trace(1, "ScriptRuntime: Unable to parse variables %s",
              result.getErrorMessage().toRawUTF8());
        return false;
    }

    juce::DynamicObject* obj = parsed.getDynamicObject();
    if (obj == nullptr) {
        Trace(1, "ScriptRuntime: Variables are not an object");
        return false;
    }

    bool success = true;
    for (auto& prop : obj->getProperties()) {
        if (!setVariable(prop.name.toString(), prop.value.toString()))
          success = false;
    }
    return success;
}

bool ScriptRuntime::getVariable(const juce::String& name, juce::String& value)
{
    return scopes.getVariable(name, value);
}
