
#include <JuceHeader.h>

#include "../util/Trace.h"
#include "../model/ScriptDefinition.h"

#include "StringPool.h"
#include "ScriptCompilation.h"
#include "PredefinedVars.h"

PredefinedVars::PredefinedVars(StringPool* p, CompilerSettings* s)
{
    pool = p;
    settings = s;
}

PredefinedVars::~PredefinedVars()
{
}

void PredefinedVars::add(const ScriptLanguage* lang, juce::StringPairArray& vars)
{
    if (lang != nullptr) {
        const juce::StringArray& keys = lang->strings.getAllKeys();
        for (auto& key : keys) {
            if (!key.startsWithChar(ReservedPrefix))
              vars.set(key, lang->strings[key]);
        }
    }
}

void PredefinedVars::merge(const ScriptDefinition* def, juce::StringPairArray& vars)
{
    add(def->getLanguage(settings->defaultLanguage), vars);
    if (settings->language != settings->defaultLanguage)
      add(def->getLanguage(settings->language), vars);
}

/**
 * The variables go out as a JSON object, keys sorted so the constant
 * is the same for the same table regardless of how it was loaded.
 */
juce::String PredefinedVars::build(const ScriptDefinition* def)
{
    juce::String statement;

    juce::StringPairArray vars (false);
    merge(def, vars);

    if (vars.size() > 0) {
        juce::StringArray keys = vars.getAllKeys();
        keys.sort(false);

        juce::DynamicObject::Ptr obj = new juce::DynamicObject();
        for (auto& key : keys)
          obj->setProperty(key, vars[key]);

        juce::String json = juce::JSON::toString(juce::var(obj.get()), true);
        statement = "SetVariables(" + pool->intern(json) + ")\n";

        Trace(3, "PredefinedVars: %s %s", def->name.toRawUTF8(), json.toRawUTF8());
    }

    return statement;
}
