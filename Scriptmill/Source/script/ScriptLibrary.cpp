
#include <JuceHeader.h>

#include "../util/Trace.h"
#include "../model/ScriptDefinition.h"

#include "ScriptLibrary.h"

ScriptLibrary::ScriptLibrary()
{
}

ScriptLibrary::~ScriptLibrary()
{
}

void ScriptLibrary::add(ScriptDefinition* def)
{
    if (def != nullptr) {
        ScriptDefinition* existing = definitionMap[def->name];
        if (existing != nullptr) {
            Trace(2, "ScriptLibrary: Replacing definition %s", def->name.toRawUTF8());
            definitions.removeObject(existing, true);
        }
        definitions.add(def);
        definitionMap.set(def->name, def);
    }
}

ScriptDefinition* ScriptLibrary::find(const juce::String& name)
{
    return definitionMap[name];
}

bool ScriptLibrary::parse(juce::var json, juce::String& error)
{
    juce::Array<juce::var>* array = json.getArray();
    if (array == nullptr) {
        error = "Script list is not an array";
        return false;
    }

    for (auto& item : *array) {
        std::unique_ptr<ScriptDefinition> def (new ScriptDefinition());
        if (!def->parse(item, error)) {
            Trace(1, "ScriptLibrary: %s", error.toRawUTF8());
            return false;
        }
        add(def.release());
    }
    return true;
}
