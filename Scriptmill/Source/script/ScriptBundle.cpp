
#include <JuceHeader.h>

#include "../util/Trace.h"
#include "../model/LogLevel.h"
#include "../model/ScriptDefinition.h"

#include "TreeCompiler.h"
#include "ScriptBundle.h"

ScriptBundle::ScriptBundle()
{
}

ScriptBundle::~ScriptBundle()
{
}

bool ScriptBundle::read(juce::File file, juce::String& error)
{
    if (!file.existsAsFile()) {
        error = "Missing file " + file.getFullPathName();
        return false;
    }
    Trace(2, "ScriptBundle: Reading %s", file.getFullPathName().toRawUTF8());
    return parse(file.loadFileAsString(), error);
}

bool ScriptBundle::parse(juce::String text, juce::String& error)
{
    juce::var json;
    juce::Result result = juce::JSON::parse(text, json);
    if (result.failed()) {
        error = result.getErrorMessage();
        return false;
    }
    return parse(json, error);
}

bool ScriptBundle::parse(juce::var json, juce::String& error)
{
    juce::DynamicObject* obj = json.getDynamicObject();
    if (obj == nullptr) {
        error = "Bundle is not an object";
        return false;
    }

    juce::String lang = obj->getProperty("lang").toString();
    if (lang.isNotEmpty())
      settings.language = lang;

    juce::String deflang = obj->getProperty("deflang").toString();
    if (deflang.isNotEmpty())
      settings.defaultLanguage = deflang;

    juce::var jlevel = obj->getProperty("loglevel");
    if (!jlevel.isVoid()) {
        int level = (int)jlevel;
        if (level < LogDisable || level > LogDebug) {
            error = "Invalid log level " + jlevel.toString();
            return false;
        }
        settings.defaultLogLevel = level;
    }

    rootName = obj->getProperty("root").toString();
    if (rootName.isEmpty()) {
        error = "Bundle has no root script";
        return false;
    }

    if (!library.parse(obj->getProperty("scripts"), error))
      return false;

    Trace(2, "ScriptBundle: Loaded %ld scripts", (long)library.size());
    return true;
}

ScriptCompilation* ScriptBundle::compile()
{
    ScriptCompilation* result = nullptr;

    ScriptDefinition* root = library.find(rootName);
    if (root == nullptr) {
        juce::String msg = settings.notFoundFormat.replace("%1", rootName);
        Trace(1, "ScriptBundle: %s", msg.toRawUTF8());
        result = new ScriptCompilation();
        result->name = rootName;
        result->errors.add(new ScriptError(ScriptErrorNotFound, rootName, msg));
    }
    else {
        TreeCompiler compiler;
        result = compiler.compile(root, &settings, &library);
    }
    return result;
}
