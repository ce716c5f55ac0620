
#include <JuceHeader.h>

#include "ScriptNode.h"
#include "ScriptDefinition.h"

//////////////////////////////////////////////////////////////////////
//
// ParamSpec
//
//////////////////////////////////////////////////////////////////////

/**
 * Editor format:
 *
 *    {"name": "from", "title": "#from#", "type": 1,
 *     "options": {"required": true, "default": "", "type": ""}}
 *
 * The kind may also be given by name which is easier to read in tests.
 */
bool ParamSpec::parse(juce::var json, juce::String& error)
{
    juce::DynamicObject* obj = json.getDynamicObject();
    if (obj == nullptr) {
        error = "Parameter is not an object";
        return false;
    }

    name = obj->getProperty("name").toString();
    if (name.isEmpty()) {
        error = "Parameter has no name";
        return false;
    }
    title = obj->getProperty("title").toString();
    if (title.isEmpty())
      title = name;

    juce::var jtype = obj->getProperty("type");
    if (jtype.isString()) {
        static const char* const names[] = {"checkbox", "textarea", "singletext",
                                            "select", "number", "list"};
        juce::String s = jtype.toString().toLowerCase();
        int found = -1;
        for (int i = 0 ; i < 6 && found < 0 ; i++) {
            if (s == names[i])
              found = i;
        }
        if (found < 0) {
            error = "Parameter " + name + " has unknown type " + s;
            return false;
        }
        kind = (ParamKind)found;
    }
    else {
        int k = (int)jtype;
        if (k < ParamCheckbox || k > ParamList) {
            error = "Parameter " + name + " has unknown type " + juce::String(k);
            return false;
        }
        kind = (ParamKind)k;
    }

    juce::DynamicObject* options = obj->getProperty("options").getDynamicObject();
    if (options != nullptr) {
        required = (bool)options->getProperty("required");
        defaultValue = options->getProperty("default").toString();
        passthroughType = options->getProperty("type").toString();
    }
    return true;
}

//////////////////////////////////////////////////////////////////////
//
// ScriptDefinition
//
//////////////////////////////////////////////////////////////////////

const char* ScriptDefinition::SourceCodeName = "source-code";

ScriptDefinition::ScriptDefinition()
{
}

ScriptDefinition::~ScriptDefinition()
{
}

bool ScriptDefinition::isSourceCode() const
{
    return name == SourceCodeName;
}

ScriptLanguage* ScriptDefinition::getLanguage(juce::String langCode) const
{
    ScriptLanguage* found = nullptr;
    for (auto lang : languages) {
        if (lang->code == langCode) {
            found = lang;
            break;
        }
    }
    return found;
}

ScriptLanguage* ScriptDefinition::getOrCreateLanguage(juce::String langCode)
{
    ScriptLanguage* lang = getLanguage(langCode);
    if (lang == nullptr) {
        lang = new ScriptLanguage();
        lang->code = langCode;
        languages.add(lang);
    }
    return lang;
}

/**
 * Editor format:
 *
 *    {"settings": {"name": "copy-file", "title": "#title#", "loglevel": 5},
 *     "code": "CopyFile(from, to)\n%body%",
 *     "params": [ ... ],
 *     "tree": [ ... ],
 *     "langs": {"en": {"title": "Copy File"}, "ru": { ... }}}
 */
bool ScriptDefinition::parse(juce::var json, juce::String& error)
{
    juce::DynamicObject* obj = json.getDynamicObject();
    if (obj == nullptr) {
        error = "Script definition is not an object";
        return false;
    }

    juce::DynamicObject* settings = obj->getProperty("settings").getDynamicObject();
    if (settings == nullptr) {
        error = "Script definition has no settings";
        return false;
    }

    name = settings->getProperty("name").toString();
    if (name.isEmpty()) {
        error = "Script definition has no name";
        return false;
    }
    title = settings->getProperty("title").toString();

    juce::var jlevel = settings->getProperty("loglevel");
    logLevel = (jlevel.isVoid()) ? LogInherit : (int)jlevel;
    if (logLevel < LogDisable || logLevel > LogInherit) {
        error = "Script " + name + " has invalid log level " + juce::String(logLevel);
        return false;
    }

    code = obj->getProperty("code").toString();

    juce::var jparams = obj->getProperty("params");
    if (!jparams.isVoid()) {
        juce::Array<juce::var>* array = jparams.getArray();
        if (array == nullptr) {
            error = "Script " + name + " params is not an array";
            return false;
        }
        for (auto& item : *array) {
            std::unique_ptr<ParamSpec> param (new ParamSpec());
            if (!param->parse(item, error))
              return false;
            params.add(param.release());
        }
    }

    if (!ScriptNode::parseList(obj->getProperty("tree"), tree, error))
      return false;

    juce::DynamicObject* langs = obj->getProperty("langs").getDynamicObject();
    if (langs != nullptr) {
        for (auto& prop : langs->getProperties()) {
            ScriptLanguage* lang = getOrCreateLanguage(prop.name.toString());
            juce::DynamicObject* table = prop.value.getDynamicObject();
            if (table != nullptr) {
                for (auto& entry : table->getProperties())
                  lang->strings.set(entry.name.toString(), entry.value.toString());
            }
        }
    }

    return true;
}

ScriptDefinition* ScriptDefinition::fromJson(juce::String text, juce::String& error)
{
    juce::var json;
    juce::Result result = juce::JSON::parse(text, json);
    if (result.failed()) {
        error = result.getErrorMessage();
        return nullptr;
    }

    std::unique_ptr<ScriptDefinition> def (new ScriptDefinition());
    if (!def->parse(json, error))
      return nullptr;
    return def.release();
}
