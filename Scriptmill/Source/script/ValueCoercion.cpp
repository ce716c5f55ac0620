
#include <JuceHeader.h>

#include "../util/Trace.h"
#include "../util/Util.h"
#include "../model/ScriptDefinition.h"
#include "../model/ScriptNode.h"
#include "../runtime/MacroEngine.h"

#include "StringPool.h"
#include "ScriptCompilation.h"
#include "ValueCoercion.h"

ValueCoercion::ValueCoercion(StringPool* p, CompilerSettings* s, ScriptCompilation* u)
{
    pool = p;
    settings = s;
    unit = u;
}

ValueCoercion::~ValueCoercion()
{
}

juce::String ValueCoercion::intern(const juce::String& text, bool literal)
{
    return (literal) ? StringPool::toLiteral(text) : pool->intern(text);
}

/**
 * Titles may be written as #key# references into the language tables.
 * The default language is laid down first and the current language
 * overrides it.  If expansion fails the title is used as it is.
 */
juce::String ValueCoercion::localize(const ScriptDefinition* def, const juce::String& text)
{
    MacroValues values;
    ScriptLanguage* deflang = def->getLanguage(settings->defaultLanguage);
    if (deflang != nullptr) {
        const juce::StringArray& keys = deflang->strings.getAllKeys();
        for (auto& key : keys)
          values.set(key, deflang->strings[key]);
    }
    if (settings->language != settings->defaultLanguage) {
        ScriptLanguage* lang = def->getLanguage(settings->language);
        if (lang != nullptr) {
            const juce::StringArray& keys = lang->strings.getAllKeys();
            for (auto& key : keys)
              values.set(key, lang->strings[key]);
        }
    }

    MacroExpansion expansion;
    return (MacroEngine::expand(values, text, expansion)) ? expansion.result : text;
}

void ValueCoercion::addRequiredError(const ScriptDefinition* def, const ParamSpec* param)
{
    juce::String field = localize(def, param->title);
    juce::String owner = localize(def, def->title.isEmpty() ? def->name : def->title);
    juce::String msg = settings->fieldRequiredFormat.replace("%1", field).replace("%2", owner);

    ScriptError* error = new ScriptError(ScriptErrorFieldRequired, field, msg);
    error->owner = owner;
    unit->errors.add(error);
    Trace(1, "ValueCoercion: %s", msg.toRawUTF8());
}

bool ValueCoercion::toCompactJson(const juce::var& value, juce::String& json)
{
    if (value.isVoid() || value.isUndefined()) {
        json << "null";
    }
    else if (value.isBool()) {
        json << ((bool)value ? "true" : "false");
    }
    else if (value.isInt() || value.isInt64() || value.isDouble()) {
        json << juce::JSON::toString(value, true);
    }
    else if (value.isString()) {
        json << "\"" << juce::JSON::escapeString(value.toString()) << "\"";
    }
    else if (value.isArray()) {
        json << "[";
        const juce::Array<juce::var>* array = value.getArray();
        for (int i = 0 ; i < array->size() ; i++) {
            if (i > 0)
              json << ",";
            if (!toCompactJson(array->getReference(i), json))
              return false;
        }
        json << "]";
    }
    else if (value.getDynamicObject() != nullptr) {
        json << "{";
        bool first = true;
        for (auto& prop : value.getDynamicObject()->getProperties()) {
            if (!first)
              json << ",";
            first = false;
            json << "\"" << juce::JSON::escapeString(prop.name.toString()) << "\":";
            if (!toCompactJson(prop.value, json))
              return false;
        }
        json << "}";
    }
    else {
        // methods, binary data and foreign objects have no JSON form
        return false;
    }
    return true;
}

bool ValueCoercion::coerce(const ScriptDefinition* def, const ParamSpec* param,
                           juce::var raw, bool literal, CoercedValue& result)
{
    result.name = param->name;

    juce::String text;
    if (raw.isBool())
      text = (bool)raw ? "true" : "false";
    else if (!raw.isVoid() && !raw.isArray())
      text = raw.toString().trim();

    switch (param->kind) {

        case ParamCheckbox: {
            result.type = "bool";
            if (text.isEmpty() || text == "0" || text == "false")
              text = "false";
            else
              text = "true";
            result.value = text;
        }
            break;

        case ParamTextarea:
        case ParamSingleText: {
            result.type = "str";
            if (text.isEmpty()) {
                text = param->defaultValue;
                if (text.isEmpty() && param->required) {
                    addRequiredError(def, param);
                    return false;
                }
            }
            if (def->isSourceCode()) {
                // raw source is code, not a string
                result.value = text;
            }
            else {
                result.value = intern(text, literal);
                if (!literal && text.containsChar(MacroEngine::VarChar))
                  result.value = "macro(" + result.value + ")";
            }
        }
            break;

        case ParamSelect: {
            if (text.isEmpty())
              text = param->defaultValue;
            if (param->passthroughType.isNotEmpty()) {
                result.type = param->passthroughType;
                result.value = text;
            }
            else {
                result.type = "str";
                result.value = intern(text, literal);
            }
        }
            break;

        case ParamNumber: {
            result.type = "int";
            if (text.isEmpty()) {
                text = param->defaultValue.trim();
                if (text.isEmpty()) {
                    if (param->required) {
                        addRequiredError(def, param);
                        return false;
                    }
                    text = "0";
                }
            }
            if (!IsInteger(text))
              text = juce::String(text.getLargeIntValue());
            result.value = text;
        }
            break;

        case ParamList: {
            result.type = "str";
            const juce::Array<juce::var>* array = raw.getArray();
            if (array != nullptr && array->size() > 0) {
                juce::String json;
                if (!toCompactJson(raw, json)) {
                    juce::String msg = "Unable to encode list " + param->name +
                        " of script " + def->name;
                    unit->errors.add(new ScriptError(ScriptErrorSerialization, param->name, msg));
                    Trace(1, "ValueCoercion: %s", msg.toRawUTF8());
                    return false;
                }
                text = json;
            }
            else {
                if (param->required) {
                    addRequiredError(def, param);
                    return false;
                }
                text = "[]";
            }
            result.value = intern(text, literal);
        }
            break;
    }

    result.text = text;
    return true;
}

bool ValueCoercion::coerceAll(const ScriptDefinition* def, const ScriptNode* node,
                              bool literal, juce::Array<CoercedValue>& results)
{
    for (auto param : def->params) {
        CoercedValue value;
        juce::var raw = (node != nullptr) ? node->getValue(param->name) : juce::var();
        if (!coerce(def, param, raw, literal, value))
          return false;
        results.add(value);
    }
    return true;
}
