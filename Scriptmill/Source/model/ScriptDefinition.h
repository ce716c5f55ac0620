/**
 * Model for a script definition.
 *
 * A definition is a named, parameterized code template.  The editor
 * places invocations of definitions in a tree of ScriptNodes and the
 * compiler turns each distinct definition into one function of the
 * generated program.
 *
 * Definitions are supplied whole by the host for the duration of one
 * compilation and are never modified by the compiler.
 */

#pragma once

#include <JuceHeader.h>

#include "LogLevel.h"

/**
 * The kinds of parameter a definition may declare.
 * The numbers match the "type" values found in definition JSON.
 */
typedef enum {
    ParamCheckbox = 0,
    ParamTextarea,
    ParamSingleText,
    ParamSelect,
    ParamNumber,
    ParamList
} ParamKind;

/**
 * Declaration of one parameter.
 */
class ParamSpec
{
  public:

    ParamSpec() {}
    ~ParamSpec() {}

    juce::String name;

    // display name, may contain #key# references into the definition's
    // language tables
    juce::String title;

    ParamKind kind = ParamSingleText;

    bool required = false;
    juce::String defaultValue;

    // Select only, when set the selected value is passed through
    // unconverted with this type
    juce::String passthroughType;

    bool parse(juce::var json, juce::String& error);
};

/**
 * One language table, a set of localized strings for a language code.
 * The table for the default language code also holds the definition's
 * predefined variables.
 */
class ScriptLanguage
{
  public:

    ScriptLanguage() {}
    ~ScriptLanguage() {}

    juce::String code;

    // keys are case sensitive
    juce::StringPairArray strings {false};
};

class ScriptDefinition
{
  public:

    /**
     * Name of the raw source definition.  Its value is source text
     * that is inlined rather than called through a shared function.
     * The first parameter is the "global" checkbox and the second the code.
     */
    static const char* SourceCodeName;

    ScriptDefinition();
    ~ScriptDefinition();

    // unique id
    juce::String name;

    juce::String title;

    int logLevel = LogInherit;

    // code template with a %body% placeholder
    juce::String code;

    juce::OwnedArray<ParamSpec> params;

    // the definition's own script tree, compiled once into its function
    juce::OwnedArray<class ScriptNode> tree;

    juce::OwnedArray<ScriptLanguage> languages;

    bool isSourceCode() const;

    ScriptLanguage* getLanguage(juce::String langCode) const;
    ScriptLanguage* getOrCreateLanguage(juce::String langCode);

    /**
     * Build from the JSON produced by the editor.
     * Returns false and leaves a message if the JSON is malformed.
     */
    bool parse(juce::var json, juce::String& error);

    /**
     * Convenience for tests and the CLI.
     */
    static ScriptDefinition* fromJson(juce::String text, juce::String& error);
};
