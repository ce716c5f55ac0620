/**
 * Conversion of raw parameter values into typed expressions of the
 * generated language.
 *
 * Raw values arrive as juce::var in whatever shape the editor sent.  After
 * coercion the compiler only deals with a type name and an expression
 * string: a bool or int literal, a constant reference, a macro() wrapped
 * constant reference, or passthrough text.
 */

#pragma once

#include <JuceHeader.h>

/**
 * One coerced parameter.
 */
class CoercedValue
{
  public:

    // parameter name, also the name of the function argument
    juce::String name;

    // type in the generated language: bool, str, int or a passthrough type
    juce::String type;

    // expression used at the call site
    juce::String value;

    // the resolved text before interning, used for literal declarations
    juce::String text;
};

class ValueCoercion
{
  public:

    ValueCoercion(class StringPool* p, class CompilerSettings* s,
                  class ScriptCompilation* u);
    ~ValueCoercion();

    /**
     * Coerce one parameter.  When literal is true strings are returned as
     * literals rather than interned, this is used for the declarations of
     * the root script's own parameters.
     *
     * Returns false after adding an error to the compilation.
     */
    bool coerce(const class ScriptDefinition* def, const class ParamSpec* param,
                juce::var raw, bool literal, CoercedValue& result);

    /**
     * Coerce every declared parameter of a definition from the values
     * of a node, in declaration order.
     */
    bool coerceAll(const class ScriptDefinition* def, const class ScriptNode* node,
                   bool literal, juce::Array<CoercedValue>& results);

    /**
     * Serialize a list value as a compact JSON array.
     */
    static bool toCompactJson(const juce::var& value, juce::String& json);

    /**
     * Expand #key# references in a title against the definition's
     * language tables.
     */
    juce::String localize(const class ScriptDefinition* def, const juce::String& text);

  private:

    class StringPool* pool;
    class CompilerSettings* settings;
    class ScriptCompilation* unit;

    juce::String intern(const juce::String& text, bool literal);
    void addRequiredError(const class ScriptDefinition* def, const class ParamSpec* param);
};
