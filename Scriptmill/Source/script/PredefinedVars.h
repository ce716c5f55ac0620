/**
 * Builds the statement that loads a definition's predefined variables
 * into the scope of its function.
 *
 * Predefined variables live in the language tables.  The table for the
 * default language holds the base set and the table for the current
 * language overrides it.  Keys starting with the reserved prefix are
 * internal and never become variables.
 */

#pragma once

#include <JuceHeader.h>

class PredefinedVars
{
  public:

    // keys with this prefix are not variables
    static const juce::juce_wchar ReservedPrefix = '_';

    PredefinedVars(class StringPool* p, class CompilerSettings* s);
    ~PredefinedVars();

    /**
     * Return the SetVariables statement for this definition, or an
     * empty string if it has no variables.
     */
    juce::String build(const class ScriptDefinition* def);

    /**
     * Collect the merged variables with keys in sorted order.
     */
    void merge(const class ScriptDefinition* def, juce::StringPairArray& vars);

  private:

    class StringPool* pool;
    class CompilerSettings* settings;

    void add(const class ScriptLanguage* lang, juce::StringPairArray& vars);
};
