/**
 * Expansion of #name# placeholders.
 *
 * A placeholder is a variable name between two '#' characters.  Names
 * found in the scope are replaced with their value, which is expanded in
 * turn.  Names that are not found are left in the text as they were.
 *
 * The variables in progress are carried down the recursion in an explicit
 * stack so a variable that leads back to itself is caught, and so is
 * expansion nested deeper than MaxDepth.
 */

#pragma once

#include <JuceHeader.h>

#include "../script/ScriptError.h"

/**
 * The result of one expansion.
 */
class MacroExpansion
{
  public:

    MacroExpansion() {}
    ~MacroExpansion() {}

    juce::String result;

    // ScriptErrorVarLoop or ScriptErrorVarTooDeep on failure
    ScriptErrorType error = ScriptErrorNone;

    // the variable being expanded when the error happened
    juce::String variable;

    bool failed() {
        return (error != ScriptErrorNone);
    }

    juce::String getErrorMessage();
};

typedef juce::HashMap<juce::String,juce::String> MacroValues;

class MacroEngine
{
  public:

    static const juce::juce_wchar VarChar = '#';

    // names longer than this are not names
    static const int MaxNameLength = 32;

    // maximum number of variables being expanded at once
    static const int MaxDepth = 16;

    /**
     * Expand against the top scope.  The scope lock is held for the whole
     * expansion.  With no open scope nothing resolves.
     */
    static bool expand(class ScopeStack* scopes, const juce::String& text,
                       MacroExpansion& expansion);

    /**
     * Expand against an arbitrary set of values.  Used directly for
     * localizing titles against a language table.
     */
    static bool expand(const MacroValues& values, const juce::String& text,
                       MacroExpansion& expansion);

  private:

    static bool replace(const MacroValues& values, const juce::String& input,
                        juce::StringArray& stack, juce::String& output,
                        MacroExpansion& expansion);

};
