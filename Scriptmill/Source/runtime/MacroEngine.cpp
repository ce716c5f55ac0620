
#include <JuceHeader.h>

#include "../util/Trace.h"

#include "ScopeStack.h"
#include "MacroEngine.h"

juce::String MacroExpansion::getErrorMessage()
{
    juce::String msg;
    if (error == ScriptErrorVarLoop)
      msg = variable + " variable refers to itself";
    else if (error == ScriptErrorVarTooDeep)
      msg = "maximum depth reached";
    return msg;
}

bool MacroEngine::expand(ScopeStack* scopes, const juce::String& text,
                         MacroExpansion& expansion)
{
    const juce::ScopedLock lock (scopes->criticalSection);

    ScriptScope* top = scopes->scopes.getLast();
    if (top == nullptr) {
        MacroValues empty;
        return expand(empty, text, expansion);
    }
    return expand(top->variables, text, expansion);
}

bool MacroEngine::expand(const MacroValues& values, const juce::String& text,
                         MacroExpansion& expansion)
{
    juce::StringArray stack;
    juce::String output;

    expansion.error = ScriptErrorNone;
    expansion.variable = juce::String();

    bool success = replace(values, text, stack, output, expansion);

    // on failure the result is whatever was expanded up to the error
    expansion.result = output;
    if (!success)
      Trace(1, "MacroEngine: %s", expansion.getErrorMessage().toRawUTF8());
    return success;
}

/**
 * The scanner toggles between literal text and reading a name each
 * time it sees the sigil.
 *
 * When a name closes and is not a variable, the sigil and the name go
 * back into the output and the closing sigil is looked at again since it
 * may be the start of the next placeholder: "#a#b#" with only b defined
 * expands b.
 */
bool MacroEngine::replace(const MacroValues& values, const juce::String& input,
                          juce::StringArray& stack, juce::String& output,
                          MacroExpansion& expansion)
{
    if (input.isEmpty() || !input.containsChar(VarChar)) {
        output += input;
        return true;
    }

    bool isName = false;
    juce::String name;

    juce::String::CharPointerType ptr = input.getCharPointer();
    while (!ptr.isEmpty()) {
        juce::juce_wchar ch = *ptr;
        bool advance = true;

        if (ch != VarChar) {
            if (isName) {
                name += ch;
                if (name.length() > MaxNameLength) {
                    output += VarChar;
                    output += name;
                    isName = false;
                    name = juce::String();
                }
            }
            else {
                output += ch;
            }
        }
        else {
            if (isName) {
                if (values.contains(name)) {
                    if (stack.contains(name)) {
                        expansion.error = ScriptErrorVarLoop;
                        expansion.variable = name;
                        return false;
                    }
                    if (stack.size() >= MaxDepth) {
                        expansion.error = ScriptErrorVarTooDeep;
                        expansion.variable = name;
                        return false;
                    }

                    stack.add(name);
                    juce::String expanded;
                    if (!replace(values, values[name], stack, expanded, expansion)) {
                        output += expanded;
                        return false;
                    }
                    stack.remove(stack.size() - 1);
                    output += expanded;
                }
                else {
                    output += VarChar;
                    output += name;
                    advance = false;
                }
                name = juce::String();
            }
            isName = !isName;
        }

        if (advance)
          ++ptr;
    }

    // unterminated
    if (isName) {
        output += VarChar;
        output += name;
    }

    return true;
}
