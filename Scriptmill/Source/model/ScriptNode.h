/**
 * One invocation of a script definition within the user-authored tree.
 *
 * Parameter values are kept as juce::var which carries whatever shape
 * the editor sent for that parameter kind: strings for text fields,
 * bools or strings for checkboxes, arrays for lists.  ValueCoercion is
 * the only thing that looks inside them.
 */

#pragma once

#include <JuceHeader.h>

class ScriptNode
{
  public:

    ScriptNode();
    ~ScriptNode();

    // name of the ScriptDefinition this invokes
    juce::String name;

    // when set the node and its whole subtree are skipped
    bool disabled = false;

    juce::NamedValueSet values;

    juce::OwnedArray<ScriptNode> children;

    juce::var getValue(const juce::String& param) const;
    void setValue(const juce::String& param, juce::var value);

    ScriptNode* add(ScriptNode* child);

    bool parse(juce::var json, juce::String& error);

    /**
     * Parse a JSON array of nodes into an owned list.
     * Used for both the children of a node and a definition's own tree.
     */
    static bool parseList(juce::var json, juce::OwnedArray<ScriptNode>& list,
                          juce::String& error);
};
