/**
 * Resolution of script names to definitions.
 *
 * The compiler only needs ScriptResolver.  The host usually has its own
 * store of definitions and implements the interface over that.  ScriptLibrary
 * is a simple owning implementation used by the CLI and the tests.
 */

#pragma once

#include <JuceHeader.h>

class ScriptResolver
{
  public:

    virtual ~ScriptResolver() {}

    /**
     * Return the definition with this name or nullptr.
     * The definition must remain valid for the duration of the compilation.
     */
    virtual class ScriptDefinition* find(const juce::String& name) = 0;
};

class ScriptLibrary : public ScriptResolver
{
  public:

    ScriptLibrary();
    ~ScriptLibrary();

    /**
     * Add a definition, ownership is taken.
     * A definition with the same name is replaced.
     */
    void add(class ScriptDefinition* def);

    class ScriptDefinition* find(const juce::String& name) override;

    int size() {
        return definitions.size();
    }

    /**
     * Load definitions from a JSON array.
     */
    bool parse(juce::var json, juce::String& error);

  private:

    juce::OwnedArray<class ScriptDefinition> definitions;
    juce::HashMap<juce::String,class ScriptDefinition*> definitionMap;
};
