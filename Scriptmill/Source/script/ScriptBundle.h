/**
 * A compilation request read from a single JSON file.
 *
 *     {"lang": "en", "loglevel": 3, "root": "main",
 *      "scripts": [ {definition}, ... ]}
 *
 * The bundle carries the settings the host would normally supply,
 * the name of the root definition, and every definition the tree can
 * reach.  Used by the command line compiler and the tests.
 */

#pragma once

#include <JuceHeader.h>

#include "ScriptCompilation.h"
#include "ScriptLibrary.h"

class ScriptBundle
{
  public:

    ScriptBundle();
    ~ScriptBundle();

    CompilerSettings settings;

    juce::String rootName;

    ScriptLibrary library;

    bool parse(juce::var json, juce::String& error);
    bool parse(juce::String text, juce::String& error);
    bool read(juce::File file, juce::String& error);

    /**
     * Compile the root definition.  The result is owned by the caller.
     */
    ScriptCompilation* compile();
};
