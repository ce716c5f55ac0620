/**
 * Compiler from a tree of script invocations to the text of a program
 * for the downstream scripting engine.
 *
 * Each distinct definition reached in the tree becomes one function, emitted
 * the first time it is seen and called from then on.  Every node becomes a
 * call site.  String values go into the constant pool and are referenced
 * by name.  The raw source definition is the exception, it is not a shared
 * function, each node either contributes its code directly to the function
 * block or gets its own numbered function.
 *
 * A compiler may be reused but not shared, all state is reset on each
 * call to compile.
 */

#pragma once

#include <JuceHeader.h>

#include "ScriptCompilation.h"
#include "ValueCoercion.h"

class TreeCompiler
{
  public:

    /**
     * The enumeration of log severities that follows the constant block.
     */
    static const char* IotaBlock;

    TreeCompiler();
    ~TreeCompiler();

    /**
     * Compile a root definition and everything reachable from its tree.
     * The compilation is returned whether it succeeded or not and is owned
     * by the caller.  Settings may be null to use the defaults.
     */
    ScriptCompilation* compile(class ScriptDefinition* root, CompilerSettings* settings,
                               class ScriptResolver* resolver);

  private:

    CompilerSettings defaultSettings;

    // state for the compilation in progress
    CompilerSettings* settings = nullptr;
    class ScriptResolver* resolver = nullptr;
    ScriptCompilation* unit = nullptr;
    std::unique_ptr<class StringPool> pool;
    std::unique_ptr<ValueCoercion> coercion;
    std::unique_ptr<class PredefinedVars> predefs;

    // ids of functions already emitted
    juce::StringArray emitted;

    // the accumulated function block
    juce::String funcs;

    // numbers raw source functions
    int sourceCounter = 0;

    void reset();

    bool compileNode(class ScriptNode* node, juce::String& statement);
    bool compileChildren(const juce::OwnedArray<class ScriptNode>& nodes, juce::String& body);

    bool compileFunction(class ScriptDefinition* def, class ScriptNode* node,
                         juce::Array<CoercedValue>& values, const juce::String& id);
    bool compileSource(class ScriptDefinition* def, class ScriptNode* node,
                       juce::Array<CoercedValue>& values, juce::String& statement);
    void compileGlobalSource(const juce::String& code);
    void compileSourceInstance(class ScriptDefinition* def, const juce::String& code,
                               juce::String& statement);

    void addFunction(class ScriptDefinition* def, const juce::String& id,
                     juce::Array<CoercedValue>& values, const juce::String& code);
    juce::String callSite(const juce::String& id, juce::Array<CoercedValue>& values);

    juce::String compileRun(class ScriptDefinition* root, bool& success);

    void addError(ScriptErrorType type, const juce::String& subject, const juce::String& details);
};
