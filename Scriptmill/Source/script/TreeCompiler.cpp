
#include <JuceHeader.h>

#include "../util/Trace.h"
#include "../util/Util.h"
#include "../model/LogLevel.h"
#include "../model/ScriptDefinition.h"
#include "../model/ScriptNode.h"

#include "ScriptLibrary.h"
#include "StringPool.h"
#include "PredefinedVars.h"
#include "TreeCompiler.h"

const char* TreeCompiler::IotaBlock =
    "const IOTA { LOG_DISABLE LOG_ERROR LOG_WARN LOG_INFO LOG_DEBUG }\n";

TreeCompiler::TreeCompiler()
{
}

TreeCompiler::~TreeCompiler()
{
}

void TreeCompiler::reset()
{
    pool.reset(new StringPool());
    coercion.reset(new ValueCoercion(pool.get(), settings, unit));
    predefs.reset(new PredefinedVars(pool.get(), settings));
    emitted.clear();
    funcs = "";
    sourceCounter = 0;
}

void TreeCompiler::addError(ScriptErrorType type, const juce::String& subject,
                            const juce::String& details)
{
    unit->errors.add(new ScriptError(type, subject, details));
    Trace(1, "TreeCompiler: %s", details.toRawUTF8());
}

//////////////////////////////////////////////////////////////////////
//
// Program
//
//////////////////////////////////////////////////////////////////////

ScriptCompilation* TreeCompiler::compile(ScriptDefinition* root, CompilerSettings* s,
                                         ScriptResolver* r)
{
    settings = (s != nullptr) ? s : &defaultSettings;
    resolver = r;
    unit = new ScriptCompilation();
    reset();

    if (root == nullptr) {
        addError(ScriptErrorNotFound, "", settings->notFoundFormat.replace("%1", ""));
    }
    else {
        unit->name = root->name;
        Trace(2, "TreeCompiler: Compiling %s", root->name.toRawUTF8());

        bool success = true;
        juce::String run = compileRun(root, success);
        if (success) {
            juce::String program;
            program << pool->render()
                    << IotaBlock
                    << funcs
                    << "\nrun {\n" << run << "\ndeinit()}";
            unit->source = program;
            unit->constants = pool->size();
        }
    }

    if (unit->hasErrors()) {
        // partial output is never valid
        unit->source = "";
        unit->functions = 0;
        unit->calls = 0;
        unit->constants = 0;
    }

    ScriptCompilation* result = unit;
    unit = nullptr;
    coercion.reset();
    predefs.reset();
    pool.reset();
    return result;
}

/**
 * The body of the run block.  The root's own parameters become
 * variable declarations with literal values, then the log level,
 * the root scope and the compiled tree.
 */
juce::String TreeCompiler::compileRun(ScriptDefinition* root, bool& success)
{
    juce::String run;

    juce::Array<CoercedValue> values;
    success = coercion->coerceAll(root, nullptr, true, values);
    if (!success)
      return run;

    for (auto& value : values)
      run << value.type << " " << value.name << " = " << value.value << "\n";

    int level = (root->logLevel < LogInherit) ? root->logLevel : settings->defaultLogLevel;
    run << "SetLogLevel(" << level << ")\ninit()\n";

    run << predefs->build(root);

    juce::String code = root->code.replace("%body%", "").trim();
    if (code.isNotEmpty())
      run << code << "\n";

    juce::String body;
    success = compileChildren(root->tree, body);
    run << body;

    return run;
}

//////////////////////////////////////////////////////////////////////
//
// Nodes
//
//////////////////////////////////////////////////////////////////////

bool TreeCompiler::compileChildren(const juce::OwnedArray<ScriptNode>& nodes, juce::String& body)
{
    for (auto node : nodes) {
        if (node->disabled)
          continue;
        juce::String statement;
        if (!compileNode(node, statement))
          return false;
        body << statement;
    }
    return true;
}

bool TreeCompiler::compileNode(ScriptNode* node, juce::String& statement)
{
    ScriptDefinition* def = (resolver != nullptr) ? resolver->find(node->name) : nullptr;
    if (def == nullptr) {
        addError(ScriptErrorNotFound, node->name,
                 settings->notFoundFormat.replace("%1", node->name));
        return false;
    }

    juce::Array<CoercedValue> values;
    if (!coercion->coerceAll(def, node, false, values))
      return false;

    if (def->isSourceCode())
      return compileSource(def, node, values, statement);

    juce::String id = IdName(def->name);
    if (!emitted.contains(id)) {
        // marked before the body so a definition reached again from
        // inside its own tree is a call and not another function
        emitted.add(id);
        if (!compileFunction(def, node, values, id))
          return false;
    }

    statement = callSite(id, values);
    return true;
}

juce::String TreeCompiler::callSite(const juce::String& id, juce::Array<CoercedValue>& values)
{
    juce::StringArray args;
    for (auto& value : values)
      args.add(value.value);

    unit->calls++;
    return "   " + id + "(" + args.joinIntoString(",") + ")\n";
}

//////////////////////////////////////////////////////////////////////
//
// Functions
//
//////////////////////////////////////////////////////////////////////

/**
 * The children of the first node to reach a definition become the
 * body of its function.  A definition with a tree of its own binds its
 * arguments into a new scope and runs that tree after the template.
 */
bool TreeCompiler::compileFunction(ScriptDefinition* def, ScriptNode* node,
                                   juce::Array<CoercedValue>& values, const juce::String& id)
{
    juce::String body;
    if (!compileChildren(node->children, body))
      return false;

    juce::String code = def->code.replace("%body%", body).trimCharactersAtEnd("\r\n");

    if (def->tree.size() > 0) {
        juce::StringArray bindings;
        for (auto& value : values)
          bindings.add("\"" + value.name + "\", " + value.name);

        code << "\ninit(" << bindings.joinIntoString(",") << ")\n";
        code << predefs->build(def);

        juce::String inner;
        if (!compileChildren(def->tree, inner))
          return false;
        code << "\n" << inner << "\ndeinit()";
    }

    addFunction(def, id, values, code);
    return true;
}

void TreeCompiler::addFunction(ScriptDefinition* def, const juce::String& id,
                               juce::Array<CoercedValue>& values, const juce::String& code)
{
    juce::StringArray params;
    juce::String names;
    for (auto& value : values) {
        params.add(value.type + " " + value.name);
        names << "," << value.name;
    }

    juce::String func;
    func << "func " << id << "(" << params.joinIntoString(",") << ") {\n";
    func << "initcmd(`" << def->name << "`" << names << ")\n";

    bool bracket = (def->logLevel >= LogDisable && def->logLevel < LogInherit);
    if (bracket)
      func << "int prevLog = SetLogLevel(" << def->logLevel << ")\n";

    func << code;

    if (bracket)
      func << "\nSetLogLevel(prevLog)";

    func << "\n}\n";

    funcs << func;
    unit->functions++;
    Trace(3, "TreeCompiler: Emitted function %s", id.toRawUTF8());
}

//////////////////////////////////////////////////////////////////////
//
// Raw source
//
//////////////////////////////////////////////////////////////////////

/**
 * Raw source nodes carry their code in the second value and a global
 * flag in the first.  Children are substituted into the code the same
 * way they are for a template.
 */
bool TreeCompiler::compileSource(ScriptDefinition* def, ScriptNode* node,
                                 juce::Array<CoercedValue>& values, juce::String& statement)
{
    juce::String body;
    if (!compileChildren(node->children, body))
      return false;

    bool global = (values.size() > 0 && values[0].value == "true");
    juce::String code = (values.size() > 1) ? values[1].value : juce::String();
    code = code.replace("%body%", body);

    if (global)
      compileGlobalSource(code);
    else
      compileSourceInstance(def, code, statement);

    return true;
}

void TreeCompiler::compileGlobalSource(const juce::String& code)
{
    funcs << code << "\n";
}

void TreeCompiler::compileSourceInstance(ScriptDefinition* def, const juce::String& code,
                                         juce::String& statement)
{
    juce::String id = IdName(def->name) + juce::String(sourceCounter);
    sourceCounter++;

    juce::Array<CoercedValue> none;
    addFunction(def, id, none, code.trimCharactersAtEnd("\r\n"));
    statement = callSite(id, none);
}
