
#include <JuceHeader.h>

#include "../model/ScriptDefinition.h"
#include "../script/ScriptLibrary.h"
#include "../script/ScriptCompilation.h"
#include "../script/TreeCompiler.h"

#include "TestSupport.h"

static const char* GreetDefinition = R"({
  "settings": {"name": "greet", "title": "Greet"},
  "code": "Println(who)",
  "params": [{"name": "who", "title": "Who", "type": "singletext"}]
})";

static const char* SourceDefinition = R"({
  "settings": {"name": "source-code", "title": "Source Code"},
  "code": "",
  "params": [
    {"name": "global", "title": "Global", "type": "checkbox"},
    {"name": "code", "title": "Code", "type": "textarea"}
  ]
})";

class TreeCompilerTest : public juce::UnitTest
{
  public:

    TreeCompilerTest() : juce::UnitTest("TreeCompiler", "Compiler") {}

    ScriptLibrary* makeLibrary()
    {
        ScriptLibrary* library = new ScriptLibrary();
        library->add(TestDefinition(*this, GreetDefinition));
        library->add(TestDefinition(*this, SourceDefinition));
        return library;
    }

    ScriptCompilation* compile(ScriptLibrary* library, const char* rootJson,
                               CompilerSettings* settings = nullptr)
    {
        std::unique_ptr<ScriptDefinition> root (TestDefinition(*this, rootJson));
        TreeCompiler compiler;
        return compiler.compile(root.get(), settings, library);
    }

    void runTest() override
    {
        std::unique_ptr<ScriptLibrary> library (makeLibrary());

        beginTest("Complete program");
        {
            std::unique_ptr<ScriptCompilation> result (compile(library.get(), R"({
              "settings": {"name": "main", "loglevel": 5},
              "tree": [{"name": "greet", "values": {"who": "world"}}]
            })"));

            expect(!result->hasErrors());
            juce::String expected;
            expected << "const {\nSTR0 = `world`\n}\n"
                     << "const IOTA { LOG_DISABLE LOG_ERROR LOG_WARN LOG_INFO LOG_DEBUG }\n"
                     << "func greet(str who) {\ninitcmd(`greet`,who)\nPrintln(who)\n}\n"
                     << "\nrun {\nSetLogLevel(3)\ninit()\n   greet(STR0)\n\ndeinit()}";
            expectEquals(result->source, expected);
            expectEquals(result->functions, 1);
            expectEquals(result->calls, 1);
            expectEquals(result->constants, 1);
        }

        beginTest("One function per definition");
        {
            std::unique_ptr<ScriptCompilation> result (compile(library.get(), R"({
              "settings": {"name": "main"},
              "tree": [
                {"name": "greet", "values": {"who": "a"}},
                {"name": "greet", "values": {"who": "b"}},
                {"name": "greet", "values": {"who": "a"}}
              ]
            })"));

            expect(!result->hasErrors());
            expectEquals(result->functions, 1);
            expectEquals(result->calls, 3);
            expectEquals(CountOccurrences(result->source, "func greet("), 1);
            expect(result->source.contains("   greet(STR0)\n   greet(STR1)\n   greet(STR0)\n"));
        }

        beginTest("Children become the body of the first function");
        {
            library->add(TestDefinition(*this, R"({
              "settings": {"name": "repeat-it", "title": "Repeat"},
              "code": "for i in 1..3 {\n%body%\n}\n\n"
            })"));

            std::unique_ptr<ScriptCompilation> result (compile(library.get(), R"({
              "settings": {"name": "main"},
              "tree": [{"name": "repeat-it", "children": [
                  {"name": "greet", "values": {"who": "again"}}
              ]}]
            })"));

            expect(!result->hasErrors());
            expect(result->source.contains(
                "func repeatIt() {\ninitcmd(`repeat-it`)\nfor i in 1..3 {\n   greet(STR0)\n\n}\n}\n"));
            expect(result->source.contains("init()\n   repeatIt()\n"));
            expectEquals(result->calls, 2);
        }

        beginTest("Log level bracket");
        {
            library->add(TestDefinition(*this, R"({
              "settings": {"name": "quiet", "loglevel": 1},
              "code": "Run()"
            })"));

            std::unique_ptr<ScriptCompilation> result (compile(library.get(), R"({
              "settings": {"name": "main"},
              "tree": [{"name": "quiet"}, {"name": "greet", "values": {"who": "x"}}]
            })"));

            expect(result->source.contains(
                "func quiet() {\ninitcmd(`quiet`)\nint prevLog = SetLogLevel(1)\nRun()\nSetLogLevel(prevLog)\n}\n"));
            // greet inherits, no bracket
            expect(result->source.contains("func greet(str who) {\ninitcmd(`greet`,who)\nPrintln(who)\n}\n"));
            expectEquals(CountOccurrences(result->source, "prevLog"), 2);
        }

        beginTest("Definitions with their own tree");
        {
            library->add(TestDefinition(*this, R"({
              "settings": {"name": "wrapper"},
              "code": "Println(`wrap`)",
              "params": [{"name": "a", "title": "A", "type": "singletext"},
                         {"name": "n", "title": "N", "type": "number"}],
              "tree": [{"name": "greet", "values": {"who": "#a#"}}],
              "langs": {"en": {"v": "1", "_title": "internal"}}
            })"));

            std::unique_ptr<ScriptCompilation> result (compile(library.get(), R"({
              "settings": {"name": "main"},
              "tree": [{"name": "wrapper", "values": {"a": "x", "n": 2}}]
            })"));

            expect(!result->hasErrors());
            const juce::String& source = result->source;
            expect(source.contains(
                "func wrapper(str a,int n) {\ninitcmd(`wrapper`,a,n)\nPrintln(`wrap`)\ninit(\"a\", a,\"n\", n)\nSetVariables(STR1)\n\n   greet(macro(STR2))\n\ndeinit()\n}\n"));
            expect(source.contains("   wrapper(STR0,2)\n"));
            expect(source.contains("\"v\""));
            expect(!source.contains("internal"));
        }

        beginTest("Raw source");
        {
            std::unique_ptr<ScriptCompilation> result (compile(library.get(), R"({
              "settings": {"name": "main"},
              "tree": [
                {"name": "source-code", "values": {"global": true, "code": "func helper() {\n}\n"}},
                {"name": "source-code", "values": {"code": "Println(`a`)"}},
                {"name": "source-code", "values": {"global": false, "code": "Println(`b`)\n"}}
              ]
            })"));

            expect(!result->hasErrors());
            const juce::String& source = result->source;
            expect(source.startsWith("const IOTA"));
            // the code is trimmed like any other text value
            expect(source.contains("func helper() {\n}\nfunc sourceCode0() {"));
            expect(source.contains("func sourceCode0() {\ninitcmd(`source-code`)\nPrintln(`a`)\n}\n"));
            expect(source.contains("func sourceCode1() {\ninitcmd(`source-code`)\nPrintln(`b`)\n}\n"));
            expect(source.contains("init()\n   sourceCode0()\n   sourceCode1()\n\ndeinit()}"));
            expectEquals(result->functions, 2);
            expectEquals(result->calls, 2);
            expectEquals(result->constants, 0);
        }

        beginTest("Disabled nodes are skipped with their children");
        {
            std::unique_ptr<ScriptCompilation> result (compile(library.get(), R"({
              "settings": {"name": "main"},
              "tree": [
                {"name": "greet", "disable": true, "values": {"who": "secret"},
                 "children": [{"name": "no-such-script"}]},
                {"name": "greet", "values": {"who": "shown"}}
              ]
            })"));

            expect(!result->hasErrors());
            expect(!result->source.contains("secret"));
            expectEquals(result->constants, 1);
            expectEquals(result->calls, 1);
        }

        beginTest("Root parameters, level and code");
        {
            std::unique_ptr<ScriptCompilation> result (compile(library.get(), R"({
              "settings": {"name": "main", "loglevel": 2},
              "code": "\n  Println(`start`)\n%body%\n",
              "params": [
                {"name": "dest", "title": "Dest", "type": "singletext", "options": {"default": "c:\\tmp$"}},
                {"name": "count", "title": "Count", "type": "number", "options": {"default": "3"}},
                {"name": "flag", "title": "Flag", "type": "checkbox"}
              ],
              "tree": [{"name": "greet", "values": {"who": "w"}}]
            })"));

            expect(!result->hasErrors());
            expect(result->source.contains(
                "\nrun {\nstr dest = \"c:\\\\tmp$\"\nint count = 3\nbool flag = false\nSetLogLevel(2)\ninit()\nPrintln(`start`)\n   greet(STR0)\n\ndeinit()}"));
        }

        beginTest("Default log level comes from the settings");
        {
            CompilerSettings settings;
            settings.defaultLogLevel = 4;
            std::unique_ptr<ScriptCompilation> result (compile(library.get(), R"({
              "settings": {"name": "main"}
            })", &settings));

            expectEquals(result->source,
                         juce::String("const IOTA { LOG_DISABLE LOG_ERROR LOG_WARN LOG_INFO LOG_DEBUG }\n\nrun {\nSetLogLevel(4)\ninit()\n\ndeinit()}"));
        }

        beginTest("Predefined variables of the root");
        {
            CompilerSettings settings;
            settings.language = "ru";
            std::unique_ptr<ScriptCompilation> result (compile(library.get(), R"({
              "settings": {"name": "main"},
              "langs": {"en": {"greeting": "hello", "zeta": "z"},
                        "ru": {"greeting": "privet", "extra": "1", "_desc": "hidden"}}
            })", &settings));

            expect(!result->hasErrors());
            expect(result->source.contains("SetLogLevel(3)\ninit()\nSetVariables(STR0)\n"));

            juce::String json = result->source.fromFirstOccurrenceOf("STR0 = ", false, false)
                .upToFirstOccurrenceOf("\n", false, false);
            expect(json.contains("privet"));
            expect(!json.contains("hello"));
            expect(!json.contains("hidden"));
            // keys are sorted
            expect(json.indexOf("extra") < json.indexOf("greeting"));
            expect(json.indexOf("greeting") < json.indexOf("zeta"));
        }

        beginTest("Unknown script");
        {
            std::unique_ptr<ScriptCompilation> result (compile(library.get(), R"({
              "settings": {"name": "main"},
              "tree": [{"name": "greet", "values": {"who": "a"}}, {"name": "nope"}]
            })"));

            expect(result->hasErrors());
            expectEquals(result->errors.size(), 1);
            ScriptError* error = result->getError();
            expectEquals((int)error->type, (int)ScriptErrorNotFound);
            expectEquals(error->subject, juce::String("nope"));
            expectEquals(error->details, juce::String("Unable to find script 'nope'"));
            expectEquals(result->source, juce::String());
        }

        beginTest("Missing required value stops the compilation");
        {
            library->add(TestDefinition(*this, R"({
              "settings": {"name": "sleep", "title": "Sleep"},
              "code": "sleep(ms)",
              "params": [{"name": "ms", "title": "Milliseconds", "type": "number",
                          "options": {"required": true}}]
            })"));

            std::unique_ptr<ScriptCompilation> result (compile(library.get(), R"({
              "settings": {"name": "main"},
              "tree": [{"name": "sleep", "values": {"ms": ""}}]
            })"));

            expect(result->hasErrors());
            ScriptError* error = result->getError();
            expectEquals((int)error->type, (int)ScriptErrorFieldRequired);
            expectEquals(error->details, juce::String("The field 'Milliseconds' is required in script 'Sleep'"));
            expectEquals(result->source, juce::String());
            expectEquals(result->functions, 0);
        }

        beginTest("Recursive definitions are called, not expanded");
        {
            library->add(TestDefinition(*this, R"({
              "settings": {"name": "recurse"},
              "code": "Step()",
              "tree": [{"name": "recurse"}]
            })"));

            std::unique_ptr<ScriptCompilation> result (compile(library.get(), R"({
              "settings": {"name": "main"},
              "tree": [{"name": "recurse"}]
            })"));

            expect(!result->hasErrors());
            expectEquals(result->functions, 1);
            expectEquals(result->calls, 2);
        }

        beginTest("A compiler can be reused");
        {
            std::unique_ptr<ScriptDefinition> root (TestDefinition(*this, R"({
              "settings": {"name": "main"},
              "tree": [{"name": "greet", "values": {"who": "a"}}]
            })"));

            TreeCompiler compiler;
            std::unique_ptr<ScriptCompilation> first (compiler.compile(root.get(), nullptr, library.get()));
            std::unique_ptr<ScriptCompilation> second (compiler.compile(root.get(), nullptr, library.get()));
            expectEquals(first->source, second->source);
            expectEquals(second->functions, 1);
        }
    }
};

static TreeCompilerTest treeCompilerTest;
