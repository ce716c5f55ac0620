/**
 * Command line compiler.
 *
 *     scriptmill-compile [-trace <level>] <bundle.json>
 *
 * Reads a bundle of definitions, compiles the root and writes the program
 * to stdout.  Errors go to stderr and the exit code is non-zero.
 */

#include <JuceHeader.h>

#include <iostream>

#include "util/Trace.h"
#include "script/ScriptCompilation.h"
#include "script/ScriptBundle.h"

static void usage()
{
    std::cerr << "usage: scriptmill-compile [-trace <level>] <bundle.json>" << std::endl;
}

int main(int argc, char* argv[])
{
    juce::StringArray args;
    for (int i = 1 ; i < argc ; i++)
      args.add(juce::String::fromUTF8(argv[i]));

    juce::String path;
    for (int i = 0 ; i < args.size() ; i++) {
        juce::String arg = args[i];
        if (arg == "-trace" && i + 1 < args.size()) {
            TraceDebugLevel = args[i + 1].getIntValue();
            i++;
        }
        else if (arg.startsWith("-")) {
            usage();
            return 2;
        }
        else {
            path = arg;
        }
    }

    if (path.isEmpty()) {
        usage();
        return 2;
    }

    juce::File file = juce::File::getCurrentWorkingDirectory().getChildFile(path);

    ScriptBundle bundle;
    juce::String error;
    if (!bundle.read(file, error)) {
        std::cerr << "scriptmill-compile: " << error.toRawUTF8() << std::endl;
        return 1;
    }

    std::unique_ptr<ScriptCompilation> result (bundle.compile());
    if (result->hasErrors()) {
        for (auto err : result->errors)
          std::cerr << err->toString().toRawUTF8() << std::endl;
        return 1;
    }

    std::cout << result->source.toRawUTF8() << std::endl;

    Trace(2, "scriptmill-compile: %ld functions", (long)result->functions);
    Trace(2, "scriptmill-compile: %ld calls", (long)result->calls);
    Trace(2, "scriptmill-compile: %ld constants", (long)result->constants);
    return 0;
}
