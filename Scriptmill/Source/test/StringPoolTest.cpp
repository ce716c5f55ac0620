
#include <JuceHeader.h>

#include "../script/StringPool.h"

/**
 * Every string hashes to the same value.
 */
static juce::int64 CollidingHash(const juce::String& value)
{
    juce::ignoreUnused(value);
    return 42;
}

class StringPoolTest : public juce::UnitTest
{
  public:

    StringPoolTest() : juce::UnitTest("StringPool", "Compiler") {}

    void runTest() override
    {
        beginTest("Interning is idempotent");
        {
            StringPool pool;
            expectEquals(pool.intern("hello"), juce::String("STR0"));
            expectEquals(pool.intern("hello"), juce::String("STR0"));
            expectEquals(pool.size(), 1);
        }

        beginTest("Distinct strings in first seen order");
        {
            StringPool pool;
            expectEquals(pool.intern("c"), juce::String("STR0"));
            expectEquals(pool.intern("a"), juce::String("STR1"));
            expectEquals(pool.intern("b"), juce::String("STR2"));
            expectEquals(pool.intern("a"), juce::String("STR1"));
            expectEquals(pool.getStrings().joinIntoString(","), juce::String("c,a,b"));
            expectEquals(pool.getCollisions(), 0);
        }

        beginTest("Colliding hashes never share a constant");
        {
            StringPool pool (&CollidingHash);
            expectEquals(pool.intern("a"), juce::String("STR0"));
            expectEquals(pool.intern("b"), juce::String("STR1"));
            expectEquals(pool.intern("c"), juce::String("STR2"));
            expectEquals(pool.intern("b"), juce::String("STR1"));
            expectEquals(pool.intern("a"), juce::String("STR0"));
            expectEquals(pool.size(), 3);
            // b twice and c once landed on a's slot
            expectEquals(pool.getCollisions(), 3);
        }

        beginTest("Literals");
        {
            expectEquals(StringPool::toLiteral("plain text"), juce::String("`plain text`"));
            expectEquals(StringPool::toLiteral("100%"), juce::String("\"100%\""));
            expectEquals(StringPool::toLiteral("say \"$x\""), juce::String("\"say \\\"$x\\\"\""));
            expectEquals(StringPool::toLiteral("c:\\dir$"), juce::String("\"c:\\\\dir$\""));
            expectEquals(StringPool::toLiteral("a`b"), juce::String("\"a`b\""));
            // quotes alone are safe in the raw form
            expectEquals(StringPool::toLiteral("say \"hi\""), juce::String("`say \"hi\"`"));
        }

        beginTest("Constant block");
        {
            StringPool pool;
            expectEquals(pool.render(), juce::String());
            pool.intern("one");
            pool.intern("50%");
            expectEquals(pool.render(), juce::String("const {\nSTR0 = `one`\nSTR1 = \"50%\"\n}\n"));
        }
    }
};

static StringPoolTest stringPoolTest;
