/**
 * The constant pool of a compilation.
 *
 * Every string literal the generated program needs is interned here and
 * referenced by name, STR0, STR1, etc.  The constant block is rendered
 * in first-seen order so output is stable for identical input.
 *
 * Lookup is by a 64-bit hash of the value.  A hash hit is verified against
 * the stored string, a mismatch is a collision and falls back to a scan
 * so two different strings never share a constant.
 */

#pragma once

#include <JuceHeader.h>

class StringPool
{
  public:

    typedef juce::int64 (*HashFunction)(const juce::String& value);

    StringPool();
    // tests inject a weak hash to force collisions
    StringPool(HashFunction f);
    ~StringPool();

    /**
     * Return the constant reference for this value, adding it if
     * it has not been seen.
     */
    juce::String intern(const juce::String& value);

    int size() const {
        return strings.size();
    }

    const juce::StringArray& getStrings() const {
        return strings;
    }

    // number of hash collisions seen, for the curious
    int getCollisions() const {
        return collisions;
    }

    /**
     * Render the const block for the program, empty if nothing
     * was interned.
     */
    juce::String render() const;

    static juce::String reference(int index);

    /**
     * Format a string as a literal of the generated language.
     * Strings without backtick, percent or dollar use the raw
     * backtick form, anything else is double quoted with backslashes
     * and quotes escaped.
     */
    static juce::String toLiteral(const juce::String& value);

    static juce::int64 defaultHash(const juce::String& value);

  private:

    HashFunction hasher;

    juce::StringArray strings;

    juce::HashMap<juce::int64,int> hashes;

    int collisions = 0;

};
