
#include <JuceHeader.h>

#include "../util/Trace.h"

#include "StringPool.h"

StringPool::StringPool()
{
    hasher = &StringPool::defaultHash;
}

StringPool::StringPool(HashFunction f)
{
    hasher = (f != nullptr) ? f : &StringPool::defaultHash;
}

StringPool::~StringPool()
{
}

juce::int64 StringPool::defaultHash(const juce::String& value)
{
    return value.hashCode64();
}

juce::String StringPool::reference(int index)
{
    return "STR" + juce::String(index);
}

juce::String StringPool::intern(const juce::String& value)
{
    int index = -1;
    juce::int64 hash = hasher(value);

    if (hashes.contains(hash)) {
        int candidate = hashes[hash];
        if (strings[candidate] == value) {
            index = candidate;
        }
        else {
            // the slot stays with the first owner, anything else that
            // lands on it is found the slow way
            collisions++;
            Trace(3, "StringPool: Hash collision on constant %ld", (long)candidate);
            index = strings.indexOf(value);
            if (index < 0) {
                index = strings.size();
                strings.add(value);
            }
        }
    }
    else {
        index = strings.size();
        strings.add(value);
        hashes.set(hash, index);
    }

    return reference(index);
}

juce::String StringPool::toLiteral(const juce::String& value)
{
    juce::String literal;
    if (value.containsAnyOf("`%$")) {
        literal = value.replace("\\", "\\\\");
        literal = "\"" + literal.replace("\"", "\\\"") + "\"";
    }
    else {
        literal = "`" + value + "`";
    }
    return literal;
}

juce::String StringPool::render() const
{
    juce::String block;
    if (strings.size() > 0) {
        block << "const {\n";
        for (int i = 0 ; i < strings.size() ; i++)
          block << reference(i) << " = " << toLiteral(strings[i]) << "\n";
        block << "}\n";
    }
    return block;
}
