/*
 * String utilities.
 */

#include <string.h>
#include <ctype.h>

#include <JuceHeader.h>

#include "Util.h"

void CopyString(const char* src, char* dest, int max)
{
	if (dest != nullptr && max > 0) {
		if (src == nullptr)
		  strcpy(dest, "");
		else {
			int len = (int)strlen(src);
			int avail = max - 1;
			if (avail > len)
			  strcpy(dest, src);
			else {
				strncpy(dest, src, avail);
				dest[avail] = 0;
			}
		}
	}
}

/**
 * An optional leading minus followed by digits only.
 */
bool IsInteger(const juce::String& str)
{
    bool is = false;
    int max = str.length();
    if (max > 0) {
        is = true;
        for (int i = 0 ; i < max && is ; i++) {
            juce::juce_wchar ch = str[i];
            if (!juce::CharacterFunctions::isDigit(ch) && (i > 0 || ch != '-'))
              is = false;
        }
        // a lone minus is not a number
        if (is && max == 1 && str[0] == '-')
          is = false;
    }
    return is;
}

juce::String IdName(const juce::String& name)
{
    juce::String id;
    bool upper = false;

    for (int i = 0 ; i < name.length() ; i++) {
        juce::juce_wchar ch = name[i];
        if (ch == '-' || ch == '.' || ch == '_' || ch == ' ') {
            // a leading separator doesn't capitalize anything
            upper = id.isNotEmpty();
        }
        else {
            if (upper) {
                ch = juce::CharacterFunctions::toUpperCase(ch);
                upper = false;
            }
            id += juce::String::charToString(ch);
        }
    }
    return id;
}
