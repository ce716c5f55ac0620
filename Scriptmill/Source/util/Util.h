/*
 * A small collection of string utilities shared by the compiler, the
 * runtime and the trace buffer.
 *
 * Most string handling uses juce::String, these exist for the places that
 * work with fixed char buffers or need identifier munging.
 */

#pragma once

#include <JuceHeader.h>

//////////////////////////////////////////////////////////////////////
//
// Fixed buffer strings
//
//////////////////////////////////////////////////////////////////////

/**
 * Copy one string to a buffer with care.
 * The max argument is the maximum number of char elements in the dest
 * array *including* the nul terminator.
 */
void CopyString(const char* src, char* dest, int max);

//////////////////////////////////////////////////////////////////////
//
// Values
//
//////////////////////////////////////////////////////////////////////

/**
 * Return true if the string looks like a signed integer.
 * Leading and trailing whitespace is not allowed.
 */
bool IsInteger(const juce::String& str);

/**
 * Convert a script name into something usable as a function identifier
 * in generated code.  Separator characters are dropped and the character
 * following a separator is upper cased, so "send-email" becomes "sendEmail".
 */
juce::String IdName(const juce::String& name);
