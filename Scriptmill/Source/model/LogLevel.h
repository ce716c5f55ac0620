/**
 * Log levels shared by script definitions, the generated program and
 * the runtime LogChannel.
 *
 * The numbers are part of the generated program, SetLogLevel and LogOutput
 * receive them as plain integers, so don't renumber these.
 */

#pragma once

const int LogDisable = 0;
const int LogError = 1;
const int LogWarn = 2;
const int LogInfo = 3;
const int LogDebug = 4;

/**
 * Only meaningful on a ScriptDefinition, use the level of the caller.
 */
const int LogInherit = 5;

/**
 * Severity names used in formatted log lines, indexed by level.
 */
const char* const LogLevelNames[] = {"", "ERROR", "WARN", "INFO", "DEBUG"};
