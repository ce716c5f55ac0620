/*
 * Trace utilities.
 *
 * Diagnostic trace for the compiler and the runtime support library.
 * This is not the script log, messages a generated program writes with
 * LogOutput go through LogChannel.  Trace is for people debugging
 * Scriptmill itself.
 *
 * Use Trace(1,... for errors, Trace(2,... for things that are interesting
 * and Trace(3,... for chatter.  Records at or below TraceDebugLevel are
 * queued and flushed to stderr and the optional TraceListener.
 */

#ifndef TRACE_H
#define TRACE_H

#include <JuceHeader.h>

/****************************************************************************
 *                                                                          *
 *   							 TRACE LEVELS                               *
 *                                                                          *
 ****************************************************************************/

/**
 * Trace records at this level or lower are queued and emitted.
 */
extern int TraceDebugLevel;

/**
 * When true, rendered records go to stdout instead of stderr.
 */
extern bool TraceToStdout;

/**
 * The interace of an object that may be registered to enable
 * buffered trace.  The callback method is called whenever a new
 * record is added, and the flusher is expected to call FlushTrace
 * on its own thread soon after.
 */
class TraceFlusher {

  public:
    virtual ~TraceFlusher() {}
	virtual void traceEvent() = 0;

};

extern TraceFlusher* GlobalTraceFlusher;

/**
 * Interface of an object to receive trace messages as they
 * are emitted during a flush.  The unit tests use this to watch
 * for error records.
 */
class TraceListener {
  public:
    virtual ~TraceListener() {}
    virtual void traceEmit(const char* msg) = 0;
};

extern TraceListener* GlobalTraceListener;

/****************************************************************************
 *                                                                          *
 *   							 TRACE RECORD                               *
 *                                                                          *
 ****************************************************************************/

#define MAX_TRACE_RECORDS 500

#define MAX_ARG 128
#define MAX_MSG 256

/**
 * Formatting is deferred until the record is flushed.  We allow up to two
 * string arguments and one long argument, in that order, which covers
 * everything the compiler and runtime need to say.
 */
class TraceRecord {

  public:

	int level;

    // an sprintf format string
    char msg[MAX_MSG];

    // optional string arguments
    char string[MAX_ARG];
	char string2[MAX_ARG];

    // optional long argument
    long long1;
};

/****************************************************************************
 *                                                                          *
 *   						   TRACE FUNCTIONS                              *
 *                                                                          *
 ****************************************************************************/

void Trace(int level, const char* msg);
void Trace(int level, const char* msg, const char* arg);
void Trace(int level, const char* msg, const char* arg, const char* arg2);
void Trace(int level, const char* msg, long l1);
void Trace(int level, const char* msg, const char* arg, long l1);

void FlushTrace();
void ResetTrace();

#endif
