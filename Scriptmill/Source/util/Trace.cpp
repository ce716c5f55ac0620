/*
 * Trace utilities.
 *
 * Trace records are accumulated in a global ring buffer with a head
 * index advanced as records are flushed and a tail index advanced
 * as records are added.  Adding records may happen from any thread
 * that is running a generated program, so the indexes are guarded by
 * a csect.  Flushing happens either synchronously from the thread
 * that added the record, or from the thread of a registered TraceFlusher.
 */

#include <JuceHeader.h>

#include <stdio.h>
#include <string.h>

#include "Util.h"
#include "Trace.h"

/****************************************************************************
 *                                                                          *
 *   							TRACE RECORDS                               *
 *                                                                          *
 ****************************************************************************/

int TraceDebugLevel = 1;

bool TraceToStdout = false;

TraceFlusher* GlobalTraceFlusher = nullptr;

TraceListener* GlobalTraceListener = nullptr;

TraceRecord TraceRecords[MAX_TRACE_RECORDS];

juce::CriticalSection TraceCriticalSection;

/**
 * Index into TraceRecords of the first active record.
 * If this is equal to TraceTail, then the queue is empty.
 */
int TraceHead = 0;

/**
 * The index into TraceRecords of the next available record.
 */
int TraceTail = 0;

void ResetTrace()
{
    const juce::ScopedLock lock (TraceCriticalSection);
    TraceHead = 0;
    TraceTail = 0;
}

/**
 * Send a rendered message on its way.
 */
static void TraceEmit(const char* msg)
{
    FILE* fp = (TraceToStdout) ? stdout : stderr;
    fprintf(fp, "%s", msg);
    fflush(fp);

    if (GlobalTraceListener != nullptr)
      GlobalTraceListener->traceEmit(msg);
}

/**
 * An empty string argument can't be told apart from a missing one
 * once it is copied, and that decides which sprintf argument list is
 * used during rendering.  Convert empty to a single space.
 */
static void SaveArgument(const char* src, char* dest)
{
    dest[0] = 0;
    if (src != nullptr) {
        if (strlen(src) == 0)
          src = " ";
        CopyString(src, dest, MAX_ARG);
    }
}

static void AddTrace(int level, const char* msg, const char* string1,
                     const char* string2, long l1)
{
    if (msg == nullptr || strlen(msg) == 0)
      msg = "!!!!!! MISSING TRACE MESSAGE !!!!!!";

	if (level <= TraceDebugLevel) {

        const juce::ScopedLock lock (TraceCriticalSection);

		TraceRecord* r = &TraceRecords[TraceTail];

		int nextTail = TraceTail + 1;
		if (nextTail >= MAX_TRACE_RECORDS)
		  nextTail = 0;

		if (nextTail == TraceHead) {
            // overflow, lose the new one rather than overwrite
            // something the flusher may be rendering
            TraceEmit("WARNING: Trace record buffer overflow!!\n");
		}
        else {
            r->level = level;
            r->long1 = l1;
            CopyString(msg, r->msg, MAX_MSG);
            SaveArgument(string1, r->string);
            SaveArgument(string2, r->string2);

            // only change the tail after the record is fully initialized
            TraceTail = nextTail;
        }
	}
}

static void RenderTrace(TraceRecord* r, char* buffer, size_t size)
{
    const char* prefix = (r->level == 1) ? "ERROR: " : "";
    size_t plen = strlen(prefix);
    strcpy(buffer, prefix);
    char* body = buffer + plen;
    size_t avail = size - plen - 2;

    if (strlen(r->string2) > 0)
      snprintf(body, avail, r->msg, r->string, r->string2, r->long1);
    else if (strlen(r->string) > 0)
      snprintf(body, avail, r->msg, r->string, r->long1);
    else
      snprintf(body, avail, r->msg, r->long1);

    // this is so easy to miss
    size_t len = strlen(buffer);
    if (len > 0 && buffer[len-1] != '\n') {
        buffer[len] = '\n';
        buffer[len+1] = 0;
    }

    r->msg[0] = 0;
}

/**
 * May be called from several threads once a flusher is installed
 * so the whole thing is locked.
 */
void FlushTrace()
{
    const juce::ScopedLock lock (TraceCriticalSection);

	char buffer[1024];

	while (TraceHead != TraceTail) {
        TraceRecord* r = &TraceRecords[TraceHead];
		RenderTrace(r, buffer, sizeof(buffer));
        TraceEmit(buffer);

		TraceHead++;
		if (TraceHead >= MAX_TRACE_RECORDS)
		  TraceHead = 0;
    }
}

static void FlushOrNotify()
{
	if (GlobalTraceFlusher != nullptr)
	  GlobalTraceFlusher->traceEvent();
	else
	  FlushTrace();
}

/****************************************************************************
 *                                                                          *
 *   							TRACE METHODS                               *
 *                                                                          *
 ****************************************************************************/

/**
 * Called for every string argument to make sure that it has a value,
 * otherwise the wrong argument list is chosen during rendering.
 */
static const char* CheckString(const char* arg)
{
    if (arg == nullptr)
      arg = "";
    return arg;
}

void Trace(int level, const char* msg)
{
    AddTrace(level, msg, nullptr, nullptr, 0);
	FlushOrNotify();
}

void Trace(int level, const char* msg, const char* arg)
{
    AddTrace(level, msg, CheckString(arg), nullptr, 0);
	FlushOrNotify();
}

void Trace(int level, const char* msg, const char* arg, const char* arg2)
{
    AddTrace(level, msg, CheckString(arg), CheckString(arg2), 0);
	FlushOrNotify();
}

void Trace(int level, const char* msg, long l1)
{
    AddTrace(level, msg, nullptr, nullptr, l1);
	FlushOrNotify();
}

void Trace(int level, const char* msg, const char* arg, long l1)
{
    AddTrace(level, msg, CheckString(arg), nullptr, l1);
	FlushOrNotify();
}

