
#include <JuceHeader.h>

#include "../util/Trace.h"

#include "LogChannel.h"

LogChannel::LogChannel()
{
}

LogChannel::~LogChannel()
{
}

void LogChannel::setListener(LogListener* l)
{
    const juce::ScopedLock lock (criticalSection);
    listener = l;
}

void LogChannel::setFlusher(LogFlusher* f)
{
    const juce::ScopedLock lock (criticalSection);
    flusher = f;
}

int LogChannel::setLevel(int newLevel)
{
    const juce::ScopedLock lock (criticalSection);
    int previous = level;
    if (newLevel >= LogDisable && newLevel < LogInherit)
      level = newLevel;
    else
      Trace(2, "LogChannel: Ignoring invalid log level %ld", (long)newLevel);
    return previous;
}

int LogChannel::getLevel()
{
    const juce::ScopedLock lock (criticalSection);
    return level;
}

juce::String LogChannel::formatLine(int lineLevel, juce::Time time, const juce::String& message)
{
    juce::String line;
    line << "[" << LogLevelNames[lineLevel] << "] "
         << time.formatted("%Y/%m/%d %H:%M:%S") << " "
         << message;
    return line;
}

void LogChannel::emit(int lineLevel, const juce::String& message)
{
    if (lineLevel < LogError || lineLevel > LogDebug)
      return;

    LogFlusher* notify = nullptr;
    {
        const juce::ScopedLock lock (criticalSection);
        if (lineLevel > level)
          return;

        // formatted under the lock so the timestamps and the queue
        // order agree
        queue.add(formatLine(lineLevel, juce::Time::getCurrentTime(), message));
        notify = flusher;
    }

    if (notify != nullptr)
      notify->logEvent();
    else
      flush();
}

/**
 * Strings are quoted, everything else is rendered plain.
 */
juce::String LogChannel::formatCall(const juce::String& name, const juce::Array<juce::var>& args)
{
    juce::StringArray params;
    for (auto& arg : args) {
        if (arg.isString())
          params.add("\"" + arg.toString() + "\"");
        else if (arg.isBool())
          params.add((bool)arg ? "true" : "false");
        else
          params.add(arg.toString());
    }
    return "=> " + name + "(" + params.joinIntoString(", ") + ")";
}

void LogChannel::trace(const juce::String& name, const juce::Array<juce::var>& args)
{
    emit(LogDebug, formatCall(name, args));
}

void LogChannel::flush()
{
    const juce::ScopedLock flushLock (flushSection);

    while (true) {
        juce::String line;
        LogListener* target = nullptr;
        {
            const juce::ScopedLock lock (criticalSection);
            if (queue.size() == 0)
              break;
            line = queue[0];
            queue.remove(0);
            target = listener;
        }

        if (target != nullptr)
          target->logEmit(line);
        else
          Trace(3, "LogChannel: No listener for %s", line.toRawUTF8());
    }
}

int LogChannel::getPending()
{
    const juce::ScopedLock lock (criticalSection);
    return queue.size();
}

//////////////////////////////////////////////////////////////////////
//
// LogFlushThread
//
//////////////////////////////////////////////////////////////////////

LogFlushThread::LogFlushThread(LogChannel* c) : juce::Thread("Scriptmill Log")
{
    channel = c;
}

LogFlushThread::~LogFlushThread()
{
    stop();
}

void LogFlushThread::start()
{
    channel->setFlusher(this);
    if (!startThread()) {
        // fall back to synchronous delivery
        Trace(1, "LogFlushThread: Unable to start thread");
        channel->setFlusher(nullptr);
    }
}

/**
 * Anything still queued is delivered before the thread goes away.
 */
void LogFlushThread::stop()
{
    if (isThreadRunning()) {
        signalThreadShouldExit();
        wakeup.signal();
        if (!stopThread(1000))
          Trace(1, "LogFlushThread: Thread had to be killed");
    }
    channel->setFlusher(nullptr);
    channel->flush();
}

void LogFlushThread::logEvent()
{
    wakeup.signal();
}

void LogFlushThread::run()
{
    while (!threadShouldExit()) {
        wakeup.wait(100);
        channel->flush();
    }
}
