/**
 * The log of a running program.
 *
 * Generated code writes log lines with LogOutput and brackets sections
 * with SetLogLevel.  Lines at or below the current level are formatted
 * and queued, and the queue is drained to a LogListener supplied by the
 * host, which typically forwards them to the web console.
 *
 * Queueing never waits on the listener.  Without a LogFlusher the queue
 * is drained synchronously after each emit, with one it is drained on
 * whatever thread the flusher uses, normally a LogFlushThread.
 */

#pragma once

#include <JuceHeader.h>

#include "../model/LogLevel.h"

/**
 * Interface of the external log sink.
 */
class LogListener
{
  public:
    virtual ~LogListener() {}
    virtual void logEmit(const juce::String& line) = 0;
};

/**
 * Interface of an object that is told when lines are queued and will
 * call LogChannel::flush soon after.
 */
class LogFlusher
{
  public:
    virtual ~LogFlusher() {}
    virtual void logEvent() = 0;
};

class LogChannel
{
  public:

    LogChannel();
    ~LogChannel();

    void setListener(LogListener* l);
    void setFlusher(LogFlusher* f);

    /**
     * Change the current level and return the previous one.
     * Levels outside LogDisable..LogDebug are ignored.
     */
    int setLevel(int level);

    int getLevel();

    /**
     * Queue a line if the level is a real severity and not more verbose
     * than the current level.
     */
    void emit(int level, const juce::String& message);

    /**
     * Emit a debug record of a script call.
     */
    void trace(const juce::String& name, const juce::Array<juce::var>& args);

    /**
     * Deliver queued lines to the listener in the order they were queued.
     */
    void flush();

    int getPending();

    static juce::String formatLine(int level, juce::Time time, const juce::String& message);
    static juce::String formatCall(const juce::String& name, const juce::Array<juce::var>& args);

  private:

    // guards level and the queue
    juce::CriticalSection criticalSection;

    // held for the duration of a flush so flushes from different
    // threads can't interleave their deliveries
    juce::CriticalSection flushSection;

    int level = LogInfo;

    juce::StringArray queue;

    LogListener* listener = nullptr;
    LogFlusher* flusher = nullptr;
};

/**
 * A flusher that drains the channel on its own thread.
 */
class LogFlushThread : public juce::Thread, public LogFlusher
{
  public:

    LogFlushThread(LogChannel* c);
    ~LogFlushThread() override;

    void start();
    void stop();

    void logEvent() override;
    void run() override;

  private:

    LogChannel* channel;
    juce::WaitableEvent wakeup;
};
