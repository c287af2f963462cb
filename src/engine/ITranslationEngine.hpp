#pragma once

#include "../job/JobEvent.hpp"
#include "../job/RunConfig.hpp"
#include "../processing/JsonSanitizer.hpp"

#include <chrono>
#include <memory>
#include <stdexcept>

namespace engine
{

// Raised by a stream (or by startStream) when the transport itself breaks.
class TransportError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

enum class StreamStatus
{
    Event,  // `out` holds the next event
    Idle,   // nothing arrived within the wait
    Closed  // the stream ended
};

// Single-pass, ordered sequence of events for one run.
class IEventStream
{
public:
    virtual ~IEventStream() = default;

    // Waits up to `wait` for the next event. Throws TransportError.
    virtual StreamStatus next(job::JobEvent& out, std::chrono::milliseconds wait) = 0;

    // Releases the underlying resource. Safe to call more than once.
    virtual void close() noexcept = 0;
};

class ITranslationEngine
{
public:
    virtual ~ITranslationEngine() = default;

    virtual const char* engineName() const = 0;

    // Starts one run. Must be callable concurrently for independent runs.
    virtual std::unique_ptr<IEventStream> startStream(const job::RunConfig& config) = 0;

    // Sanitizer-injection point for language-model output. Engines that
    // cannot take one keep the default and return false.
    virtual bool setOutputSanitizer(std::shared_ptr<const processing::IJsonSanitizer> sanitizer)
    {
        (void)sanitizer;
        return false;
    }
};

} // namespace engine
