#ifndef READINGSINK_HPP
#define READINGSINK_HPP

#include <functional>
#include "ScaleTypes.hpp"

/**
 * @file ReadingSink.hpp
 * @brief Where the reader task delivers its results. Called on the reader task: implementations must return quickly.
 */
class ReadingSink {
  public:
    virtual ~ReadingSink() {}
    /** @brief Once per successful sampling cycle, in sampling order. */
    virtual void onReading(const Reading& reading) = 0;
    /** @brief Once per failed cycle, or once for the fatal condition that stopped the reader. */
    virtual void onError(ScaleResult_e error, const char* message) = 0;
};

/** @brief Adapts a pair of callbacks to the sink interface. */
class CallbackReadingSink : public ReadingSink {
  public:
    CallbackReadingSink() {}
    CallbackReadingSink(std::function<void(const Reading&)> onReadingCb, std::function<void(ScaleResult_e, const char*)> onErrorCb)
        : _onReading(onReadingCb), _onError(onErrorCb)
    {}

    void onReading(const Reading& reading) override
    {
        if (_onReading) {
            _onReading(reading);
        }
    }

    void onError(ScaleResult_e error, const char* message) override
    {
        if (_onError) {
            _onError(error, message);
        }
    }

  private:
    std::function<void(const Reading&)> _onReading;
    std::function<void(ScaleResult_e, const char*)> _onError;
};

#endif // READINGSINK_HPP
