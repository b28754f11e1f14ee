#ifndef ROLLINGWINDOW_HPP
#define ROLLINGWINDOW_HPP

#include <cstdint>
#include <vector>

/**
 * @brief Fixed-size trailing history of values, averaged on demand.
 * Until the window fills up, the mean only covers the values pushed so far.
 */
class RollingWindow {
  public:
    explicit RollingWindow(uint32_t capacity) : _window(capacity > 0 ? capacity : 1, 0.0), _index(0), _count(0) {}

    void push(double value)
    {
        _window[_index] = value;
        _index++;
        if (_index >= _window.size()) {
            _index = 0;
        }
        if (_count < _window.size()) {
            _count++;
        }
    }

    double mean() const
    {
        if (_count == 0) {
            return 0.0;
        }
        double sum = 0.0;
        for (uint32_t i = 0; i < _count; i++) {
            sum += _window[i];
        }
        return sum / _count;
    }

    uint32_t size() const { return _count; }
    uint32_t capacity() const { return (uint32_t)_window.size(); }

    void clear()
    {
        _index = 0;
        _count = 0;
    }

  private:
    std::vector<double> _window;
    uint32_t _index;
    uint32_t _count;
};

#endif // ROLLINGWINDOW_HPP
