#pragma once

#include <chrono>

class Clock {
  public:
    virtual ~Clock() = default;
    virtual double NowMs() const = 0;
};

class SystemClock : public Clock {
  public:
    double NowMs() const override {
        return std::chrono::duration<double, std::milli>(
                 std::chrono::system_clock::now().time_since_epoch())
          .count();
    }
};
