#pragma once

#include <string>

#include "UFHDomain.h"

// Instantaneous reads of a zone's sensors and valve read-back
class AbstractZoneIO {
  public:
    virtual ~AbstractZoneIO() {}

    // Returns NaN if the sensor has no usable reading
    virtual double getTemperatureC(const std::string &sensor) = 0;
    virtual UFHDomain::ValveState getValveState(const std::string &valve) = 0;
    virtual bool getWindowOpen(const std::string &sensor) = 0;
};
