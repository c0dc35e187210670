#pragma once

#include <string>

#include "UFHDomain.h"

class AbstractHistoryStore {
  public:
    virtual ~AbstractHistoryStore() {}

    // Time-weighted fraction of [start, end) the entity spent in its on/open state.
    // Returns false if the history could not be queried.
    virtual bool getStateAverage(const std::string &entity, UFHDomain::TimePoint start,
                                 UFHDomain::TimePoint end, double *avg) = 0;
};
