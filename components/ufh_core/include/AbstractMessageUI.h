#pragma once

#include "UFHDomain.h"

class AbstractMessageUI {
  public:
    virtual ~AbstractMessageUI(){};

    virtual void setMessage(UFHDomain::MsgID msgID, bool allowCancel, const char *msg) = 0;
    virtual void clearMessage(UFHDomain::MsgID msgID) = 0;
};
