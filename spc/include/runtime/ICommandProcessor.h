#pragma once

#include "runtime/ControllerCommand.h"

namespace SPC {

/**
 * @brief Applies commands taken off a CommandQueue
 *
 * process() is only ever called from the queue's worker thread, one command
 * at a time. Implementations report outcomes through the command's result
 * sink and must not let exceptions escape.
 */
class ICommandProcessor {
public:
    virtual ~ICommandProcessor() = default;

    virtual void process(ControllerCommand &command) = 0;
};

}  // namespace SPC
