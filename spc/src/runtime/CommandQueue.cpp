#include "runtime/CommandQueue.h"
#include "common/Logger.h"
#include <stdexcept>

namespace SPC {

CommandQueue::CommandQueue(std::string name, std::unique_ptr<ICommandProcessor> processor)
    : name_(std::move(name)), state_(std::make_shared<WorkerState>()) {
    if (!processor) {
        throw std::invalid_argument("CommandQueue '" + name_ + "' requires a processor");
    }
    state_->name = name_;
    state_->processor = std::move(processor);
    worker_ = std::thread(&CommandQueue::workerLoop, state_);
    LOG_DEBUG("CommandQueue: '{}' started", name_);
}

CommandQueue::~CommandQueue() {
    close();

    if (!worker_.joinable()) {
        return;
    }

    if (worker_.get_id() == std::this_thread::get_id()) {
        // Destroyed from inside a command; joining here would deadlock
        LOG_WARN("CommandQueue: '{}' destroyed on its own worker thread, detaching", name_);
        worker_.detach();
        return;
    }

    LOG_DEBUG("CommandQueue: Joining worker of '{}'", name_);
    worker_.join();
    LOG_DEBUG("CommandQueue: '{}' shut down", name_);
}

bool CommandQueue::trySubmit(std::unique_ptr<ControllerCommand> command) {
    if (!command) {
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(state_->queueMutex);
        if (state_->closed) {
            LOG_DEBUG("CommandQueue: '{}' is closed, rejecting {}", name_,
                      ControllerCommand::typeToString(command->type));
            return false;
        }
        command->sequenceNumber = state_->nextSequence++;
        LOG_TRACE("CommandQueue: '{}' accepted #{} {} (queued: {})", name_, command->sequenceNumber,
                  ControllerCommand::typeToString(command->type), state_->commands.size());
        state_->commands.push(std::move(command));
    }
    state_->queueCondition.notify_one();
    return true;
}

void CommandQueue::close() {
    {
        std::lock_guard<std::mutex> lock(state_->queueMutex);
        if (state_->closed) {
            return;
        }
        state_->closed = true;
        LOG_DEBUG("CommandQueue: '{}' closed with {} commands pending", name_, state_->commands.size());
    }
    state_->queueCondition.notify_all();
}

bool CommandQueue::isClosed() const {
    std::lock_guard<std::mutex> lock(state_->queueMutex);
    return state_->closed;
}

bool CommandQueue::waitForIdle(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(state_->queueMutex);
    return state_->idleCondition.wait_for(lock, timeout, [this] {
        return (state_->commands.empty() && !state_->busy) || state_->workerExited;
    });
}

bool CommandQueue::isDrained() const {
    std::lock_guard<std::mutex> lock(state_->queueMutex);
    return state_->closed && state_->commands.empty() && !state_->busy;
}

size_t CommandQueue::getPendingCount() const {
    std::lock_guard<std::mutex> lock(state_->queueMutex);
    return state_->commands.size() + (state_->busy ? 1 : 0);
}

uint64_t CommandQueue::getLastAssignedSequence() const {
    std::lock_guard<std::mutex> lock(state_->queueMutex);
    return state_->nextSequence - 1;
}

void CommandQueue::workerLoop(std::shared_ptr<WorkerState> state) {
    LOG_DEBUG("CommandQueue: Worker for '{}' running", state->name);

    std::unique_lock<std::mutex> lock(state->queueMutex);
    while (true) {
        state->queueCondition.wait(lock, [&state] { return !state->commands.empty() || state->closed; });

        if (state->commands.empty()) {
            // Closed and fully drained
            break;
        }

        auto command = std::move(state->commands.front());
        state->commands.pop();
        state->busy = true;
        lock.unlock();

        try {
            state->processor->process(*command);
        } catch (const std::exception &e) {
            LOG_ERROR("CommandQueue: Processor for '{}' leaked an exception on #{}: {}", state->name,
                      command->sequenceNumber, e.what());
        }
        command.reset();

        lock.lock();
        state->busy = false;
        if (state->commands.empty()) {
            state->idleCondition.notify_all();
        }
    }

    state->workerExited = true;
    state->idleCondition.notify_all();
    LOG_DEBUG("CommandQueue: Worker for '{}' exiting", state->name);
}

}  // namespace SPC
