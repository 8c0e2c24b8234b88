#pragma once

#include "runtime/ControllerCommand.h"
#include "runtime/ICommandProcessor.h"
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <queue>
#include <string>
#include <thread>

namespace SPC {

/**
 * @brief Unbounded FIFO drained by one dedicated worker thread
 *
 * Any thread may submit; only the worker calls the processor, so everything
 * the processor owns is single-writer. Commands run in the order their
 * sequence numbers were assigned.
 */
class CommandQueue {
public:
    CommandQueue(std::string name, std::unique_ptr<ICommandProcessor> processor);

    /**
     * @brief Close, drain and join the worker
     *
     * When the last reference is released on the worker thread itself the
     * thread is detached instead; it exits once the queue is drained.
     */
    ~CommandQueue();

    CommandQueue(const CommandQueue &) = delete;
    CommandQueue &operator=(const CommandQueue &) = delete;

    /**
     * @brief Enqueue a command without blocking on its processing
     * @return false if the queue is closed; the command is discarded
     */
    bool trySubmit(std::unique_ptr<ControllerCommand> command);

    /**
     * @brief Stop accepting commands; already queued ones are still processed
     */
    void close();

    bool isClosed() const;

    /**
     * @brief Block until no command is queued or in flight
     * @return false on timeout
     */
    bool waitForIdle(std::chrono::milliseconds timeout) const;

    /**
     * @brief True once the queue is closed and its worker has nothing left to do
     */
    bool isDrained() const;

    size_t getPendingCount() const;

    uint64_t getLastAssignedSequence() const;

    const std::string &getName() const {
        return name_;
    }

private:
    // Shared with the worker thread so a detached worker never outlives its state
    struct WorkerState {
        std::string name;
        std::unique_ptr<ICommandProcessor> processor;

        std::mutex queueMutex;
        std::condition_variable queueCondition;
        std::condition_variable idleCondition;
        std::queue<std::unique_ptr<ControllerCommand>> commands;
        bool closed = false;
        bool busy = false;
        bool workerExited = false;
        uint64_t nextSequence = 1;
    };

    static void workerLoop(std::shared_ptr<WorkerState> state);

    const std::string name_;
    std::shared_ptr<WorkerState> state_;
    std::thread worker_;
};

}  // namespace SPC
