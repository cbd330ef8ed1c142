/*
 * scheduler.h
 *
 * Project: Wristwatch Firmware
 * Purpose: Fixed-priority preemptive run-to-completion scheduler
 *
 * Model:
 *  - Statically declared tasks, each with a fixed priority (1..N)
 *  - Priority 0 is the idle context (main loop), never a task
 *  - Interrupt tasks are posted by their interrupt line and never suspend
 *  - Software tasks are spawned and may suspend with delay(); a
 *    suspended task's body returns and is run again when the delay
 *    expires, resuming from the step it saved in its own context
 *  - Higher priority preempts lower; equal priority runs in arrival order
 *  - Shared state is guarded by priority ceilings (Scheduler::Ceiling),
 *    which defer, never block
 *
 * Dispatch points:
 *  - exit of every interrupt (hardware has masked interrupts)
 *  - release of a ceiling
 *  - spawn() from an unmasked context
 *
 * Interrupts are unmasked while a task body runs, so a higher-priority
 * post preempts immediately by nesting dispatch on the interrupt exit.
 *
 * Updated: 2026-10-14
 */

#pragma once

#include <stdbool.h>
#include <stdint.h>

namespace watch {

typedef uint8_t TaskId;
typedef uint8_t Priority;

static const Priority IDLE_PRIORITY = 0;
static const TaskId   NO_TASK       = 0xFF;

enum class TaskKind : uint8_t {
    Interrupt,
    Software
};

struct TaskDef {
    const char *name;
    Priority    priority;
    TaskKind    kind;
    void      (*run)(void *ctx);
    void       *ctx;
};

class Scheduler {
public:
    static const uint8_t MAX_TASKS = 8;

    Scheduler();

    Scheduler(const Scheduler &) = delete;
    Scheduler &operator=(const Scheduler &) = delete;

    /* Task table indexed by TaskId; must outlive the scheduler */
    void configure(const TaskDef *tasks, uint8_t count);

    /* Interrupt binding. Coalesces while pending, re-queues once while running */
    void post(TaskId id);

    /* Software task request. False while the task is active; counted, never queued */
    bool spawn(TaskId id);

    /* Suspend the running software task; its body must return next */
    void delay(uint32_t ms);

    /* Release suspended tasks whose deadline has passed (timebase interrupt) */
    void timer_service(uint32_t now_ms);

    void dispatch();

    /* Any task ready to run, at any priority */
    bool work_pending() const;

    bool     active(TaskId id) const;
    uint16_t rejected_spawns(TaskId id) const;
    Priority running_priority() const;
    TaskId   current() const;

    /*
     * Priority ceiling held for the guard's lifetime.
     * Faults when the current task's own priority is above the ceiling.
     */
    class Ceiling {
    public:
        Ceiling(Scheduler &sched, Priority ceiling);
        ~Ceiling();

        Ceiling(const Ceiling &) = delete;
        Ceiling &operator=(const Ceiling &) = delete;

    private:
        Scheduler &sched_;
        Priority   saved_;
    };

private:
    enum TaskState : uint8_t {
        TASK_IDLE = 0,
        TASK_READY,
        TASK_RUNNING,
        TASK_SUSPENDED
    };

    struct Slot {
        const TaskDef *def;
        TaskState      state;
        bool           repost;
        uint16_t       seq;
        uint32_t       wake_at;
        uint16_t       rejected;
    };

    Slot     slots_[MAX_TASKS];
    uint8_t  count_;
    Priority running_;
    TaskId   current_;
    uint16_t seq_;

    Slot &slot(TaskId id, const char *op);
    void  make_ready(Slot &s);
    int   pick(Priority above) const;
    void  finish(Slot &s);
    Priority own_priority() const;
};

} // namespace watch
