/*
 * scheduler.cpp
 *
 * Project: Wristwatch Firmware
 * Purpose: Fixed-priority preemptive run-to-completion scheduler
 *
 * Notes:
 *  - All slot state is touched with interrupts masked
 *  - Sequence numbers order arrivals within a priority level and are
 *    compared with wrap-safe signed differences
 *
 * Updated: 2026-10-14
 */

#include "scheduler.h"

#include "irq_hw.h"
#include "log.h"
#include "system_hw.h"
#include "uptime.h"

namespace watch {

Scheduler::Scheduler()
    : count_(0), running_(IDLE_PRIORITY), current_(NO_TASK), seq_(0)
{
    for (uint8_t i = 0; i < MAX_TASKS; i++) {
        slots_[i].def      = 0;
        slots_[i].state    = TASK_IDLE;
        slots_[i].repost   = false;
        slots_[i].seq      = 0;
        slots_[i].wake_at  = 0;
        slots_[i].rejected = 0;
    }
}

void Scheduler::configure(const TaskDef *tasks, uint8_t count)
{
    if (count > MAX_TASKS)
        system_fault("too many tasks");

    for (uint8_t i = 0; i < count; i++) {
        if (tasks[i].priority == IDLE_PRIORITY || !tasks[i].run)
            system_fault("bad task definition");
    }

    irq_state_t saved = irq_hw_save();
    for (uint8_t i = 0; i < count; i++) {
        slots_[i].def      = &tasks[i];
        slots_[i].state    = TASK_IDLE;
        slots_[i].repost   = false;
        slots_[i].rejected = 0;
    }
    count_ = count;
    irq_hw_restore(saved);
}

Scheduler::Slot &Scheduler::slot(TaskId id, const char *op)
{
    if (id >= count_) {
        log_error("sched", "%s: unknown task %u", op, (unsigned)id);
        system_fault("unknown task");
    }
    return slots_[id];
}

void Scheduler::make_ready(Slot &s)
{
    s.state = TASK_READY;
    s.seq   = seq_++;
}

/* Highest-priority ready task strictly above `above`, oldest first */
int Scheduler::pick(Priority above) const
{
    int best = -1;

    for (uint8_t i = 0; i < count_; i++) {
        const Slot &s = slots_[i];
        if (s.state != TASK_READY || s.def->priority <= above)
            continue;

        if (best < 0) {
            best = i;
            continue;
        }

        const Slot &b = slots_[best];
        if (s.def->priority > b.def->priority ||
            (s.def->priority == b.def->priority &&
             (int16_t)(s.seq - b.seq) < 0))
            best = i;
    }

    return best;
}

void Scheduler::finish(Slot &s)
{
    if (s.state == TASK_SUSPENDED)
        return;

    if (s.repost) {
        s.repost = false;
        make_ready(s);
        return;
    }

    s.state = TASK_IDLE;
}

void Scheduler::post(TaskId id)
{
    irq_state_t saved = irq_hw_save();
    Slot &s = slot(id, "post");

    if (s.def->kind != TaskKind::Interrupt)
        system_fault("post to a software task");

    switch (s.state) {
    case TASK_IDLE:
        make_ready(s);
        break;
    case TASK_RUNNING:
        s.repost = true;
        break;
    default:
        /* already pending */
        break;
    }

    irq_hw_restore(saved);
}

bool Scheduler::spawn(TaskId id)
{
    irq_state_t saved = irq_hw_save();
    Slot &s = slot(id, "spawn");

    if (s.def->kind != TaskKind::Software)
        system_fault("spawn of an interrupt task");

    bool accepted = (s.state == TASK_IDLE);
    if (accepted)
        make_ready(s);
    else
        s.rejected++;

    irq_hw_restore(saved);

    if (accepted && irq_hw_enabled())
        dispatch();

    return accepted;
}

void Scheduler::delay(uint32_t ms)
{
    irq_state_t saved = irq_hw_save();

    if (current_ == NO_TASK)
        system_fault("delay outside a task");

    Slot &s = slots_[current_];
    if (s.def->kind != TaskKind::Software)
        system_fault("delay from an interrupt task");

    s.state   = TASK_SUSPENDED;
    s.wake_at = uptime_millis() + ms;

    irq_hw_restore(saved);
}

void Scheduler::timer_service(uint32_t now_ms)
{
    irq_state_t saved = irq_hw_save();

    for (uint8_t i = 0; i < count_; i++) {
        Slot &s = slots_[i];
        if (s.state == TASK_SUSPENDED && (int32_t)(now_ms - s.wake_at) >= 0)
            make_ready(s);
    }

    irq_hw_restore(saved);
}

void Scheduler::dispatch()
{
    irq_state_t saved = irq_hw_save();

    const Priority base      = running_;
    const TaskId   base_task = current_;

    for (;;) {
        int next = pick(base);
        if (next < 0)
            break;

        Slot &s = slots_[next];
        s.state  = TASK_RUNNING;
        running_ = s.def->priority;
        current_ = (TaskId)next;

        irq_hw_enable();
        s.def->run(s.def->ctx);
        irq_hw_disable();

        finish(s);
        running_ = base;
        current_ = base_task;
    }

    irq_hw_restore(saved);
}

bool Scheduler::work_pending() const
{
    irq_state_t saved = irq_hw_save();

    bool pending = false;
    for (uint8_t i = 0; i < count_ && !pending; i++)
        pending = (slots_[i].state == TASK_READY);

    irq_hw_restore(saved);
    return pending;
}

bool Scheduler::active(TaskId id) const
{
    if (id >= count_)
        return false;

    irq_state_t saved = irq_hw_save();
    bool a = slots_[id].state != TASK_IDLE || slots_[id].repost;
    irq_hw_restore(saved);
    return a;
}

uint16_t Scheduler::rejected_spawns(TaskId id) const
{
    if (id >= count_)
        return 0;
    return slots_[id].rejected;
}

Priority Scheduler::running_priority() const
{
    return running_;
}

TaskId Scheduler::current() const
{
    return current_;
}

Priority Scheduler::own_priority() const
{
    if (current_ == NO_TASK)
        return IDLE_PRIORITY;
    return slots_[current_].def->priority;
}

/* ---------------- Ceiling ---------------- */

Scheduler::Ceiling::Ceiling(Scheduler &sched, Priority ceiling)
    : sched_(sched), saved_(IDLE_PRIORITY)
{
    irq_state_t saved = irq_hw_save();

    if (sched_.own_priority() > ceiling)
        system_fault("resource locked above its ceiling");

    saved_ = sched_.running_;
    if (ceiling > sched_.running_)
        sched_.running_ = ceiling;

    irq_hw_restore(saved);
}

Scheduler::Ceiling::~Ceiling()
{
    irq_state_t saved = irq_hw_save();
    sched_.running_ = saved_;
    irq_hw_restore(saved);

    /* Work deferred by the ceiling runs now */
    if (irq_hw_enabled())
        sched_.dispatch();
}

} // namespace watch
