#ifndef INTENTNN_LR_SCHEDULER_H
#define INTENTNN_LR_SCHEDULER_H

#include "optimizer.h"

/**
 * @brief Base class for learning-rate schedules driven by global step count
 */
class LRScheduler {
protected:
    Optimizer& optimizer;
    size_t step_count;
    double last_lr;

    void applyLr(double lr) {
        last_lr = lr;
        optimizer.setLearningRate(lr);
    }

public:
    explicit LRScheduler(Optimizer& optimizer)
        : optimizer(optimizer), step_count(0), last_lr(optimizer.getLearningRate()) {}
    virtual ~LRScheduler() = default;

    /**
     * @brief Learning rate at a given global step
     */
    virtual double rateAt(size_t step) const = 0;

    /**
     * @brief Advance one step and push the new rate into the optimizer
     */
    void step() {
        ++step_count;
        applyLr(rateAt(step_count));
    }

    double getLastLr() const { return last_lr; }
    size_t getStepCount() const { return step_count; }
};

/**
 * @brief Linear warmup from 0 to peak, then linear decay to 0
 *
 *   rate(s) = peak * s / W                     s < W
 *   rate(s) = peak * max(0, T - s) / (T - W)   s >= W
 *
 * total_steps T is fixed at construction; stopping early simply leaves the
 * tail of the curve unvisited. The optimizer starts at rate(0) = 0.
 */
class LinearWarmupScheduler : public LRScheduler {
private:
    double peak_lr;
    size_t warmup_steps;
    size_t total_steps;

public:
    LinearWarmupScheduler(Optimizer& optimizer, double peak_lr,
                          size_t warmup_steps, size_t total_steps);

    double rateAt(size_t step) const override;
};

#endif // INTENTNN_LR_SCHEDULER_H
