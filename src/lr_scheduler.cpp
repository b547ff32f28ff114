#include "intentnn/lr_scheduler.h"
#include <algorithm>

LinearWarmupScheduler::LinearWarmupScheduler(Optimizer& optimizer, double peak_lr,
                                             size_t warmup_steps, size_t total_steps)
    : LRScheduler(optimizer), peak_lr(peak_lr),
      warmup_steps(warmup_steps), total_steps(total_steps)
{
    applyLr(rateAt(0));
}

double LinearWarmupScheduler::rateAt(size_t step) const {
    if (step < warmup_steps) {
        return peak_lr * static_cast<double>(step)
               / static_cast<double>(std::max<size_t>(1, warmup_steps));
    }
    double remaining = step < total_steps ? static_cast<double>(total_steps - step) : 0.0;
    double decay_span = total_steps > warmup_steps
                        ? static_cast<double>(total_steps - warmup_steps) : 1.0;
    return peak_lr * std::max(0.0, remaining / decay_span);
}
