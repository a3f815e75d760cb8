#pragma once

#include <atomic>
#include <memory>

namespace copytrader::domain {

/**
 * @brief Кооперативный флаг отмены, разделяемый задачей и брокерским вызовом
 *
 * Копии токена ссылаются на один и тот же флаг.
 */
class CancellationToken {
public:
    CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() { flag_->store(true); }

    bool isCancelled() const { return flag_->load(); }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

} // namespace copytrader::domain
