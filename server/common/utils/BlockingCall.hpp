#pragma once

/**
 * @brief 在后台线程池执行阻塞调用，完成后回到发起协程所在的 EventLoop 恢复
 *
 * 用于 HTTP 处理协程中调用采集器 / 同步数据库接口，避免阻塞 IO 线程。
 * 调用中抛出的异常在 co_await 处重新抛出。
 *
 * @code
 * auto data = co_await BlockingCall<Json::Value>([] { return Collector::instance().getAllStatus(); });
 * @endcode
 */
template<typename T>
class BlockingCall {
public:
    explicit BlockingCall(std::function<T()> fn) : fn_(std::move(fn)) {}

    bool await_ready() const noexcept { return false; }

    void await_suspend(std::coroutine_handle<> handle) {
        auto* loop = trantor::EventLoop::getEventLoopOfCurrentThread();
        queue().runTaskInQueue([this, handle, loop]() {
            try {
                result_ = fn_();
            } catch (...) {
                error_ = std::current_exception();
            }
            if (loop) {
                loop->queueInLoop([handle]() { handle.resume(); });
            } else {
                handle.resume();
            }
        });
    }

    T await_resume() {
        if (error_) std::rethrow_exception(error_);
        return std::move(*result_);
    }

private:
    std::function<T()> fn_;
    std::optional<T> result_;
    std::exception_ptr error_;

    static trantor::ConcurrentTaskQueue& queue() {
        static trantor::ConcurrentTaskQueue pool(4, "blocking-call");
        return pool;
    }
};
