#include "rl/concurrency.hpp"

#include <memory>
#include <utility>

#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>

namespace rl {

namespace {

class PacedBatch : public std::enable_shared_from_this<PacedBatch>
{
public:
    PacedBatch(boost::asio::io_context& ioc,
               int total,
               int concurrency,
               std::chrono::steady_clock::duration interval,
               PacedTask task,
               std::function<void(int)> on_finished,
               const Cancellation* cancel)
        : ioc_(ioc),
          timer_(ioc),
          total_(total),
          concurrency_(concurrency <= 1 ? 1 : concurrency),
          interval_(interval),
          task_(std::move(task)),
          on_finished_(std::move(on_finished)),
          cancel_(cancel)
    {}

    void start() { step(); }

private:
    bool cancelled() const { return cancel_ && cancel_->is_cancelled(); }

    void step()
    {
        if (next_ > total_ || cancelled())
        {
            draining_ = true;
            finish_if_idle();
            return;
        }

        if (batch_ >= concurrency_)
        {
            if (in_flight_ > 0)
            {
                // resumed from task_done() once the batch has drained
                waiting_ = true;
                return;
            }
            batch_ = 0;
        }

        const int index = next_++;
        ++batch_;
        ++in_flight_;
        ++launched_;

        auto self = shared_from_this();
        auto called = std::make_shared<bool>(false);
        task_(index, [self, called]
        {
            if (*called) return;
            *called = true;
            self->task_done();
        });

        timer_.expires_after(interval_);
        timer_.async_wait([self](const boost::system::error_code&)
        {
            // the timer is never cancelled; an error still means "go on"
            self->step();
        });
    }

    void task_done()
    {
        --in_flight_;
        if (in_flight_ > 0) return;

        if (waiting_)
        {
            waiting_ = false;
            batch_ = 0;
            boost::asio::post(ioc_, [self = shared_from_this()] { self->step(); });
        }
        else if (draining_)
        {
            finish_if_idle();
        }
    }

    void finish_if_idle()
    {
        if (in_flight_ > 0 || finished_) return;
        finished_ = true;
        if (on_finished_) on_finished_(launched_);
    }

    boost::asio::io_context& ioc_;
    boost::asio::steady_timer timer_;
    const int total_;
    const int concurrency_;
    const std::chrono::steady_clock::duration interval_;
    PacedTask task_;
    std::function<void(int)> on_finished_;
    const Cancellation* cancel_;

    int next_ = 1;
    int batch_ = 0;     // launched in the current batch
    int in_flight_ = 0; // launched and not yet done
    int launched_ = 0;
    bool waiting_ = false;
    bool draining_ = false;
    bool finished_ = false;
};

} // namespace

void for_each_index_paced(boost::asio::io_context& ioc,
                          int total,
                          int concurrency,
                          std::chrono::steady_clock::duration interval,
                          PacedTask task,
                          std::function<void(int)> on_finished,
                          const Cancellation* cancel)
{
    if (total <= 0)
    {
        boost::asio::post(ioc, [cb = std::move(on_finished)] { if (cb) cb(0); });
        return;
    }

    std::make_shared<PacedBatch>(
        ioc, total, concurrency, interval, std::move(task), std::move(on_finished), cancel)
        ->start();
}

} // namespace rl
