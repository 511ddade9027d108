#ifndef POWMINER_CHRONO_TIMER_HPP
#define POWMINER_CHRONO_TIMER_HPP

#include "asio/steady_timer.hpp"
#include "asio/io_context.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>


namespace powminer {
namespace chrono {

	using Milliseconds = std::chrono::milliseconds;
	using Seconds = std::chrono::seconds;

// Not thread safe. start/cancel have to be called from the thread running the io_context (use asio::post).
class Timer
{
public:

	using Uptr = std::unique_ptr<Timer>;

	// Called when the timer expires. Return true to rearm the timer with the same interval.
	using Handler = std::function<bool()>;

    // According to asio documentation -> if a running timer gets deleted, asio implicitly calls cancel() on that timer
    explicit Timer(std::shared_ptr<asio::io_context> io_context)
        : m_io_context{std::move(io_context)}, m_timer{*m_io_context}
    {
    }

    template<typename Duration>
    void start(Duration interval, Handler handler)
    {
        cancel();
        m_interval = std::chrono::duration_cast<Milliseconds>(interval);
        m_handler = std::move(handler);
        arm();
    }

    // A completion already queued when cancel() runs still sees success, the generation check drops it.
    void cancel()
    {
        ++m_generation;
        m_timer.cancel();
    }

private:

    void arm()
    {
        m_timer.expires_after(m_interval);
        m_timer.async_wait([this, handler = m_handler, generation = m_generation](const asio::error_code& error) {
            if (error || generation != m_generation) {
                // timer was canceled or restarted
                return;
            }
            if (handler() && generation == m_generation) {
                arm();
            }
        });
    }

    std::shared_ptr<asio::io_context> m_io_context;
    asio::steady_timer m_timer;
    Milliseconds m_interval{0};
    Handler m_handler;
    std::uint64_t m_generation{0};
};

}
}

#endif
