#include "log.hpp"
#include "application.hpp"

su::application::application(su::config cfg) :
    m_config(std::move(cfg)),
    m_sched(su::scheduler::make()),
    m_auto_refresh(su::duration::zero())
{
    m_config.apply();
}

su::application::~application() {
    // the timer callback refers to this object
    m_auto_refresh_timer.cancel();
}

int su::application::run() {
    su::main_loop& loop = m_sched.loop();

    m_sched.register_ui_thread();
    std::size_t watch = loop.watch_file(m_sched.queue().fd(), [this]{ dispatch_events(); });
    std::size_t idle = loop.enter_idle([this]{ redraw(); });

    su::detail::on_scope_exit cleanup([&]{
        loop.remove_enter_idle(idle);
        loop.remove_watch_file(watch);
        m_sched.unregister_ui_thread();
        cleanup_main_loop();
    });

    configure_main_loop();
    int code = loop.run();
    su::log::info(__func__, "application exited with code ", code);
    return code;
}

void su::application::quit(int code) {
    if(m_sched.is_ui_thread()) {
        m_sched.loop().quit(code);
    } else {
        // the alarm is owned by the scheduler, do not keep it alive from inside
        std::weak_ptr<su::detail::scheduler::context> weak_sched = m_sched.ctx();
        m_sched.call_on_ui_thread([weak_sched, code]{
            auto sched = weak_sched.lock();
            if(sched) {
                sched->m_loop.quit(code);
            }
        });
    }
}

void su::application::auto_refresh(bool enabled) {
    auto_refresh(enabled ? m_config.auto_refresh_interval : su::duration::zero());
}

void su::application::auto_refresh(su::duration interval) {
    if(interval < su::duration::zero()) {
        interval = su::duration::zero();
    }

    if(interval == m_auto_refresh) {
        return;
    }

    if(m_auto_refresh_timer) {
        m_auto_refresh_timer.cancel();
        m_auto_refresh_timer.reset();
    }

    m_auto_refresh = interval;

    if(interval > su::duration::zero()) {
        m_auto_refresh_timer = m_sched.schedule(interval, interval, [this]{ refresh(); });
    }
}

void su::application::dispatch_events() {
    for(auto& e : m_sched.queue().get_all()) {
        // markers only exist to wake the loop so the next iteration redraws
        if(e.is_user()) {
            process_event(e);
        }
    }
}
