#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <unistd.h>

#include "log.hpp"
#include "notifier.hpp"

namespace {

bool set_nonblocking(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    return flags >= 0 && fcntl(fd, F_SETFL, flags | O_NONBLOCK) == 0;
}

}

su::notifier::notifier() : m_read_fd(-1), m_write_fd(-1) {
    int fds[2];

    if(::pipe(fds) != 0) {
        su::log::error(__func__, "cannot create pipe: ", std::strerror(errno));
        return;
    }

    if(!set_nonblocking(fds[0]) || !set_nonblocking(fds[1])) {
        su::log::error(__func__, "cannot make pipe non-blocking: ", std::strerror(errno));
        ::close(fds[0]);
        ::close(fds[1]);
        return;
    }

    m_read_fd = fds[0];
    m_write_fd = fds[1];
}

su::notifier::~notifier() {
    close();
}

int su::notifier::fd() const {
    std::lock_guard<std::mutex> lk(m_mtx);
    return m_read_fd;
}

bool su::notifier::closed() const {
    std::lock_guard<std::mutex> lk(m_mtx);
    return m_write_fd < 0;
}

su::state su::notifier::notify() {
    // hold the lock so close() cannot release the descriptor mid-write
    std::lock_guard<std::mutex> lk(m_mtx);

    if(m_write_fd < 0) {
        return su::state::closed;
    }

    const char c = 'x';
    ssize_t n;

    do {
        n = ::write(m_write_fd, &c, 1);
    } while(n < 0 && errno == EINTR);

    if(n == 1 || (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK))) {
        // a full pipe is already readable
        return su::state::success;
    }

    su::log::error(__func__, "write failed: ", std::strerror(errno));
    return su::state::failure;
}

void su::notifier::drain() {
    std::lock_guard<std::mutex> lk(m_mtx);

    if(m_read_fd < 0) {
        return;
    }

    char buf[64];

    while(true) {
        ssize_t n = ::read(m_read_fd, buf, sizeof(buf));

        if(n > 0) {
            continue;
        } else if(n < 0 && errno == EINTR) {
            continue;
        } else if(n < 0 && errno != EAGAIN && errno != EWOULDBLOCK) {
            su::log::error(__func__, "read failed: ", std::strerror(errno));
        }

        // drained (or the write end is gone)
        return;
    }
}

void su::notifier::close() {
    std::lock_guard<std::mutex> lk(m_mtx);

    if(m_read_fd >= 0) {
        ::close(m_read_fd);
        m_read_fd = -1;
    }

    if(m_write_fd >= 0) {
        ::close(m_write_fd);
        m_write_fd = -1;
    }
}
