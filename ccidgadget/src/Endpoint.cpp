#include "Endpoint.h"
#include "Log.h"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/eventfd.h>
#include <sys/ioctl.h>
#include <sys/stat.h>
#include <unistd.h>
#include <linux/usb/functionfs.h>

namespace ccidgadget {

FdEndpoint::FdEndpoint(int fd, std::string name)
    : fd_(fd), name_(std::move(name))
{
    if (fd_ < 0) throw TransportError(name_ + ": некорректный дескриптор");
    wakeFd_ = ::eventfd(0, EFD_CLOEXEC | EFD_NONBLOCK);
    if (wakeFd_ < 0) {
        const int err = errno;
        ::close(fd_);
        fd_ = -1;
        fail("eventfd", err);
    }
    // FunctionFS отдаёт ZLP как пустое чтение; у pipe/socket/файла это конец потока.
    struct stat st{};
    if (::fstat(fd_, &st) == 0)
        zeroReadIsEof_ = S_ISFIFO(st.st_mode) || S_ISSOCK(st.st_mode) || S_ISREG(st.st_mode);
}

FdEndpoint::FdEndpoint(FdEndpoint&& other) noexcept
    : fd_(other.fd_), wakeFd_(other.wakeFd_), zeroReadIsEof_(other.zeroReadIsEof_), name_(std::move(other.name_))
{
    other.fd_ = -1;
    other.wakeFd_ = -1;
}

FdEndpoint::~FdEndpoint(){
    if (wakeFd_ >= 0) ::close(wakeFd_);
    if (fd_ >= 0) ::close(fd_);
}

FdEndpoint FdEndpoint::open(const std::string& path, Direction dir){
    // IN устройство пишет, OUT читает.
    const int flags = (dir == Direction::In ? O_WRONLY : O_RDONLY) | O_CLOEXEC;
    int fd = ::open(path.c_str(), flags);
    if (fd < 0) {
        throw TransportError(path + ": " + std::strerror(errno));
    }
    qCDebug(lcTransport) << "открыт" << path.c_str() << "fd" << fd;
    return FdEndpoint(fd, path);
}

void FdEndpoint::fail(const char* what, int err) const {
    throw TransportError(name_ + ": " + what + ": " + std::strerror(err));
}

// Ждёт готовности fd_ или cancel(). На FunctionFS poll() всегда сообщает
// готовность, и блокирует сам read()/write(); его прерывает сигнал (EINTR),
// после чего отмена проверяется здесь снова.
void FdEndpoint::waitReady(short events, const char* what){
    for (;;) {
        pollfd fds[2] = { { fd_, events, 0 }, { wakeFd_, POLLIN, 0 } };
        int r = ::poll(fds, 2, -1);
        if (r < 0) {
            if (errno == EINTR) continue;
            fail("poll", errno);
        }
        if (fds[1].revents & POLLIN) {
            uint64_t v = 0;
            if (::read(wakeFd_, &v, sizeof v) < 0 && errno != EAGAIN) fail("чтение eventfd", errno);
            throw TransportCancelled(name_ + ": " + what + " прервано");
        }
        if (fds[0].revents & (events | POLLHUP | POLLERR)) return;
    }
}

size_t FdEndpoint::read(uint8_t* buf, size_t max){
    ssize_t n;
    for (;;) {
        waitReady(POLLIN, "чтение");
        n = ::read(fd_, buf, max);
        if (n >= 0) break;
        if (errno != EINTR) fail("чтение", errno);
    }
    if (n == 0 && zeroReadIsEof_) throw TransportError(name_ + ": конечная точка закрыта");
    return size_t(n);
}

void FdEndpoint::write(const uint8_t* buf, size_t len){
    if (len == 0) {
        for (;;) {
            waitReady(POLLOUT, "запись");
            if (::write(fd_, buf, 0) >= 0) return;
            if (errno != EINTR) fail("запись ZLP", errno);
        }
    }
    size_t done = 0;
    while (done < len) {
        waitReady(POLLOUT, "запись");
        ssize_t n = ::write(fd_, buf + done, len - done);
        if (n < 0) {
            if (errno == EINTR) continue;
            fail("запись", errno);
        }
        done += size_t(n);
    }
}

void FdEndpoint::flush(){
    if (::ioctl(fd_, FUNCTIONFS_FIFO_FLUSH) < 0) {
        // не FunctionFS (pipe, socket): сбрасывать нечего
        if (errno == ENOTTY || errno == EINVAL) return;
        fail("сброс FIFO", errno);
    }
}

void FdEndpoint::cancel(){
    const uint64_t one = 1;
    // вызывается из обработчика сигнала
    ssize_t n = ::write(wakeFd_, &one, sizeof one);
    (void)n;
}

} // namespace ccidgadget
