#include "ak500d/services/signal_watcher.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>

#include <fcntl.h>
#include <sys/socket.h>
#include <unistd.h>

#include <QSocketNotifier>

#include "ak500d/logging.hpp"

namespace ak500d {

int SignalWatcher::fds_[2] = {-1, -1};

SignalWatcher::SignalWatcher(QObject *p) : QObject(p) {}

SignalWatcher::~SignalWatcher()
{
    for (int sig : watched_)
        ::signal(sig, SIG_DFL);

    // The notifier must not outlive its descriptor
    delete notifier_;
    notifier_ = nullptr;

    for (int &fd : fds_) {
        if (fd >= 0) {
            ::close(fd);
            fd = -1;
        }
    }
}

bool SignalWatcher::watch(std::initializer_list<int> signals_to_watch)
{
    if (fds_[0] < 0) {
        if (::socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, fds_) != 0) {
            qCCritical(lcDriver) << "socketpair:" << std::strerror(errno);
            return false;
        }
        ::fcntl(fds_[1], F_SETFL, O_NONBLOCK);

        notifier_ = new QSocketNotifier(fds_[0], QSocketNotifier::Read, this);
        // activated() is overloaded in Qt 5.15; connect by signature
        if (!connect(notifier_, SIGNAL(activated(int)), this, SLOT(drain()))) {
            qCCritical(lcDriver) << "cannot connect the signal socket notifier";
            return false;
        }
    }

    struct sigaction action;
    std::memset(&action, 0, sizeof(action));
    action.sa_handler = &SignalWatcher::handler;
    sigemptyset(&action.sa_mask);
    action.sa_flags = SA_RESTART;

    for (int sig : signals_to_watch) {
        if (::sigaction(sig, &action, nullptr) != 0) {
            qCCritical(lcDriver) << "sigaction" << sig << ":" << std::strerror(errno);
            return false;
        }
        watched_.push_back(sig);
    }
    return true;
}

void SignalWatcher::handler(int signal)
{
    const int saved = errno;
    const unsigned char byte = static_cast<unsigned char>(signal);
    // A full socket already holds a pending wake-up
    const ssize_t written = ::write(fds_[1], &byte, 1);
    (void)written;
    errno = saved;
}

void SignalWatcher::drain()
{
    unsigned char byte = 0;
    notifier_->setEnabled(false);
    const ssize_t n = ::read(fds_[0], &byte, 1);
    const int err = errno;
    notifier_->setEnabled(true);

    if (n != 1) {
        qCDebug(lcDriver) << "signal socket read:" << std::strerror(err);
        return;
    }
    qCInfo(lcDriver) << "received" << strsignal(byte);
    emit received(byte);
}

} // namespace ak500d
