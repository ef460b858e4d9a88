#pragma once

#include <initializer_list>
#include <vector>

#include <QObject>

class QSocketNotifier;

namespace ak500d {

// Delivers POSIX signals on the Qt event loop. Only one instance may exist;
// the handler writes the signal number into a socketpair. Destruction puts
// the default disposition back for every watched signal.
class SignalWatcher : public QObject
{
    Q_OBJECT
public:
    explicit SignalWatcher(QObject *parent = nullptr);
    ~SignalWatcher() override;

    // Returns false when the socketpair or a handler could not be set up.
    bool watch(std::initializer_list<int> signals_to_watch);

signals:
    void received(int signal);

private slots:
    void drain();

private:
    QSocketNotifier *notifier_ = nullptr;
    std::vector<int> watched_;

    static void handler(int signal);
    static int fds_[2];
};

} // namespace ak500d
